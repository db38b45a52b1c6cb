#ifndef INSTANCE_H
#define INSTANCE_H

#include <string>
#include <vector>
#include "Location.h"
#include "Vehicle.h"
#include "DistanceMatrix.h"

// Id de la bodega en todas las estructuras internas
const int DEPOT_ID = 0;

// Datos de una instancia CVRP de una sola bodega. Solo lectura durante
// una resolucion; la validacion la hace ModelBuilder.
class Instance {
private:
    std::string name;
    std::vector<Location> locations;  // locations[0] = bodega
    std::vector<int> demands;         // indexado por id, demands[0] = 0
    std::vector<Vehicle> fleet;
    DistanceMatrix distances;
    bool requireAllVehicles;          // true: cada vehiculo sale exactamente una vez

public:
    Instance();

    // Distancias euclidianas derivadas de las coordenadas
    Instance(const std::string& name,
             const std::vector<Location>& locations,
             const std::vector<int>& demands,
             const std::vector<Vehicle>& fleet);

    // Matriz explicita (puede ser asimetrica)
    Instance(const std::string& name,
             const std::vector<Location>& locations,
             const std::vector<int>& demands,
             const std::vector<Vehicle>& fleet,
             const DistanceMatrix& distances);

    // Getters de datos globales
    const std::string& getName() const;
    int getDimension() const;      // bodega + clientes
    int getNumCustomers() const;
    int getNumVehicles() const;
    int getMaxCapacity() const;
    long getTotalDemand() const;
    long getTotalCapacity() const;

    // Getters de estructuras
    const std::vector<Location>& getLocations() const;
    const std::vector<int>& getDemands() const;
    const std::vector<Vehicle>& getFleet() const;
    const DistanceMatrix& getDistanceMatrix() const;

    int getDemand(int locationId) const;
    double getDistance(int fromId, int toId) const;

    bool requiresAllVehicles() const;
    void setRequireAllVehicles(bool required);
};

#endif // INSTANCE_H
