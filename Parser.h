#ifndef PARSER_H
#define PARSER_H

#include <istream>
#include <map>
#include <string>
#include <vector>
#include "Instance.h"

// Lector de instancias TSPLIB / CVRPLIB (.vrp).
//
// Claves: NAME, COMMENT, TYPE, DIMENSION, CAPACITY, VEHICLES,
// EDGE_WEIGHT_TYPE (EUC_2D, EXACT_2D, EXPLICIT), EDGE_WEIGHT_FORMAT
// (FULL_MATRIX), NODE_COORD_SECTION, DEMAND_SECTION, DEPOT_SECTION,
// EDGE_WEIGHT_SECTION, VEHICLE_CAPACITY_SECTION y EOF.
//
// Los ids del archivo se renumeran: la bodega pasa a ser 0 y el resto
// conserva su orden (en CVRPLIB estandar, id interno = id archivo - 1).
class Parser {
private:
    std::string filename;
    std::string name;
    std::string comment;
    std::string edgeWeightType;
    std::string edgeWeightFormat;
    int dimension;      // Numero total de puntos (bodega + clientes)
    int capacity;       // Capacidad Q comun (CAPACITY)
    int numVehicles;    // 0 = no declarado
    int depotFileId;
    bool hasDemandSection;

    std::map<int, std::pair<double, double>> coords;  // por id de archivo
    std::map<int, int> demands;                        // por id de archivo
    std::vector<double> explicitWeights;               // FULL_MATRIX
    std::vector<int> vehicleCapacities;                // VEHICLE_CAPACITY_SECTION

    Instance instance;

    // Métodos privados auxiliares
    void loadData(std::istream& vrp);
    void buildInstance(int vehiclesOverride);
    int deduceVehicles() const;
    void checkNodeId(int idx, const std::string& section) const;

public:
    // vehiclesOverride > 0 reemplaza el numero de vehiculos del archivo.
    // Lanza std::runtime_error si el archivo no existe o esta mal formado.
    explicit Parser(const std::string& filename, int vehiclesOverride = 0);

    // Misma lectura desde un stream (pruebas, entrada estandar)
    Parser(std::istream& input, const std::string& sourceName, int vehiclesOverride = 0);

    const Instance& getInstance() const;
    int getDimension() const;
    int getCapacity() const;
    const std::string& getName() const;
};

#endif // PARSER_H
