#ifndef ROUTE_H
#define ROUTE_H

#include <vector>
#include "Instance.h"

class Route {
private:
    int vehicleId;
    int maxCapacity;
    std::vector<int> path; // Secuencia de ids (ej: 0 -> 4 -> 2 -> 0)
    int currentLoad;
    double totalCost;

    // Referencia a la instancia para no duplicar demandas ni distancias
    const Instance* instance;

    // Actualiza el costo internamente al modificar la ruta
    void updateMetrics();

public:
    Route(const Vehicle& vehicle, const Instance* instance);

    // Agrega el cliente justo antes del regreso a la bodega.
    // Retorna falso si excede la capacidad (la ruta no cambia).
    bool addClient(int locationId);

    // Agrega sin chequear capacidad; lo usa el extractor, que valida despues
    void appendStop(int locationId);

    void removeClient(int locationId);

    // Empieza y termina en la bodega, sin bodegas intermedias,
    // y la carga no excede la capacidad
    bool isValid() const;
    bool isUsed() const;

    int getVehicleId() const;
    int getMaxCapacity() const;
    int getCurrentLoad() const;
    double getTotalCost() const;
    const std::vector<int>& getPath() const;
    std::vector<int> getCustomers() const; // path sin la bodega
};

#endif // ROUTE_H
