#ifndef SOLUTION_H
#define SOLUTION_H

#include <string>
#include <vector>
#include "Route.h"
#include "Instance.h"
#include "SolveStatus.h"

class Solution {
private:
    const Instance* instance;       // Referencia al problema global
    std::vector<Route> routes;      // Una ruta por vehiculo, en orden de flota
    double totalCost;               // Distancia total recalculada
    SearchSummary summary;          // Como se obtuvo (estado, gap, nodos...)

    void calculateTotalCost();

public:
    Solution();
    explicit Solution(const Instance* instance);

    void addRoute(const Route& route);
    void setSummary(const SearchSummary& summary);

    // Una ruta valida por vehiculo, cada cliente visitado exactamente una vez
    // y, si la instancia lo exige, todos los vehiculos en uso
    bool isValid() const;

    double getTotalCost() const;
    const std::vector<Route>& getRoutes() const;
    SolveStatus getStatus() const;
    const SearchSummary& getSummary() const;
    int getNumUsedVehicles() const;

    void print() const;

    // Formato .sol de CVRPLIB: "Route #k: ..." y "Cost ..."
    void writeSolutionFile(const std::string& filename) const;
};

#endif // SOLUTION_H
