#include "Solution.h"
#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace std;

Solution::Solution() : instance(nullptr), totalCost(0.0) {}

Solution::Solution(const Instance* instance) : instance(instance), totalCost(0.0) {}

void Solution::calculateTotalCost() {
    totalCost = 0.0;
    for (const auto& route : routes) {
        totalCost += route.getTotalCost();
    }
}

void Solution::addRoute(const Route& route) {
    routes.push_back(route);
    calculateTotalCost();
}

void Solution::setSummary(const SearchSummary& summary) {
    this->summary = summary;
}

bool Solution::isValid() const {
    if (!instance) return false;
    if (static_cast<int>(routes.size()) != instance->getNumVehicles()) return false;

    vector<int> visitCount(instance->getDimension(), 0);

    for (size_t k = 0; k < routes.size(); ++k) {
        const Route& route = routes[k];
        if (!route.isValid()) return false;
        if (route.getVehicleId() != instance->getFleet()[k].getId()) return false;
        if (instance->requiresAllVehicles() && !route.isUsed()) return false;

        for (int locationId : route.getCustomers()) {
            if (locationId <= DEPOT_ID || locationId >= instance->getDimension()) return false;
            visitCount[locationId]++;
        }
    }

    for (int i = 1; i < instance->getDimension(); ++i) {
        if (visitCount[i] != 1) return false;
    }
    return true;
}

double Solution::getTotalCost() const { return totalCost; }
const vector<Route>& Solution::getRoutes() const { return routes; }
SolveStatus Solution::getStatus() const { return summary.status; }
const SearchSummary& Solution::getSummary() const { return summary; }

int Solution::getNumUsedVehicles() const {
    int used = 0;
    for (const auto& route : routes) {
        if (route.isUsed()) used++;
    }
    return used;
}

void Solution::print() const {
    cout << "=== Solucion CVRP ===" << endl;
    cout << "Estado: " << toString(summary.status) << endl;
    if (!hasRoutes(summary.status)) {
        cout << "Sin rutas que mostrar." << endl;
        cout << "=====================" << endl;
        return;
    }
    cout << "Costo Total (Z): " << totalCost << endl;
    cout << "Vehiculos usados: " << getNumUsedVehicles() << " de " << routes.size() << endl;

    for (const auto& route : routes) {
        cout << "Vehiculo " << route.getVehicleId()
             << " | Carga: " << route.getCurrentLoad() << "/" << route.getMaxCapacity()
             << " | Costo: " << route.getTotalCost() << " | Ruta: [ ";
        for (int locationId : route.getPath()) {
            cout << locationId << " ";
        }
        cout << "]" << endl;
    }
    cout << "=====================" << endl;
}

void Solution::writeSolutionFile(const string& filename) const {
    ofstream out(filename);
    if (!out.is_open()) {
        throw runtime_error("No se pudo abrir el archivo de salida: " + filename);
    }

    int routeNumber = 0;
    for (const auto& route : routes) {
        if (!route.isUsed()) continue;
        out << "Route #" << ++routeNumber << ":";
        for (int locationId : route.getCustomers()) {
            out << " " << locationId;
        }
        out << "\n";
    }
    out << "Cost " << totalCost << "\n";
    out << "Status " << toString(summary.status) << "\n";
    out << "Vehicles " << getNumUsedVehicles() << "\n";

    if (!out) {
        throw runtime_error("Error al escribir el archivo de salida: " + filename);
    }
}
