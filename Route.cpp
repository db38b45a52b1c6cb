#include "Route.h"

Route::Route(const Vehicle& vehicle, const Instance* instance)
    : vehicleId(vehicle.getId()), maxCapacity(vehicle.getCapacity()),
      currentLoad(0), totalCost(0.0), instance(instance) {

    // Toda ruta inicia y termina en la bodega; vacia = vehiculo sin usar
    path.push_back(DEPOT_ID);
    path.push_back(DEPOT_ID);
}

void Route::updateMetrics() {
    totalCost = instance->getDistanceMatrix().pathLength(path);
}

bool Route::addClient(int locationId) {
    int demand = instance->getDemand(locationId);
    if (currentLoad + demand > maxCapacity) {
        return false;
    }
    appendStop(locationId);
    return true;
}

void Route::appendStop(int locationId) {
    path.insert(path.end() - 1, locationId);
    currentLoad += instance->getDemand(locationId);
    updateMetrics();
}

void Route::removeClient(int locationId) {
    for (auto it = path.begin() + 1; it != path.end() - 1; ++it) {
        if (*it == locationId) {
            currentLoad -= instance->getDemand(locationId);
            path.erase(it);
            updateMetrics();
            return;
        }
    }
}

bool Route::isValid() const {
    if (path.size() < 2 || path.front() != DEPOT_ID || path.back() != DEPOT_ID) return false;
    for (size_t i = 1; i + 1 < path.size(); ++i) {
        if (path[i] == DEPOT_ID) return false;
    }
    return currentLoad <= maxCapacity;
}

bool Route::isUsed() const { return path.size() > 2; }

int Route::getVehicleId() const { return vehicleId; }
int Route::getMaxCapacity() const { return maxCapacity; }
int Route::getCurrentLoad() const { return currentLoad; }
double Route::getTotalCost() const { return totalCost; }
const std::vector<int>& Route::getPath() const { return path; }

std::vector<int> Route::getCustomers() const {
    return std::vector<int>(path.begin() + 1, path.end() - 1);
}
