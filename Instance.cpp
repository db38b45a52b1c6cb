#include "Instance.h"
#include <algorithm>

using namespace std;

Instance::Instance() : requireAllVehicles(false) {}

Instance::Instance(const string& name,
                   const vector<Location>& locations,
                   const vector<int>& demands,
                   const vector<Vehicle>& fleet)
    : name(name), locations(locations), demands(demands), fleet(fleet),
      distances(DistanceMatrix::fromLocations(locations)), requireAllVehicles(false) {}

Instance::Instance(const string& name,
                   const vector<Location>& locations,
                   const vector<int>& demands,
                   const vector<Vehicle>& fleet,
                   const DistanceMatrix& distances)
    : name(name), locations(locations), demands(demands), fleet(fleet),
      distances(distances), requireAllVehicles(false) {}

const string& Instance::getName() const { return name; }
int Instance::getDimension() const { return static_cast<int>(locations.size()); }

int Instance::getNumCustomers() const {
    return locations.empty() ? 0 : static_cast<int>(locations.size()) - 1;
}

int Instance::getNumVehicles() const { return static_cast<int>(fleet.size()); }

int Instance::getMaxCapacity() const {
    int best = 0;
    for (const auto& vehicle : fleet) {
        best = max(best, vehicle.getCapacity());
    }
    return best;
}

long Instance::getTotalDemand() const {
    long total = 0;
    for (size_t i = 1; i < demands.size(); ++i) total += demands[i];
    return total;
}

long Instance::getTotalCapacity() const {
    long total = 0;
    for (const auto& vehicle : fleet) total += vehicle.getCapacity();
    return total;
}

const vector<Location>& Instance::getLocations() const { return locations; }
const vector<int>& Instance::getDemands() const { return demands; }
const vector<Vehicle>& Instance::getFleet() const { return fleet; }
const DistanceMatrix& Instance::getDistanceMatrix() const { return distances; }

int Instance::getDemand(int locationId) const { return demands[locationId]; }
double Instance::getDistance(int fromId, int toId) const { return distances.get(fromId, toId); }

bool Instance::requiresAllVehicles() const { return requireAllVehicles; }
void Instance::setRequireAllVehicles(bool required) { requireAllVehicles = required; }
