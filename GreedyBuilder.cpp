#include "GreedyBuilder.h"
#include <vector>
#include <algorithm>
#include <list>
#include <numeric>

using namespace std;

// Estructura auxiliar para guardar y ordenar los ahorros
struct Saving {
    int i, j;
    double amount;

    // Orden de mayor a menor ahorro
    bool operator<(const Saving& other) const {
        return amount > other.amount;
    }
};

GreedyBuilder::GreedyBuilder(const Instance* instance) : instance(instance) {}

vector<int> GreedyBuilder::assignVehicles(const vector<int>& routeLoads) const {
    const vector<Vehicle>& fleet = instance->getFleet();
    vector<int> assignment(routeLoads.size(), -1);
    vector<bool> taken(fleet.size(), false);

    // Rutas de mayor a menor carga
    vector<int> order(routeLoads.size());
    iota(order.begin(), order.end(), 0);
    stable_sort(order.begin(), order.end(), [&](int a, int b) {
        return routeLoads[a] > routeLoads[b];
    });

    for (int r : order) {
        // El vehiculo libre mas chico donde quepa
        int best = -1;
        for (size_t k = 0; k < fleet.size(); ++k) {
            if (taken[k] || fleet[k].getCapacity() < routeLoads[r]) continue;
            if (best == -1 || fleet[k].getCapacity() < fleet[best].getCapacity()) {
                best = static_cast<int>(k);
            }
        }
        if (best != -1) {
            taken[best] = true;
            assignment[r] = best;
        }
    }
    return assignment;
}

// Algoritmo de Ahorros de Clarke-Wright con la mayor capacidad de la flota
Solution GreedyBuilder::buildSolution() const {
    int n = instance->getDimension();
    int capacity = instance->getMaxCapacity();

    // 1. Lista de ahorros S_ij = d(0,i) + d(j,0) - d(i,j)
    vector<Saving> savings;
    for (int i = 1; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            double s = instance->getDistance(DEPOT_ID, i) +
                       instance->getDistance(j, DEPOT_ID) -
                       instance->getDistance(i, j);
            savings.push_back({i, j, s});
        }
    }
    stable_sort(savings.begin(), savings.end());

    // 2. Rutas individuales (Bodega -> i -> Bodega)
    vector<int> routeOf(n);
    vector<list<int>> routes(n);
    vector<int> currentLoads(n, 0);

    for (int i = 1; i < n; ++i) {
        routeOf[i] = i;
        routes[i].push_back(i);
        currentLoads[i] = instance->getDemand(i);
    }

    // 3. Fusiones en orden de mayor ahorro
    for (const auto& sav : savings) {
        int i = sav.i;
        int j = sav.j;

        int r1 = routeOf[i];
        int r2 = routeOf[j];

        if (r1 == r2) continue;
        if (currentLoads[r1] + currentLoads[r2] > capacity) continue;

        // 'i' y 'j' deben ser extremos de sus rutas
        bool i_is_front = (routes[r1].front() == i);
        bool i_is_back  = (routes[r1].back() == i);
        bool j_is_front = (routes[r2].front() == j);
        bool j_is_back  = (routes[r2].back() == j);

        if ((i_is_front || i_is_back) && (j_is_front || j_is_back)) {
            if (i_is_front) routes[r1].reverse();
            if (j_is_back)  routes[r2].reverse();

            for (int client : routes[r2]) {
                routeOf[client] = r1;
            }
            routes[r1].splice(routes[r1].end(), routes[r2]);

            currentLoads[r1] += currentLoads[r2];
            currentLoads[r2] = 0;
        }
    }

    // 4. Rutas no vacias -> vehiculos de la flota
    vector<int> finalRoutes;
    vector<int> finalLoads;
    for (int i = 1; i < n; ++i) {
        if (!routes[i].empty()) {
            finalRoutes.push_back(i);
            finalLoads.push_back(currentLoads[i]);
        }
    }
    vector<int> vehicleOf = assignVehicles(finalLoads);

    const vector<Vehicle>& fleet = instance->getFleet();
    vector<Route> byVehicle;
    for (const auto& vehicle : fleet) {
        byVehicle.push_back(Route(vehicle, instance));
    }
    for (size_t r = 0; r < finalRoutes.size(); ++r) {
        if (vehicleOf[r] == -1) continue; // queda fuera: solucion invalida
        for (int client : routes[finalRoutes[r]]) {
            byVehicle[vehicleOf[r]].addClient(client);
        }
    }

    Solution solution(instance);
    for (const auto& route : byVehicle) {
        solution.addRoute(route);
    }
    return solution;
}
