#include "RouteExtractor.h"
#include "VrpErrors.h"

#include <algorithm>
#include <cmath>
#include <sstream>

using namespace std;

const double RouteExtractor::INTEGRALITY_TOLERANCE = 1e-6;
const double RouteExtractor::CONSISTENCY_TOLERANCE = 1e-6;

RouteExtractor::RouteExtractor(const Instance* instance, const ArcVariableMap* arcs)
    : instance(instance), arcs(arcs) {}

bool RouteExtractor::isActive(const vector<double>& assignment, int vehicle, int fromId, int toId) const {
    double value = assignment[arcs->getColumn(vehicle, fromId, toId)];
    if (fabs(value) <= INTEGRALITY_TOLERANCE) return false;
    if (fabs(value - 1.0) <= INTEGRALITY_TOLERANCE) return true;

    ostringstream msg;
    msg << "Valor no binario " << value << " en el arco " << fromId << " -> " << toId
        << " del vehiculo " << vehicle;
    throw MalformedAssignment(msg.str(), vehicle);
}

int RouteExtractor::nextStop(const vector<double>& assignment, int vehicle, int fromId) const {
    int next = -1;
    for (int j = 0; j < arcs->getNumLocations(); ++j) {
        if (j == fromId || !isActive(assignment, vehicle, fromId, j)) continue;
        if (next != -1) {
            throw MalformedAssignment("El vehiculo " + to_string(vehicle) + " tiene mas de un arco activo saliendo de " +
                                      to_string(fromId) + " (" + to_string(next) + " y " + to_string(j) + ")",
                                      vehicle);
        }
        next = j;
    }
    return next;
}

Route RouteExtractor::followVehicle(const vector<double>& assignment, int vehicle) const {
    const Vehicle& v = instance->getFleet()[vehicle];
    Route route(v, instance);

    int n = instance->getDimension();
    vector<bool> visited(n, false);
    int current = DEPOT_ID;

    // A lo sumo N pasos para volver a la bodega
    for (int steps = 0; steps <= n; ++steps) {
        int next = nextStop(assignment, vehicle, current);

        if (next == -1) {
            if (current == DEPOT_ID) return route; // vehiculo sin usar
            throw MalformedAssignment("La ruta del vehiculo " + to_string(vehicle) +
                                      " termina en el cliente " + to_string(current) +
                                      " sin volver a la bodega", vehicle);
        }
        if (next == DEPOT_ID) return route;
        if (visited[next]) {
            throw MalformedAssignment("La ruta del vehiculo " + to_string(vehicle) +
                                      " vuelve a visitar el cliente " + to_string(next), vehicle);
        }
        visited[next] = true;
        route.appendStop(next);
        current = next;
    }

    throw MalformedAssignment("La ruta del vehiculo " + to_string(vehicle) + " no vuelve a la bodega en " +
                              to_string(n) + " pasos", vehicle);
}

void RouteExtractor::checkCoverage(const vector<Route>& routes) const {
    vector<int> visitCount(instance->getDimension(), 0);
    for (const auto& route : routes) {
        for (int locationId : route.getCustomers()) {
            visitCount[locationId]++;
        }
    }
    for (int i = 1; i < instance->getDimension(); ++i) {
        if (visitCount[i] != 1) {
            throw InvariantViolation("El cliente " + to_string(i) + " aparece " + to_string(visitCount[i]) +
                                     " veces en las rutas (se esperaba 1)");
        }
    }
}

void RouteExtractor::checkStrayArcs(const vector<double>& assignment, const vector<Route>& routes) const {
    int n = arcs->getNumLocations();
    for (size_t k = 0; k < routes.size(); ++k) {
        int vehicle = static_cast<int>(k);
        int active = 0;
        for (int i = 0; i < n; ++i) {
            for (int j = 0; j < n; ++j) {
                if (i != j && isActive(assignment, vehicle, i, j)) active++;
            }
        }
        int traversed = routes[k].isUsed() ? static_cast<int>(routes[k].getPath().size()) - 1 : 0;
        if (active != traversed) {
            throw InvariantViolation("El vehiculo " + to_string(vehicle) + " tiene " + to_string(active) +
                                     " arcos activos pero su ruta recorre " + to_string(traversed));
        }
    }
}

Solution RouteExtractor::extract(const vector<double>& assignment, double reportedObjective) const {
    int expected = arcs->getFirstColumn() + arcs->getNumArcs();
    if (static_cast<int>(assignment.size()) < expected) {
        throw MalformedAssignment("La asignacion tiene " + to_string(assignment.size()) +
                                  " valores y el modelo registra " + to_string(expected) + " columnas de arcos");
    }

    // 1. Seguir el sucesor unico de cada vehiculo desde la bodega
    vector<Route> routes;
    for (int k = 0; k < arcs->getNumVehicles(); ++k) {
        routes.push_back(followVehicle(assignment, k));
    }

    // 2. Invariantes de la solucion completa
    checkCoverage(routes);
    checkStrayArcs(assignment, routes);
    for (const auto& route : routes) {
        if (route.getCurrentLoad() > route.getMaxCapacity()) {
            throw InvariantViolation("El vehiculo " + to_string(route.getVehicleId()) + " lleva " +
                                     to_string(route.getCurrentLoad()) + " y su capacidad es " +
                                     to_string(route.getMaxCapacity()));
        }
    }

    Solution solution(instance);
    for (const auto& route : routes) {
        solution.addRoute(route);
    }

    // 3. Distancia recalculada contra el objetivo de CBC
    double diff = fabs(solution.getTotalCost() - reportedObjective);
    if (diff > CONSISTENCY_TOLERANCE * max(1.0, fabs(reportedObjective))) {
        ostringstream msg;
        msg.precision(12);
        msg << "Distancia recalculada " << solution.getTotalCost()
            << " distinta del objetivo reportado " << reportedObjective;
        throw ConsistencyError(msg.str());
    }
    return solution;
}
