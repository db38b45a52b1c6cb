#ifndef ROUTE_EXTRACTOR_H
#define ROUTE_EXTRACTOR_H

#include <vector>
#include "Instance.h"
#include "ModelBuilder.h"
#include "Solution.h"

// Decodifica la asignacion de CBC en una ruta por vehiculo.
// Solo consulta las columnas de arcos registradas en ArcVariableMap; las
// columnas auxiliares (cargas) se ignoran. Nada se repara: cualquier
// inconsistencia se reporta con excepcion.
class RouteExtractor {
private:
    const Instance* instance;
    const ArcVariableMap* arcs;

    // Valor binario del arco; MalformedAssignment si no es ~0 o ~1
    bool isActive(const std::vector<double>& assignment, int vehicle, int fromId, int toId) const;

    // Sucesor unico de `fromId` para el vehiculo, -1 si no hay arco activo
    int nextStop(const std::vector<double>& assignment, int vehicle, int fromId) const;

    Route followVehicle(const std::vector<double>& assignment, int vehicle) const;

    void checkCoverage(const std::vector<Route>& routes) const;
    void checkStrayArcs(const std::vector<double>& assignment, const std::vector<Route>& routes) const;

public:
    static const double INTEGRALITY_TOLERANCE;  // 1e-6
    static const double CONSISTENCY_TOLERANCE;  // 1e-6 relativo

    RouteExtractor(const Instance* instance, const ArcVariableMap* arcs);

    // Lanza MalformedAssignment, InvariantViolation o ConsistencyError
    Solution extract(const std::vector<double>& assignment, double reportedObjective) const;
};

#endif // ROUTE_EXTRACTOR_H
