#ifndef VRP_SOLVER_H
#define VRP_SOLVER_H

#include "Instance.h"
#include "SearchConfig.h"
#include "Solution.h"

// Una resolucion completa: ModelBuilder -> CbcSolver -> RouteExtractor.
// Cada llamada a solve() construye y libera su propio modelo.
class VrpSolver {
private:
    const Instance* instance;
    SearchConfig config;

public:
    VrpSolver(const Instance* instance, const SearchConfig& config);

    // Lanza BuilderError / InfeasibleInstance antes de buscar y
    // MalformedAssignment / InvariantViolation / ConsistencyError despues.
    // Infeasible y Unknown vuelven como estado de una Solution sin rutas.
    Solution solve();
};

#endif // VRP_SOLVER_H
