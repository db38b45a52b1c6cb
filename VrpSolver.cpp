#include "VrpSolver.h"
#include "CbcSolver.h"
#include "GreedyBuilder.h"
#include "ModelBuilder.h"
#include "RouteExtractor.h"
#include "SubtourCut.h"
#include "VrpErrors.h"

#include <iostream>

using namespace std;

VrpSolver::VrpSolver(const Instance* instance, const SearchConfig& config)
    : instance(instance), config(config) {}

Solution VrpSolver::solve() {
    config.validate();
    bool verbose = config.logLevel > 0;

    // =========================================================
    // 1. Modelo (falla rapido si la instancia es invalida)
    // =========================================================
    ModelBuilder builder(instance);
    BuiltModel model = builder.build();

    if (verbose) {
        cout << "[Modelo] " << instance->getName()
             << " | Puntos: " << instance->getDimension()
             << " | Vehiculos: " << instance->getNumVehicles()
             << " | Columnas: " << model.getNumColumns()
             << " (arcos " << model.arcs.getNumArcs() << ")"
             << " | Filas: " << model.getNumRows() << endl;
    }

    if (!config.lpExportPath.empty()) {
        model.solver->writeLp(config.lpExportPath.c_str());
        if (verbose) cout << "[Modelo] Exportado a " << config.lpExportPath << ".lp" << endl;
    }

    // =========================================================
    // 2. Busqueda
    // =========================================================
    CbcSolver cbc(config);

    SubtourCutGenerator subtourGen(instance, &model.arcs);
    if (config.useSubtourCuts) {
        cbc.addCutGenerator(&subtourGen, "SubtourDFJ");
    }

    if (config.useWarmStart) {
        GreedyBuilder greedy(instance);
        Solution warmStart = greedy.buildSolution();
        if (warmStart.isValid()) {
            cbc.setMipStart(builder.encodeSolution(model, warmStart), warmStart.getTotalCost());
            if (verbose) cout << "[Modelo] Warm start Clarke-Wright: " << warmStart.getTotalCost() << endl;
        } else if (verbose) {
            cout << "[Modelo] Clarke-Wright no cabe en la flota; sin warm start" << endl;
        }
    }

    SolveResult result = cbc.solve(model);

    // =========================================================
    // 3. Decodificar (solo si CBC entrego una asignacion)
    // =========================================================
    if (!hasRoutes(result.summary.status)) {
        Solution empty(instance);
        empty.setSummary(result.summary);
        return empty;
    }

    if (!result.hasAssignment()) {
        throw ConsistencyError(string("CBC reporto ") + toString(result.summary.status) + " sin asignacion");
    }

    RouteExtractor extractor(instance, &model.arcs);
    Solution solution = extractor.extract(result.assignment, result.summary.objectiveValue);
    solution.setSummary(result.summary);

    if (verbose) {
        cout << "[Rutas] " << solution.getNumUsedVehicles() << " vehiculos usados"
             << " | Distancia: " << solution.getTotalCost() << endl;
    }
    return solution;
}
