#include "CbcSolver.h"
#include <chrono>
#include <cmath>
#include <iostream>
#include <coin/OsiClpSolverInterface.hpp>
// Cortes internos de CBC/CGL
#include <coin/CglGomory.hpp>
#include <coin/CglMixedIntegerRounding2.hpp>
#include <coin/CglClique.hpp>
// Heuristicas internas de CBC
#include <coin/CbcHeuristicFPump.hpp>
#include <coin/CbcHeuristicRINS.hpp>

using namespace std;
using chrono::steady_clock;
using chrono::duration;

// Gap por debajo del cual un optimo "probado con tolerancia" cuenta como Optimal
static const double OPTIMALITY_GAP = 1e-6;

// =============================================================================
// CbcProgressHandler
// =============================================================================
CbcProgressHandler::CbcProgressHandler(int reportEvery)
    : reportEvery(reportEvery), lastReportNodes(0) {}

CbcEventHandler::CbcAction CbcProgressHandler::event(CbcEvent whichEvent) {
    if (!model_) return noAction;

    int    nodes = model_->getNodeCount();
    double ub    = model_->getObjValue();
    double lb    = model_->getBestPossibleObjValue();
    double gap   = (ub < 1e49 && lb > -1e49 && fabs(ub) > 1e-10) ?
                   100.0 * (ub - lb) / fabs(ub) : 100.0;

    if (whichEvent == node && nodes - lastReportNodes >= reportEvery) {
        lastReportNodes = nodes;
        cerr << "[CBC] Nodos: " << nodes
             << " | LB: "  << lb
             << " | UB: "  << (ub < 1e49 ? ub : -1.0)
             << " | GAP: " << gap << "%" << endl;
    }

    if ((whichEvent == solution || whichEvent == heuristicSolution) && model_->bestSolution()) {
        cerr << "[CBC] Nueva solucion: " << ub << " en nodo " << nodes
             << (whichEvent == heuristicSolution ? " (heuristica)" : "") << endl;
    }
    return noAction;
}

CbcEventHandler* CbcProgressHandler::clone() const {
    return new CbcProgressHandler(*this);
}

// =============================================================================
// CbcSolver
// =============================================================================
CbcSolver::CbcSolver(const SearchConfig& config) : config(config), mipStartObjective(0.0) {}

void CbcSolver::addCutGenerator(CglCutGenerator* generator, const string& name) {
    extraCutGenerators.push_back(make_pair(generator, name));
}

void CbcSolver::setMipStart(const vector<double>& values, double objective) {
    mipStart = values;
    mipStartObjective = objective;
}

double CbcSolver::relativeGap(double objective, double bound) {
    if (objective >= 1e49 || bound <= -1e49) return 1.0;
    double gap = (objective - bound) / max(fabs(objective), 1e-10);
    return max(gap, 0.0);
}

SolveResult CbcSolver::solve(const BuiltModel& built) {
    config.validate();
    auto inicio = steady_clock::now();

    // =========================================================
    // 1. Modelo CBC sobre una copia de la interfaz OSI
    // =========================================================
    CbcModel model(*built.solver);
    model.setLogLevel(config.logLevel > 1 ? config.logLevel - 1 : 0);
    model.solver()->setHintParam(OsiDoReducePrint, true, OsiHintTry);
    model.solver()->messageHandler()->setLogLevel(config.logLevel > 2 ? 1 : 0);

    // =========================================================
    // 2. Presupuesto: tiempo, nodos y gap
    // =========================================================
    model.setMaximumSeconds(config.timeLimitSeconds);
    if (config.maxNodes > 0) {
        model.setMaximumNodes(config.maxNodes);
    }
    if (config.relativeGap > 0.0) {
        model.setAllowableFractionGap(config.relativeGap);
    }

    // =========================================================
    // 3. Cortes: CGL y los del llamador
    // =========================================================
    CglGomory gomory;
    gomory.setLimit(100);
    CglMixedIntegerRounding2 mir;
    CglClique clique;

    if (config.useCglCuts) {
        model.addCutGenerator(&gomory, 1, "Gomory");
        model.addCutGenerator(&mir, 1, "MIR");
        model.addCutGenerator(&clique, 1, "Clique");
    }
    for (const auto& entry : extraCutGenerators) {
        model.addCutGenerator(entry.first, 1, entry.second.c_str());
    }

    // =========================================================
    // 4. Heuristicas internas de CBC
    // =========================================================
    CbcHeuristicFPump fpump(model);
    fpump.setMaximumPasses(30);
    CbcHeuristicRINS rins(model);
    rins.setWhen(10);

    if (config.useHeuristics) {
        model.addHeuristic(&fpump, "FeasibilityPump");
        model.addHeuristic(&rins, "RINS");
    }

    // =========================================================
    // 5. Warm start: CBC verifica la solucion antes de aceptarla
    // =========================================================
    if (!mipStart.empty()) {
        model.setBestSolution(mipStart.data(), static_cast<int>(mipStart.size()),
                              mipStartObjective, true);
    }

    CbcProgressHandler progress;
    if (config.logLevel > 0) {
        model.passInEventHandler(&progress);
    }

    // =========================================================
    // 6. Resolver
    // =========================================================
    model.branchAndBound();

    // =========================================================
    // 7. Traducir el estado de CBC
    // =========================================================
    SolveResult result;
    SearchSummary& summary = result.summary;
    summary.nodeCount = model.getNodeCount();
    summary.seconds = duration<double>(steady_clock::now() - inicio).count();
    summary.limitReached = model.isSecondsLimitReached() || model.isNodeLimitReached();

    const double* best = model.bestSolution();
    bool hasRealSolution = (best != nullptr) && (model.getObjValue() < 1e+49);

    if (model.isProvenInfeasible()) {
        summary.status = SolveStatus::Infeasible;
    } else if (hasRealSolution) {
        summary.objectiveValue = model.getObjValue();
        summary.bestBound = model.getBestPossibleObjValue();
        summary.gap = relativeGap(summary.objectiveValue, summary.bestBound);

        bool proven = model.isProvenOptimal() &&
                      (config.relativeGap <= 0.0 || summary.gap <= OPTIMALITY_GAP);
        if (proven) summary.gap = 0.0;
        summary.status = proven ? SolveStatus::Optimal : SolveStatus::Feasible;

        result.assignment.assign(best, best + model.getNumCols());
    } else {
        summary.status = SolveStatus::Unknown;
    }

    if (config.logLevel > 0) {
        cout << "[CBC] Estado: " << toString(summary.status)
             << " | Nodos: " << summary.nodeCount
             << " | Tiempo: " << summary.seconds << "s";
        if (hasRoutes(summary.status)) {
            cout << " | Costo: " << summary.objectiveValue
                 << " | Cota: " << summary.bestBound
                 << " | GAP: " << 100.0 * summary.gap << "%";
        }
        if (summary.limitReached) cout << " | limite alcanzado";
        cout << endl;
    }
    return result;
}
