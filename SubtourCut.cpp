#include "SubtourCut.h"

#include <vector>
#include <queue>
#include <cmath>
#include <algorithm>

#include <coin/CglTreeInfo.hpp>

using namespace std;

SubtourCutGenerator::SubtourCutGenerator(const Instance* instance, const ArcVariableMap* arcs)
    : instance(instance), arcs(arcs), n(instance->getDimension()) {}

CglCutGenerator* SubtourCutGenerator::clone() const {
    return new SubtourCutGenerator(instance, arcs);
}

double SubtourCutGenerator::aggregatedValue(const double* sol, int i, int j) const {
    double total = 0.0;
    for (int k = 0; k < arcs->getNumVehicles(); ++k) {
        total += sol[arcs->getColumn(k, i, j)];
    }
    return total;
}

int SubtourCutGenerator::minVehicles(const vector<int>& S) const {
    long demandSum = 0;
    for (int node : S) {
        if (node == DEPOT_ID) continue;
        demandSum += instance->getDemand(node);
    }
    int Q = instance->getMaxCapacity();
    if (Q <= 0) return 1;

    int k_s = static_cast<int>(ceil(static_cast<double>(demandSum) / Q));
    return max(k_s, 1);
}

// =============================================================================
// findInvalidSets
// =============================================================================
vector<vector<int>> SubtourCutGenerator::findInvalidSets(const double* sol, double threshold) const {
    vector<vector<int>> invalidSets;

    // ------------------------------------------------------------------
    // Paso 1: lista de adyacencia del grafo de soporte agregado
    // ------------------------------------------------------------------
    vector<vector<int>> adj(n);
    for (int i = 0; i < n; i++) {
        for (int j = 0; j < n; j++) {
            if (i != j && aggregatedValue(sol, i, j) > threshold) {
                adj[i].push_back(j);
            }
        }
    }

    // ------------------------------------------------------------------
    // Paso 2: BFS desde la bodega
    // ------------------------------------------------------------------
    vector<bool> reachable(n, false);
    reachable[DEPOT_ID] = true;
    queue<int> bfsQueue;
    bfsQueue.push(DEPOT_ID);

    while (!bfsQueue.empty()) {
        int cur = bfsQueue.front();
        bfsQueue.pop();
        for (int nb : adj[cur]) {
            if (!reachable[nb]) {
                reachable[nb] = true;
                bfsQueue.push(nb);
            }
        }
    }

    // ------------------------------------------------------------------
    // Paso 3: componentes de clientes sin conexion con la bodega
    // ------------------------------------------------------------------
    vector<bool> processed(n, false);
    processed[DEPOT_ID] = true;

    for (int start = 1; start < n; start++) {
        if (reachable[start] || processed[start]) continue;

        vector<int> component;
        queue<int> compQueue;
        compQueue.push(start);
        processed[start] = true;

        while (!compQueue.empty()) {
            int cur = compQueue.front();
            compQueue.pop();
            component.push_back(cur);

            for (int nb : adj[cur]) {
                if (!processed[nb] && !reachable[nb]) {
                    processed[nb] = true;
                    compQueue.push(nb);
                }
            }
        }
        invalidSets.push_back(component);
    }

    // ------------------------------------------------------------------
    // Paso 4: rutas que parten de la bodega y exceden Q_max
    // ------------------------------------------------------------------
    long Q = instance->getMaxCapacity();
    vector<bool> visitedInRoute(n, false);
    visitedInRoute[DEPOT_ID] = true;

    for (int j = 1; j < n; j++) {
        if (aggregatedValue(sol, DEPOT_ID, j) <= threshold) continue;
        if (visitedInRoute[j]) continue;

        vector<int> routeNodes;
        long totalDemand = 0;
        int curr = j;

        while (curr != DEPOT_ID && !visitedInRoute[curr]) {
            visitedInRoute[curr] = true;
            routeNodes.push_back(curr);
            totalDemand += instance->getDemand(curr);

            int next = -1;
            for (int nb : adj[curr]) {
                if (nb == DEPOT_ID || !visitedInRoute[nb]) {
                    next = nb;
                    break;
                }
            }
            if (next == -1) break;
            curr = next;
        }

        if (totalDemand > Q && !routeNodes.empty()) {
            invalidSets.push_back(routeNodes);
        }
    }

    return invalidSets;
}

// =============================================================================
// generateCuts
//
// Dos pasadas: threshold 0.5 (soluciones enteras o casi) y 1e-4
// (soporte fraccional). Solo se insertan cortes violados por la solucion
// actual, con insertIfNotDuplicate.
// =============================================================================
void SubtourCutGenerator::generateCuts(const OsiSolverInterface& si,
                                       OsiCuts& cs,
                                       const CglTreeInfo /*info*/) {
    const double* sol = si.getColSolution();
    if (!sol) return;

    const double thresholds[] = {0.5, 1e-4};

    for (double threshold : thresholds) {
        vector<vector<int>> invalidSets = findInvalidSets(sol, threshold);

        for (const auto& S : invalidSets) {
            if (S.size() < 2) continue; // un cliente solo no forma ciclo

            int rhs = static_cast<int>(S.size()) - minVehicles(S);
            if (rhs < 0) continue;

            vector<int>    indices;
            vector<double> coefficients;
            double lhs = 0.0;

            for (int u : S) {
                for (int v : S) {
                    if (u == v) continue;
                    for (int k = 0; k < arcs->getNumVehicles(); ++k) {
                        int idx = arcs->getColumn(k, u, v);
                        indices.push_back(idx);
                        coefficients.push_back(1.0);
                        lhs += sol[idx];
                    }
                }
            }

            // Corte no violado: no aporta nada en este nodo
            if (indices.empty() || lhs <= rhs + 1e-6) continue;

            OsiRowCut cut;
            cut.setRow(static_cast<int>(indices.size()), indices.data(), coefficients.data());
            cut.setLb(-COIN_DBL_MAX);
            cut.setUb(static_cast<double>(rhs));

            cs.insertIfNotDuplicate(cut);
        }
    }
}
