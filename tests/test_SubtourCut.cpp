// test_SubtourCut.cpp
// Separacion de cortes DFJ / capacidad sobre soluciones armadas a mano.

#include <iostream>
#include <vector>
#include <algorithm>
#include <cassert>
#include <coin/OsiCuts.hpp>
#include "ModelBuilder.h"
#include "SubtourCut.h"

using namespace std;

Instance makeToy() {
    vector<Location> locations = {Location(0, 0, 0), Location(1, 1, 0), Location(2, 2, 0), Location(3, 0, 2)};
    vector<Vehicle> fleet = {Vehicle(0, 5), Vehicle(1, 5)};
    return Instance("toy", locations, {0, 2, 2, 3}, fleet);
}

void activate(vector<double>& sol, const ArcVariableMap& arcs, int k, const vector<int>& path) {
    for (size_t p = 0; p + 1 < path.size(); ++p) {
        sol[arcs.getColumn(k, path[p], path[p + 1])] = 1.0;
    }
}

// ─────────────────────────────────────────────────────────────
// Test 1: findInvalidSets
// ─────────────────────────────────────────────────────────────
void testFindInvalidSets() {
    cout << "\n========================================" << endl;
    cout << "TEST 1: findInvalidSets" << endl;
    cout << "========================================" << endl;

    Instance toy = makeToy();
    ArcVariableMap arcs(2, 4, 0);
    SubtourCutGenerator gen(&toy, &arcs);

    // Solucion valida: sin conjuntos
    vector<double> valid(arcs.getNumArcs(), 0.0);
    activate(valid, arcs, 0, {0, 1, 2, 0});
    activate(valid, arcs, 1, {0, 3, 0});
    assert(gen.findInvalidSets(valid.data(), 0.5).empty());

    // Subtour 2 <-> 3 desconectado de la bodega
    vector<double> subtour(arcs.getNumArcs(), 0.0);
    activate(subtour, arcs, 0, {0, 1, 0});
    activate(subtour, arcs, 1, {2, 3, 2});
    vector<vector<int>> sets = gen.findInvalidSets(subtour.data(), 0.5);
    assert(sets.size() == 1);
    vector<int> S = sets[0];
    sort(S.begin(), S.end());
    assert(S == vector<int>({2, 3}));
    assert(gen.minVehicles(S) == 1);

    // Ruta desde la bodega con demanda 7 > Q_max = 5
    vector<double> heavy(arcs.getNumArcs(), 0.0);
    activate(heavy, arcs, 0, {0, 1, 2, 3, 0});
    sets = gen.findInvalidSets(heavy.data(), 0.5);
    assert(sets.size() == 1);
    assert(sets[0].size() == 3);
    assert(gen.minVehicles(sets[0]) == 2);

    cout << "PASS: subtours y rutas sobrecargadas detectados." << endl;
}

// ─────────────────────────────────────────────────────────────
// Test 2: generateCuts sobre la interfaz OSI del modelo
// ─────────────────────────────────────────────────────────────
void testGenerateCuts() {
    cout << "\n========================================" << endl;
    cout << "TEST 2: generateCuts" << endl;
    cout << "========================================" << endl;

    Instance toy = makeToy();
    BuiltModel model = ModelBuilder(&toy).build();
    SubtourCutGenerator gen(&toy, &model.arcs);

    vector<double> sol(model.getNumColumns(), 0.0);
    activate(sol, model.arcs, 0, {0, 1, 0});
    activate(sol, model.arcs, 1, {2, 3, 2});
    model.solver->setColSolution(sol.data());

    OsiCuts cuts;
    gen.generateCuts(*model.solver, cuts);
    assert(cuts.sizeRowCuts() >= 1);

    // sum_k (x_k23 + x_k32) <= |S| - 1 = 1, violado por la solucion (2)
    const OsiRowCut& cut = cuts.rowCut(0);
    assert(cut.ub() == 1.0);
    assert(cut.row().getNumElements() == 4);
    assert(cut.violated(sol.data()) > 0.5);

    // Solucion valida: ningun corte
    vector<double> valid(model.getNumColumns(), 0.0);
    activate(valid, model.arcs, 0, {0, 1, 2, 0});
    activate(valid, model.arcs, 1, {0, 3, 0});
    model.solver->setColSolution(valid.data());

    OsiCuts none;
    gen.generateCuts(*model.solver, none);
    assert(none.sizeRowCuts() == 0);

    // CBC trabaja con clones
    CglCutGenerator* copy = gen.clone();
    assert(copy != nullptr);
    delete copy;

    cout << "PASS: corte DFJ generado solo cuando hay violacion." << endl;
}

int main() {
    cout << "--- Iniciando Test de SubtourCut ---" << endl;

    testFindInvalidSets();
    testGenerateCuts();

    cout << "\n--- Todos los tests de SubtourCut superados ---" << endl;
    return 0;
}
