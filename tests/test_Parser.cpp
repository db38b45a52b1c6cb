// test_Parser.cpp
// Lectura de instancias TSPLIB / CVRPLIB: renumeracion de la bodega,
// metricas de distancia, flota y errores de formato.

#include <iostream>
#include <sstream>
#include <string>
#include <cmath>
#include <cassert>
#include <stdexcept>
#include "Parser.h"

using namespace std;

const string SETS_DIR = VRP_SETS_DIR;

bool near(double a, double b) { return fabs(a - b) < 1e-9; }

// ─────────────────────────────────────────────────────────────
// Test 1: instancia de juguete (EXACT_2D, flota desde NAME)
// ─────────────────────────────────────────────────────────────
void testToyInstance() {
    cout << "\n========================================" << endl;
    cout << "TEST 1: toy-n4-k2 (EXACT_2D)" << endl;
    cout << "========================================" << endl;

    Parser parser(SETS_DIR + "/toy-n4-k2.vrp");
    const Instance& inst = parser.getInstance();

    assert(inst.getName() == "toy-n4-k2");
    assert(inst.getDimension() == 4);
    assert(inst.getNumCustomers() == 3);
    assert(inst.getNumVehicles() == 2 && "El numero de vehiculos sale de '-k2' en NAME");
    assert(inst.getFleet()[0].getCapacity() == 5);
    assert(inst.getFleet()[1].getCapacity() == 5);

    assert(inst.getDemand(0) == 0);
    assert(inst.getDemand(1) == 2);
    assert(inst.getDemand(2) == 2);
    assert(inst.getDemand(3) == 3);

    assert(inst.getLocations()[0].isDepot());
    assert(near(inst.getDistance(0, 1), 1.0));
    assert(near(inst.getDistance(1, 2), 1.0));
    assert(near(inst.getDistance(2, 3), sqrt(8.0)) && "EXACT_2D no redondea");
    assert(near(inst.getDistance(3, 2), inst.getDistance(2, 3)));

    cout << "PASS: N=" << inst.getDimension() << " K=" << inst.getNumVehicles() << endl;
}

// ─────────────────────────────────────────────────────────────
// Test 2: matriz explicita FULL_MATRIX
// ─────────────────────────────────────────────────────────────
void testExplicitMatrix() {
    cout << "\n========================================" << endl;
    cout << "TEST 2: EDGE_WEIGHT_TYPE EXPLICIT" << endl;
    cout << "========================================" << endl;

    Parser parser(SETS_DIR + "/explicit-n4-k2.vrp");
    const Instance& inst = parser.getInstance();

    assert(inst.getNumVehicles() == 2);
    assert(near(inst.getDistance(0, 1), 10.0));
    assert(near(inst.getDistance(1, 2), 35.0));
    assert(near(inst.getDistance(2, 3), 30.0));
    assert(near(inst.getDistance(3, 0), 20.0));
    assert(inst.getTotalDemand() == 3);

    cout << "PASS: matriz explicita cargada." << endl;
}

// ─────────────────────────────────────────────────────────────
// Test 3: flota heterogenea y EUC_2D redondeado
// ─────────────────────────────────────────────────────────────
void testHeterogeneousFleet() {
    cout << "\n========================================" << endl;
    cout << "TEST 3: VEHICLE_CAPACITY_SECTION" << endl;
    cout << "========================================" << endl;

    Parser parser(SETS_DIR + "/hetero-n5-k2.vrp");
    const Instance& inst = parser.getInstance();

    assert(inst.getNumVehicles() == 2);
    assert(inst.getFleet()[0].getCapacity() == 4);
    assert(inst.getFleet()[1].getCapacity() == 6);
    assert(inst.getMaxCapacity() == 6);
    assert(inst.getTotalCapacity() == 10);
    // (3,0) -> (0,4) = 5 exacto; (6,0) -> (0,4) = 7.21 -> 7
    assert(near(inst.getDistance(1, 3), 5.0));
    assert(near(inst.getDistance(2, 3), 7.0));

    // Con -k la capacidad vuelve a ser la comun para todos
    Parser overridden(SETS_DIR + "/hetero-n5-k2.vrp", 3);
    assert(overridden.getInstance().getNumVehicles() == 3);
    for (const auto& v : overridden.getInstance().getFleet()) {
        assert(v.getCapacity() == 6);
    }

    cout << "PASS: flota heterogenea leida." << endl;
}

// ─────────────────────────────────────────────────────────────
// Test 4: la bodega se renumera a 0 aunque no sea el id 1
// ─────────────────────────────────────────────────────────────
void testDepotRemap() {
    cout << "\n========================================" << endl;
    cout << "TEST 4: Renumeracion de la bodega" << endl;
    cout << "========================================" << endl;

    string text =
        "NAME : swap\n"
        "COMMENT : No of trucks: 1\n"
        "TYPE : CVRP\n"
        "DIMENSION : 3\n"
        "CAPACITY : 10\n"
        "EDGE_WEIGHT_TYPE : EUC_2D\n"
        "NODE_COORD_SECTION\n"
        "1 3 0\n"
        "2 0 0\n"
        "3 0 4\n"
        "DEMAND_SECTION\n"
        "1 5\n"
        "2 0\n"
        "3 4\n"
        "DEPOT_SECTION\n"
        "2\n"
        "-1\n"
        "EOF\n";
    istringstream in(text);
    Parser parser(in, "swap");
    const Instance& inst = parser.getInstance();

    assert(inst.getNumVehicles() == 1 && "Flota desde 'No of trucks' en COMMENT");
    assert(near(inst.getLocations()[0].getX(), 0.0) && near(inst.getLocations()[0].getY(), 0.0));
    assert(inst.getDemand(0) == 0);
    assert(inst.getDemand(1) == 5);
    assert(inst.getDemand(2) == 4);
    assert(near(inst.getDistance(1, 2), 5.0));
    assert(near(inst.getDistance(0, 1), 3.0));

    cout << "PASS: bodega en id 0." << endl;
}

// ─────────────────────────────────────────────────────────────
// Test 5: errores de formato lanzan runtime_error
// ─────────────────────────────────────────────────────────────
void expectParseError(const string& text, const string& label) {
    istringstream in(text);
    bool thrown = false;
    try {
        Parser parser(in, label);
    } catch (const runtime_error& e) {
        thrown = true;
        cout << "  " << label << " -> " << e.what() << endl;
    }
    assert(thrown);
}

void testErrors() {
    cout << "\n========================================" << endl;
    cout << "TEST 5: Errores de formato" << endl;
    cout << "========================================" << endl;

    bool thrown = false;
    try {
        Parser parser(SETS_DIR + "/no-existe.vrp");
    } catch (const runtime_error&) {
        thrown = true;
    }
    assert(thrown && "Archivo inexistente");

    string header =
        "NAME : sin-flota\n"
        "TYPE : CVRP\n"
        "DIMENSION : 2\n"
        "CAPACITY : 10\n"
        "EDGE_WEIGHT_TYPE : EUC_2D\n";
    string body =
        "NODE_COORD_SECTION\n1 0 0\n2 1 1\n"
        "DEMAND_SECTION\n1 0\n2 3\n"
        "DEPOT_SECTION\n1\n-1\nEOF\n";

    expectParseError(header + body, "sin numero de vehiculos");
    expectParseError(header + "NODE_COORD_SECTION\n1 0 0\n", "coordenadas incompletas");
    expectParseError("NAME : x-k1\nTYPE : TSP\nDIMENSION : 2\n", "tipo TSP");
    expectParseError("NAME : x-k1\nTYPE : CVRP\nDIMENSION : dos\n", "DIMENSION no numerica");
    expectParseError("NAME : x-k1\nTYPE : CVRP\nDIMENSION : 2\nEDGE_WEIGHT_TYPE : GEO\n"
                     "DEMAND_SECTION\n1 0\n2 1\nEOF\n", "metrica GEO");

    // El mismo archivo con -k se puede leer
    istringstream ok(header + body);
    Parser parser(ok, "sin-flota", 2);
    assert(parser.getInstance().getNumVehicles() == 2);

    cout << "PASS: errores reportados con excepcion." << endl;
}

// ─────────────────────────────────────────────────────────────
// Test 6: ids de nodo fuera de rango o repetidos
// ─────────────────────────────────────────────────────────────
void testNodeIds() {
    cout << "\n========================================" << endl;
    cout << "TEST 6: Ids de nodo invalidos" << endl;
    cout << "========================================" << endl;

    string header =
        "NAME : ids-k1\n"
        "TYPE : CVRP\n"
        "DIMENSION : 4\n"
        "CAPACITY : 20\n"
        "EDGE_WEIGHT_TYPE : EUC_2D\n";
    string coords = "NODE_COORD_SECTION\n1 5 5\n2 0 0\n3 3 0\n4 0 4\n";
    string demands = "DEMAND_SECTION\n1 0\n2 7\n3 1\n4 2\n";
    string depot = "DEPOT_SECTION\n1\n-1\nEOF\n";

    // Archivo indexado desde 0: el nodo 4 nunca aparece
    expectParseError(header + "NODE_COORD_SECTION\n0 5 5\n1 0 0\n2 3 0\n3 0 4\n" + demands + depot,
                     "coordenadas desde 0");
    expectParseError(header + coords + "DEMAND_SECTION\n0 0\n1 7\n2 1\n3 2\n" + depot,
                     "demandas desde 0");
    expectParseError(header + "NODE_COORD_SECTION\n1 5 5\n2 0 0\n2 3 0\n4 0 4\n" + demands + depot,
                     "coordenada repetida");
    expectParseError(header + coords + "DEMAND_SECTION\n1 0\n2 7\n2 1\n4 2\n" + depot,
                     "demanda repetida");
    expectParseError(header + coords + "DEMAND_SECTION\n1 0\n2 7\n3 1\n5 2\n" + depot,
                     "demanda fuera de DIMENSION");

    istringstream ok(header + coords + demands + depot);
    Parser parser(ok, "ids");
    assert(parser.getInstance().getDemand(1) == 7);
    assert(parser.getInstance().getDemand(3) == 2);

    cout << "PASS: ids invalidos rechazados." << endl;
}

// ─────────────────────────────────────────────────────────────
// Test 7: DEPOT_SECTION sin -1 no corta la lectura
// ─────────────────────────────────────────────────────────────
void testDepotWithoutTerminator() {
    cout << "\n========================================" << endl;
    cout << "TEST 7: DEPOT_SECTION sin terminador" << endl;
    cout << "========================================" << endl;

    string header =
        "NAME : flota\n"
        "TYPE : CVRP\n"
        "DIMENSION : 3\n"
        "VEHICLES : 2\n"
        "CAPACITY : 9\n"
        "EDGE_WEIGHT_TYPE : EUC_2D\n"
        "NODE_COORD_SECTION\n1 0 0\n2 3 0\n3 0 4\n"
        "DEMAND_SECTION\n1 0\n2 2\n3 3\n";

    istringstream in(header + "DEPOT_SECTION\n1\nVEHICLE_CAPACITY_SECTION\n1 2\n2 3\n");
    Parser parser(in, "flota");
    const Instance& inst = parser.getInstance();
    assert(inst.getNumVehicles() == 2);
    assert(inst.getFleet()[0].getCapacity() == 2);
    assert(inst.getFleet()[1].getCapacity() == 3);

    // Con -1 y EOF el resultado es el mismo
    istringstream closed(header + "DEPOT_SECTION\n1\n-1\nVEHICLE_CAPACITY_SECTION\n1 2\n2 3\nEOF\n");
    Parser closedParser(closed, "flota");
    assert(closedParser.getInstance().getFleet()[1].getCapacity() == 3);

    expectParseError(header + "DEPOT_SECTION\n1\n3\n-1\nEOF\n", "dos bodegas");
    expectParseError(header + "DEPOT_SECTION\n1\nVEHICLE_CAPACITY_SECTION\n1 2\n", "capacidades incompletas");
    expectParseError(header + "DEPOT_SECTION\n1\nVEHICLE_CAPACITY_SECTION\n1 2\n1 3\n", "vehiculo repetido");

    cout << "PASS: secciones posteriores a la bodega leidas." << endl;
}

int main() {
    cout << "--- Iniciando Test de Parser ---" << endl;

    testToyInstance();
    testExplicitMatrix();
    testHeterogeneousFleet();
    testDepotRemap();
    testErrors();
    testNodeIds();
    testDepotWithoutTerminator();

    cout << "\n--- Todos los tests de Parser superados ---" << endl;
    return 0;
}
