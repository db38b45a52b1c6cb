#include <iostream>
#include <cassert>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <string>
#include "Parser.h"
#include "Route.h"
#include "Solution.h"

using namespace std;

void printRouteState(const Route& route) {
    cout << "Ruta actual: [ ";
    for (int nodeId : route.getPath()) {
        cout << nodeId << " ";
    }
    cout << "]" << endl;
    cout << "Carga: " << route.getCurrentLoad() << "/" << route.getMaxCapacity() << endl;
    cout << "Costo total: " << route.getTotalCost() << endl;
    cout << "Es valida (sin bodegas intermedias ni excesos)? " << (route.isValid() ? "Si" : "No") << endl;
    cout << "---------------------------------" << endl;
}

int main() {
    cout << "--- Iniciando Test de Route ---" << endl;

    // 1. Instancia de juguete: Q=5, demandas 2, 2, 3
    Parser parser(string(VRP_SETS_DIR) + "/toy-n4-k2.vrp");
    const Instance& inst = parser.getInstance();
    const Vehicle& v0 = inst.getFleet()[0];
    const Vehicle& v1 = inst.getFleet()[1];

    // 2. Ruta vacia: [0 0], costo y carga 0
    Route miRuta(v0, &inst);
    cout << "Estado inicial de la ruta (Debe ser [0 0] con costo/carga 0):" << endl;
    printRouteState(miRuta);
    assert(miRuta.getPath().size() == 2);
    assert(!miRuta.isUsed());
    assert(miRuta.isValid());
    assert(miRuta.getTotalCost() == 0.0);

    // 3. Cliente 1 (demanda 2) y cliente 2 (demanda 2): carga 4
    assert(miRuta.addClient(1));
    assert(miRuta.addClient(2));
    printRouteState(miRuta);
    assert(miRuta.getCurrentLoad() == 4);
    assert(fabs(miRuta.getTotalCost() - 4.0) < 1e-9);

    // 4. Cliente 3 (demanda 3) excede Q=5: la ruta no cambia
    cout << "Intentando agregar Cliente 3 (Demanda: 3)..." << endl;
    bool exito3 = miRuta.addClient(3);
    cout << "Exito? " << (exito3 ? "Si" : "No") << " <- (Deberia ser No, supera 5)" << endl;
    assert(!exito3);
    assert(miRuta.getCurrentLoad() == 4);
    assert(miRuta.getCustomers().size() == 2);

    // 5. appendStop no chequea: la ruta queda invalida
    Route sobrecargada = miRuta;
    sobrecargada.appendStop(3);
    printRouteState(sobrecargada);
    assert(sobrecargada.getCurrentLoad() == 7);
    assert(!sobrecargada.isValid());

    // 6. removeClient recalcula carga y costo
    sobrecargada.removeClient(1);
    assert(sobrecargada.getCurrentLoad() == 5);
    assert(sobrecargada.isValid());
    assert(fabs(sobrecargada.getTotalCost() - (2.0 + sqrt(8.0) + 2.0)) < 1e-9);

    // 7. Solution: cobertura exacta y una ruta por vehiculo
    Route ruta2(v1, &inst);
    assert(ruta2.addClient(3));

    Solution completa(&inst);
    completa.addRoute(miRuta);
    completa.addRoute(ruta2);
    assert(completa.isValid());
    assert(fabs(completa.getTotalCost() - 8.0) < 1e-9);
    assert(completa.getNumUsedVehicles() == 2);

    Solution faltaCliente(&inst);
    faltaCliente.addRoute(miRuta);
    faltaCliente.addRoute(Route(v1, &inst));
    assert(!faltaCliente.isValid() && "El cliente 3 no esta cubierto");

    Route repetida(v1, &inst);
    repetida.addClient(2);
    repetida.addClient(3);
    Solution duplicado(&inst);
    duplicado.addRoute(miRuta);
    duplicado.addRoute(repetida);
    assert(!duplicado.isValid() && "El cliente 2 aparece dos veces");

    Solution ordenInvertido(&inst);
    ordenInvertido.addRoute(ruta2);
    ordenInvertido.addRoute(miRuta);
    assert(!ordenInvertido.isValid() && "Las rutas deben seguir el orden de la flota");

    // 8. Flota obligatoria: un vehiculo vacio invalida la solucion
    Instance obligatoria = inst;
    obligatoria.setRequireAllVehicles(true);
    Route todo(obligatoria.getFleet()[0], &obligatoria);
    todo.appendStop(1);
    todo.appendStop(2);
    Solution unSolo(&obligatoria);
    unSolo.addRoute(todo);
    unSolo.addRoute(Route(obligatoria.getFleet()[1], &obligatoria));
    assert(!unSolo.isValid());

    // 9. Archivo .sol
    string salida = "test_Route_out.sol";
    completa.writeSolutionFile(salida);
    ifstream in(salida);
    string linea1, linea2, linea3;
    getline(in, linea1);
    getline(in, linea2);
    getline(in, linea3);
    assert(linea1 == "Route #1: 1 2");
    assert(linea2 == "Route #2: 3");
    assert(linea3 == "Cost 8");
    in.close();
    remove(salida.c_str());

    cout << "--- Test superado exitosamente ---" << endl;

    return 0;
}
