#include "menu.h"
#include "VrpErrors.h"
#include <sstream>
#include <iomanip>
#include <limits>
#include <stdexcept>

using namespace std;

Menu::Menu() : instanciaCargada(false) {
    config.timeLimitSeconds = 120.0;
    config.logLevel = 1;
}

// ---------------------------------------------------------
// FUNCIONES AUXILIARES
// ---------------------------------------------------------

void Menu::mostrarEncabezado() const {
    cout << "\n========================================================" << endl;
    cout << "     RUTEO DE VEHICULOS CON CAPACIDAD (MIP + CBC)       " << endl;
    cout << "========================================================" << endl;
    if (instanciaCargada) {
        cout << "[Estado] Instancia: " << instancia.getName()
             << " | N=" << instancia.getDimension()
             << " | K=" << instancia.getNumVehicles()
             << " | Qmax=" << instancia.getMaxCapacity()
             << (instancia.requiresAllVehicles() ? " | flota obligatoria" : "") << endl;
    } else {
        cout << "[Estado] Ninguna instancia cargada." << endl;
    }
    cout << "[Estado] Tiempo limite: " << config.timeLimitSeconds << "s | Gap objetivo: "
         << 100.0 * config.relativeGap << "%" << endl;
    if (hasRoutes(ultimaSolucion.getStatus())) {
        cout << "[Estado] Ultima solucion (" << toString(ultimaSolucion.getStatus()) << "): "
             << ultimaSolucion.getTotalCost() << endl;
    }
    cout << "--------------------------------------------------------" << endl;
}

void Menu::limpiarEntrada() const {
    cin.clear();
    cin.ignore(numeric_limits<streamsize>::max(), '\n');
}

// ---------------------------------------------------------
// OPCIONES DEL MENÚ
// ---------------------------------------------------------

void Menu::cargarInstancia() {
    cout << "\nIngrese la ruta del archivo de la instancia (ej. sets/toy-n4-k2.vrp): ";
    string ruta;
    cin >> ruta;

    try {
        Parser parser(ruta);
        instancia = parser.getInstance();
        instanciaCargada = true;
        ultimaSolucion = Solution(&instancia);
        cout << ">> Archivo cargado correctamente." << endl;
    } catch (const runtime_error& e) {
        cout << ">> Error al cargar el archivo: " << e.what() << endl;
        instanciaCargada = false;
    }
}

void Menu::configurarTiempo() {
    cout << "\nIngrese el nuevo tiempo limite en segundos (actual " << config.timeLimitSeconds << "s): ";
    double nuevoTiempo;
    if (cin >> nuevoTiempo && nuevoTiempo > 0) {
        config.timeLimitSeconds = nuevoTiempo;
        cout << ">> Tiempo limite actualizado a " << config.timeLimitSeconds << " segundos." << endl;
    } else {
        cout << ">> Entrada invalida. Mantenido en " << config.timeLimitSeconds << "s." << endl;
        limpiarEntrada();
    }
}

void Menu::configurarGap() {
    cout << "\nIngrese el gap relativo objetivo en % (0 = probar optimalidad): ";
    double gapPct;
    if (cin >> gapPct && gapPct >= 0.0 && gapPct < 100.0) {
        config.relativeGap = gapPct / 100.0;
        cout << ">> Gap objetivo actualizado a " << gapPct << "%." << endl;
    } else {
        cout << ">> Entrada invalida. Gap sin cambios." << endl;
        limpiarEntrada();
    }
}

void Menu::alternarFlotaObligatoria() {
    instancia.setRequireAllVehicles(!instancia.requiresAllVehicles());
    cout << ">> Flota obligatoria: " << (instancia.requiresAllVehicles() ? "SI" : "NO") << endl;
}

void Menu::ejecutarCbc() {
    cout << "\n--- Resolviendo modelo MIP con CBC ---" << endl;
    cout << "Usando limite de tiempo de " << config.timeLimitSeconds << "s." << endl;

    try {
        VrpSolver solver(&instancia, config);
        Solution sol = solver.solve();
        const SearchSummary& resumen = sol.getSummary();

        cout << "\n>> Estado: " << toString(resumen.status) << endl;
        if (hasRoutes(resumen.status)) {
            sol.print();
            cout << ">> Cota inferior: " << resumen.bestBound
                 << " | GAP: " << fixed << setprecision(3) << 100.0 * resumen.gap << "%" << endl;
        } else if (resumen.status == SolveStatus::Infeasible) {
            cout << ">> CBC probo que la instancia no tiene solucion." << endl;
        } else {
            cout << ">> Se agoto el presupuesto sin encontrar solucion." << endl;
        }
        cout << ">> Tiempo de ejecucion: " << fixed << setprecision(3) << resumen.seconds << " segundos." << endl;
        ultimaSolucion = sol;
    } catch (const InfeasibleInstance& e) {
        cout << ">> Instancia infactible: " << e.what() << endl;
    } catch (const BuilderError& e) {
        cout << ">> Datos invalidos: " << e.what() << endl;
    } catch (const VrpError& e) {
        cout << ">> [DEFECTO] Resultado inconsistente de CBC: " << e.what() << endl;
    } catch (const invalid_argument& e) {
        cout << ">> Configuracion invalida: " << e.what() << endl;
    }
}

void Menu::ingresoManual() {
    cout << "\n--- Ingreso de Rutas Manual ---" << endl;
    // Limpiamos el buffer del enter
    cin.ignore(numeric_limits<streamsize>::max(), '\n');

    Solution solucionManual(&instancia);

    cout << "Para cada vehiculo, ingrese los ID de los clientes visitados separados por espacio." << endl;
    cout << "(NOTA: la bodega '0' se agrega automaticamente; linea vacia = vehiculo sin usar)" << endl;

    for (const auto& vehiculo : instancia.getFleet()) {
        cout << "Ruta del Vehiculo " << vehiculo.getId() << " (Q=" << vehiculo.getCapacity() << "): ";
        string linea;
        getline(cin, linea);

        stringstream ss(linea);
        int clienteId;
        Route ruta(vehiculo, &instancia);

        while (ss >> clienteId) {
            if (clienteId == DEPOT_ID) continue;
            if (clienteId < 0 || clienteId >= instancia.getDimension()) {
                cout << "  [Advertencia] Cliente " << clienteId << " fuera de rango, ignorado" << endl;
                continue;
            }
            if (!ruta.addClient(clienteId)) {
                cout << "  [Advertencia] Capacidad excedida al intentar agregar el cliente " << clienteId << endl;
            }
        }
        solucionManual.addRoute(ruta);
    }

    cout << "\n>> Validando ruteo manual..." << endl;
    if (solucionManual.isValid()) {
        cout << ">> ESTADO: SOLUCION FACTIBLE Y VALIDA" << endl;
    } else {
        cout << ">> ESTADO: SOLUCION INVALIDA (Verifique capacidades, clientes faltantes o repetidos)" << endl;
    }

    cout << ">> Costo Total Evaluado (Z): " << solucionManual.getTotalCost() << endl;
    solucionManual.print();
}

void Menu::exportarSolucion() {
    if (!hasRoutes(ultimaSolucion.getStatus())) {
        cout << ">> Error: No hay una solucion de CBC para exportar." << endl;
        return;
    }
    cout << "\nIngrese la ruta del archivo de salida (ej. toy.sol): ";
    string ruta;
    cin >> ruta;
    try {
        ultimaSolucion.writeSolutionFile(ruta);
        cout << ">> Solucion escrita en " << ruta << endl;
    } catch (const runtime_error& e) {
        cout << ">> Error al escribir: " << e.what() << endl;
    }
}

// ---------------------------------------------------------
// BUCLE PRINCIPAL
// ---------------------------------------------------------

void Menu::inicializar() {
    string opcion;

    while (true) {
        mostrarEncabezado();
        cout << "1. Cargar archivo (instancia VRP)" << endl;
        cout << "2. Resolver con modelo MIP (CBC)" << endl;
        cout << "3. Ingreso de Ruteo Manual y calculo de costo" << endl;
        cout << "4. Ajustar Limite de Tiempo (Actual: " << config.timeLimitSeconds << "s)" << endl;
        cout << "5. Ajustar Gap objetivo" << endl;
        cout << "6. Alternar flota obligatoria" << endl;
        cout << "7. Exportar ultima solucion (.sol)" << endl;
        cout << "8. Salir" << endl;
        cout << "\nSeleccione una opcion: ";

        if (!(cin >> opcion)) {
            cout << endl;
            break;
        }

        if (opcion == "1") {
            cargarInstancia();
        }
        else if (opcion == "2") {
            if (!instanciaCargada) { cout << ">> Error: Debe cargar una instancia primero.\n"; continue; }
            ejecutarCbc();
        }
        else if (opcion == "3") {
            if (!instanciaCargada) { cout << ">> Error: Debe cargar una instancia primero.\n"; continue; }
            ingresoManual();
        }
        else if (opcion == "4") {
            configurarTiempo();
        }
        else if (opcion == "5") {
            configurarGap();
        }
        else if (opcion == "6") {
            if (!instanciaCargada) { cout << ">> Error: Debe cargar una instancia primero.\n"; continue; }
            alternarFlotaObligatoria();
        }
        else if (opcion == "7") {
            exportarSolucion();
        }
        else if (opcion == "8") {
            cout << ">> Saliendo del sistema CVRP. ¡Hasta luego!" << endl;
            break;
        }
        else {
            cout << ">> Opcion no valida. Intente de nuevo." << endl;
        }
    }
}
