#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "menu.h"
#include "Parser.h"
#include "SearchConfig.h"
#include "VrpErrors.h"
#include "VrpSolver.h"

using namespace std;

// Codigos de salida del modo batch
static const int EXIT_ROUTES = 0;
static const int EXIT_INPUT_ERROR = 1;
static const int EXIT_INFEASIBLE = 2;
static const int EXIT_UNKNOWN = 3;
static const int EXIT_DEFECT = 4;

template <typename T>
static void getArg(const char* text, const string& flag, T& value) {
    istringstream in(text);
    if (!(in >> value) || !in.eof()) {
        throw invalid_argument("Valor invalido para " + flag + ": '" + string(text) + "'");
    }
}

static void printUsage(const char* program) {
    cerr << "Uso: " << program << "                 (menu interactivo)" << endl
         << "     " << program << " archivo.vrp [opciones]" << endl
         << endl
         << "  -t segundos   limite de tiempo de CBC (default 10)" << endl
         << "  -g gap        gap relativo objetivo, ej. 0.01 (default 0)" << endl
         << "  -n nodos      limite de nodos de B&B (default sin limite)" << endl
         << "  -k vehiculos  reemplaza el numero de vehiculos del archivo" << endl
         << "  -a            todos los vehiculos deben salir de la bodega" << endl
         << "  -v            progreso de CBC (repetir para mas detalle)" << endl
         << "  -o ruta.sol   escribe la solucion en formato CVRPLIB" << endl
         << "  -lp ruta      exporta el modelo (ruta.lp)" << endl;
}

static int runBatch(int argc, char** argv) {
    string filename = argv[1];
    string solutionPath;
    int vehiclesOverride = 0;
    bool requireAll = false;
    SearchConfig config;

    // =========================================================
    // 1. Argumentos
    // =========================================================
    try {
        for (int i = 2; i < argc; ++i) {
            string flag = argv[i];
            bool hasValue = i + 1 < argc;

            if (flag == "-a") {
                requireAll = true;
            } else if (flag == "-v") {
                config.logLevel++;
            } else if (!hasValue) {
                throw invalid_argument("Falta el valor de " + flag);
            } else if (flag == "-t") {
                getArg(argv[++i], flag, config.timeLimitSeconds);
            } else if (flag == "-g") {
                getArg(argv[++i], flag, config.relativeGap);
            } else if (flag == "-n") {
                getArg(argv[++i], flag, config.maxNodes);
            } else if (flag == "-k") {
                getArg(argv[++i], flag, vehiclesOverride);
            } else if (flag == "-o") {
                solutionPath = argv[++i];
            } else if (flag == "-lp") {
                config.lpExportPath = argv[++i];
            } else {
                throw invalid_argument("Opcion desconocida: " + flag);
            }
        }
        config.validate();
    } catch (const invalid_argument& e) {
        cerr << "Error: " << e.what() << endl;
        printUsage(argv[0]);
        return EXIT_INPUT_ERROR;
    }

    // =========================================================
    // 2. Instancia
    // =========================================================
    Instance instance;
    try {
        Parser parser(filename, vehiclesOverride);
        instance = parser.getInstance();
        instance.setRequireAllVehicles(requireAll);
    } catch (const runtime_error& e) {
        cerr << "Error: " << e.what() << endl;
        return EXIT_INPUT_ERROR;
    }

    // =========================================================
    // 3. Resolver
    // =========================================================
    try {
        VrpSolver solver(&instance, config);
        Solution solution = solver.solve();
        SolveStatus status = solution.getStatus();

        cout << "Estado: " << toString(status) << endl;
        if (status == SolveStatus::Infeasible) return EXIT_INFEASIBLE;
        if (!hasRoutes(status)) return EXIT_UNKNOWN;

        solution.print();
        if (!solutionPath.empty()) {
            solution.writeSolutionFile(solutionPath);
            cout << "Solucion escrita en " << solutionPath << endl;
        }
        return EXIT_ROUTES;
    } catch (const InfeasibleInstance& e) {
        cout << "Estado: Infeasible" << endl;
        cerr << "Instancia infactible: " << e.what() << endl;
        return EXIT_INFEASIBLE;
    } catch (const BuilderError& e) {
        cerr << "Error en los datos: " << e.what() << endl;
        return EXIT_INPUT_ERROR;
    } catch (const VrpError& e) {
        // MalformedAssignment / InvariantViolation / ConsistencyError
        cerr << "[DEFECTO] " << e.what() << endl;
        return EXIT_DEFECT;
    } catch (const runtime_error& e) {
        cerr << "Error: " << e.what() << endl;
        return EXIT_INPUT_ERROR;
    }
}

int main(int argc, char** argv) {
    if (argc < 2) {
        Menu menu;
        menu.inicializar();
        return 0;
    }
    string first = argv[1];
    if (first == "-h" || first == "--help") {
        printUsage(argv[0]);
        return 0;
    }
    return runBatch(argc, argv);
}
