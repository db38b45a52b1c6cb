#include "ModelBuilder.h"
#include "Solution.h"
#include "VrpErrors.h"

#include <cmath>
#include <stdexcept>
#include <coin/CoinPackedMatrix.hpp>

using namespace std;

// =============================================================================
// ArcVariableMap / LoadVariableMap
// =============================================================================
ArcVariableMap::ArcVariableMap() : numVehicles(0), numLocations(0), firstColumn(0) {}

ArcVariableMap::ArcVariableMap(int numVehicles, int numLocations, int firstColumn)
    : numVehicles(numVehicles), numLocations(numLocations), firstColumn(firstColumn) {}

int ArcVariableMap::getColumn(int vehicle, int fromId, int toId) const {
    if (vehicle < 0 || vehicle >= numVehicles ||
        fromId < 0 || fromId >= numLocations ||
        toId < 0 || toId >= numLocations || fromId == toId) {
        throw out_of_range("Arco no registrado: vehiculo " + to_string(vehicle) + ", " +
                           to_string(fromId) + " -> " + to_string(toId));
    }
    // Cada origen tiene N-1 destinos: se salta la diagonal
    int offset = (toId < fromId) ? toId : toId - 1;
    return firstColumn + (vehicle * numLocations + fromId) * (numLocations - 1) + offset;
}

int ArcVariableMap::getNumArcs() const { return numVehicles * numLocations * (numLocations - 1); }
int ArcVariableMap::getNumVehicles() const { return numVehicles; }
int ArcVariableMap::getNumLocations() const { return numLocations; }
int ArcVariableMap::getFirstColumn() const { return firstColumn; }

LoadVariableMap::LoadVariableMap() : numVehicles(0), numCustomers(0), firstColumn(0) {}

LoadVariableMap::LoadVariableMap(int numVehicles, int numCustomers, int firstColumn)
    : numVehicles(numVehicles), numCustomers(numCustomers), firstColumn(firstColumn) {}

int LoadVariableMap::getColumn(int vehicle, int customerId) const {
    if (vehicle < 0 || vehicle >= numVehicles || customerId < 1 || customerId > numCustomers) {
        throw out_of_range("Carga no registrada: vehiculo " + to_string(vehicle) +
                           ", cliente " + to_string(customerId));
    }
    return firstColumn + vehicle * numCustomers + (customerId - 1);
}

int LoadVariableMap::getNumColumns() const { return numVehicles * numCustomers; }
int LoadVariableMap::getFirstColumn() const { return firstColumn; }

// =============================================================================
// Filas del modelo en formato CoinPackedMatrix (por filas)
// =============================================================================
namespace {

struct RowBuffer {
    CoinPackedMatrix matrix;
    vector<double> lower;
    vector<double> upper;
    vector<string> names;

    explicit RowBuffer(int numColumns) : matrix(false, 0, 0) {
        matrix.setDimensions(0, numColumns);
    }

    void add(const vector<int>& indices, const vector<double>& elements,
             double lo, double up, const string& name) {
        if (indices.empty()) return;
        matrix.appendRow(static_cast<int>(indices.size()), indices.data(), elements.data());
        lower.push_back(lo);
        upper.push_back(up);
        names.push_back(name);
    }
};

}

// =============================================================================
// ModelBuilder
// =============================================================================
ModelBuilder::ModelBuilder(const Instance* instance) : instance(instance) {}

void ModelBuilder::validateInput() const {
    if (!instance) {
        throw BuilderError("No hay instancia que modelar");
    }

    const vector<Location>& locations = instance->getLocations();
    const vector<int>& demands = instance->getDemands();
    const vector<Vehicle>& fleet = instance->getFleet();
    const DistanceMatrix& distances = instance->getDistanceMatrix();
    int n = instance->getDimension();

    if (n < 2) {
        throw BuilderError("Se requiere la bodega y al menos un cliente");
    }
    if (fleet.empty()) {
        throw BuilderError("La flota no puede estar vacia");
    }
    for (int i = 0; i < n; ++i) {
        if (locations[i].getId() != i) {
            throw BuilderError("El punto en la posicion " + to_string(i) +
                               " tiene id " + to_string(locations[i].getId()));
        }
    }
    if (static_cast<int>(demands.size()) != n) {
        throw BuilderError("El vector de demandas tiene " + to_string(demands.size()) +
                           " entradas y hay " + to_string(n) + " puntos");
    }
    if (demands[DEPOT_ID] != 0) {
        throw BuilderError("La demanda de la bodega debe ser 0");
    }
    for (int i = 1; i < n; ++i) {
        if (demands[i] < 0) {
            throw BuilderError("Demanda negativa en el cliente " + to_string(i));
        }
    }
    for (const auto& vehicle : fleet) {
        if (vehicle.getCapacity() < 0) {
            throw BuilderError("Capacidad negativa en el vehiculo " + to_string(vehicle.getId()));
        }
    }
    if (distances.size() != n) {
        throw BuilderError("La matriz de distancias es de " + to_string(distances.size()) +
                           "x" + to_string(distances.size()) + " y hay " + to_string(n) + " puntos");
    }
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            if (i == j) continue;
            double d = distances.get(i, j);
            if (!std::isfinite(d) || d < 0.0) {
                throw BuilderError("Distancia invalida entre " + to_string(i) + " y " + to_string(j));
            }
        }
    }

    // Factibilidad evidente: fallar antes de entregar el modelo a CBC
    int maxCapacity = instance->getMaxCapacity();
    for (int i = 1; i < n; ++i) {
        if (demands[i] > maxCapacity) {
            throw InfeasibleInstance("El cliente " + to_string(i) + " tiene demanda " +
                                     to_string(demands[i]) + " y ningun vehiculo la soporta (capacidad maxima " +
                                     to_string(maxCapacity) + ")", i);
        }
    }
    if (instance->requiresAllVehicles() && instance->getNumCustomers() < instance->getNumVehicles()) {
        throw InfeasibleInstance("Se exige usar los " + to_string(instance->getNumVehicles()) +
                                 " vehiculos pero solo hay " + to_string(instance->getNumCustomers()) +
                                 " clientes");
    }
}

double ModelBuilder::loadScale() const {
    return static_cast<double>(instance->getNumCustomers() + 1);
}

double ModelBuilder::loadTicks(int customerId) const {
    return loadScale() * instance->getDemand(customerId) + 1.0;
}

double ModelBuilder::loadUpperBound(int vehicle) const {
    double S = loadScale();
    return S * instance->getFleet()[vehicle].getCapacity() + S - 1.0;
}

bool ModelBuilder::arcAllowed(int vehicle, int fromId, int toId) const {
    int Q = instance->getFleet()[vehicle].getCapacity();
    int dFrom = (fromId == DEPOT_ID) ? 0 : instance->getDemand(fromId);
    int dTo = (toId == DEPOT_ID) ? 0 : instance->getDemand(toId);

    if (dFrom > Q || dTo > Q) return false;
    // Dos clientes adyacentes comparten vehiculo: juntos deben caber
    return static_cast<long>(dFrom) + dTo <= Q;
}

BuiltModel ModelBuilder::build() const {
    validateInput();

    const int N = instance->getDimension();
    const int C = instance->getNumCustomers();
    const int K = instance->getNumVehicles();

    BuiltModel model;
    model.arcs = ArcVariableMap(K, N, 0);
    model.loads = LoadVariableMap(K, C, model.arcs.getNumArcs());
    model.loadScale = loadScale();

    const int numColumns = model.arcs.getNumArcs() + model.loads.getNumColumns();

    // =========================================================
    // 1. Columnas: arcos x(k,i,j) y cargas w(k,i)
    // =========================================================
    vector<double> objective(numColumns, 0.0);
    vector<double> colLower(numColumns, 0.0);
    vector<double> colUpper(numColumns, 1.0);
    vector<string> colNames(numColumns);

    for (int k = 0; k < K; ++k) {
        for (int i = 0; i < N; ++i) {
            for (int j = 0; j < N; ++j) {
                if (i == j) continue;
                int idx = model.arcs.getColumn(k, i, j);
                objective[idx] = instance->getDistance(i, j);
                colUpper[idx] = arcAllowed(k, i, j) ? 1.0 : 0.0;
                colNames[idx] = "x_" + to_string(i) + "_" + to_string(j) + "_v" + to_string(k);
            }
        }
        for (int i = 1; i < N; ++i) {
            int idx = model.loads.getColumn(k, i);
            if (instance->getDemand(i) > instance->getFleet()[k].getCapacity()) {
                colUpper[idx] = 0.0; // el vehiculo k nunca visita a i
            } else {
                colLower[idx] = loadTicks(i);
                colUpper[idx] = loadUpperBound(k);
            }
            colNames[idx] = "w_" + to_string(i) + "_v" + to_string(k);
        }
    }

    RowBuffer rows(numColumns);

    // =========================================================
    // 2. A. Visita unica: una entrada y una salida por cliente
    // =========================================================
    for (int i = 1; i < N; ++i) {
        vector<int> indicesIn, indicesOut;
        for (int k = 0; k < K; ++k) {
            for (int j = 0; j < N; ++j) {
                if (i == j) continue;
                indicesIn.push_back(model.arcs.getColumn(k, j, i));
                indicesOut.push_back(model.arcs.getColumn(k, i, j));
            }
        }
        rows.add(indicesIn, vector<double>(indicesIn.size(), 1.0), 1.0, 1.0, "entra_" + to_string(i));
        rows.add(indicesOut, vector<double>(indicesOut.size(), 1.0), 1.0, 1.0, "sale_" + to_string(i));
    }

    // =========================================================
    // 3. B. Bodega: cada vehiculo sale y vuelve a lo sumo una vez
    // =========================================================
    double minDepartures = instance->requiresAllVehicles() ? 1.0 : 0.0;
    for (int k = 0; k < K; ++k) {
        vector<int> departures, balance;
        vector<double> balanceEl;
        for (int j = 1; j < N; ++j) {
            departures.push_back(model.arcs.getColumn(k, DEPOT_ID, j));
            balance.push_back(model.arcs.getColumn(k, DEPOT_ID, j)); balanceEl.push_back(1.0);
            balance.push_back(model.arcs.getColumn(k, j, DEPOT_ID)); balanceEl.push_back(-1.0);
        }
        rows.add(departures, vector<double>(departures.size(), 1.0), minDepartures, 1.0,
                 "bodega_sale_v" + to_string(k));
        rows.add(balance, balanceEl, 0.0, 0.0, "bodega_balance_v" + to_string(k));
    }

    // =========================================================
    // 4. C. Conservacion de flujo por vehiculo y cliente
    // =========================================================
    for (int k = 0; k < K; ++k) {
        for (int i = 1; i < N; ++i) {
            vector<int> indices;
            vector<double> elements;
            for (int j = 0; j < N; ++j) {
                if (i == j) continue;
                indices.push_back(model.arcs.getColumn(k, j, i)); elements.push_back(1.0);
                indices.push_back(model.arcs.getColumn(k, i, j)); elements.push_back(-1.0);
            }
            rows.add(indices, elements, 0.0, 0.0, "flujo_" + to_string(i) + "_v" + to_string(k));
        }
    }

    // =========================================================
    // 5. D. Capacidad agregada: demanda de los clientes a los que entra k
    // =========================================================
    for (int k = 0; k < K; ++k) {
        vector<int> indices;
        vector<double> elements;
        for (int i = 0; i < N; ++i) {
            for (int j = 1; j < N; ++j) {
                if (i == j || instance->getDemand(j) == 0) continue;
                indices.push_back(model.arcs.getColumn(k, i, j));
                elements.push_back(instance->getDemand(j));
            }
        }
        rows.add(indices, elements, -COIN_DBL_MAX, instance->getFleet()[k].getCapacity(),
                 "capacidad_v" + to_string(k));
    }

    // =========================================================
    // 6. E. Acumulacion de carga (MTZ levantado, Desrochers & Laporte)
    //    w_kj - w_ki - M x_kij - (M - t_i - t_j) x_kji >= t_j - M
    // =========================================================
    for (int k = 0; k < K; ++k) {
        double M = loadUpperBound(k);
        for (int i = 1; i < N; ++i) {
            for (int j = 1; j < N; ++j) {
                if (i == j || !arcAllowed(k, i, j)) continue;

                double ti = loadTicks(i);
                double tj = loadTicks(j);
                double lift = M - ti - tj;

                vector<int> indices = {model.loads.getColumn(k, j), model.loads.getColumn(k, i),
                                       model.arcs.getColumn(k, i, j)};
                vector<double> elements = {1.0, -1.0, -M};
                if (lift > 0.0) {
                    indices.push_back(model.arcs.getColumn(k, j, i));
                    elements.push_back(-lift);
                }
                rows.add(indices, elements, tj - M, COIN_DBL_MAX,
                         "carga_" + to_string(i) + "_" + to_string(j) + "_v" + to_string(k));
            }
        }
    }

    // =========================================================
    // 7. F. Prohibicion de 2-ciclos entre clientes
    // =========================================================
    for (int i = 1; i < N; ++i) {
        for (int j = i + 1; j < N; ++j) {
            vector<int> indices;
            for (int k = 0; k < K; ++k) {
                if (!arcAllowed(k, i, j)) continue;
                indices.push_back(model.arcs.getColumn(k, i, j));
                indices.push_back(model.arcs.getColumn(k, j, i));
            }
            rows.add(indices, vector<double>(indices.size(), 1.0), -COIN_DBL_MAX, 1.0,
                     "ciclo2_" + to_string(i) + "_" + to_string(j));
        }
    }

    // =========================================================
    // 8. Cargar en OSI y declarar integralidad de los arcos
    //    (las cargas w son continuas: la formulacion no lo necesita)
    // =========================================================
    model.solver.reset(new OsiClpSolverInterface());
    model.solver->setHintParam(OsiDoReducePrint, true, OsiHintTry);
    model.solver->messageHandler()->setLogLevel(0);
    model.solver->loadProblem(rows.matrix, colLower.data(), colUpper.data(), objective.data(),
                              rows.lower.data(), rows.upper.data());
    model.solver->setObjSense(1.0);

    for (int idx = 0; idx < model.arcs.getNumArcs(); ++idx) {
        model.solver->setInteger(idx);
    }
    // Sin disciplina de nombres OSI descarta setColName / setRowName
    model.solver->setIntParam(OsiNameDiscipline, 1);
    for (int idx = 0; idx < numColumns; ++idx) {
        model.solver->setColName(idx, colNames[idx]);
    }
    for (size_t r = 0; r < rows.names.size(); ++r) {
        model.solver->setRowName(static_cast<int>(r), rows.names[r]);
    }

    return model;
}

vector<double> ModelBuilder::encodeSolution(const BuiltModel& model, const Solution& solution) const {
    const vector<Route>& routes = solution.getRoutes();
    if (static_cast<int>(routes.size()) != model.arcs.getNumVehicles()) {
        throw invalid_argument("Se esperaba una ruta por vehiculo para codificar la solucion");
    }

    vector<double> values(model.getNumColumns(), 0.0);

    // Clientes no visitados por k: carga en su cota inferior
    const double* colLower = model.solver->getColLower();
    for (int k = 0; k < model.arcs.getNumVehicles(); ++k) {
        for (int i = 1; i < model.arcs.getNumLocations(); ++i) {
            int idx = model.loads.getColumn(k, i);
            values[idx] = colLower[idx];
        }
    }

    for (size_t k = 0; k < routes.size(); ++k) {
        const vector<int>& path = routes[k].getPath();
        double ticks = 0.0;
        for (size_t p = 0; p + 1 < path.size(); ++p) {
            if (path[p] == path[p + 1]) continue; // ruta vacia [0, 0]
            values[model.arcs.getColumn(static_cast<int>(k), path[p], path[p + 1])] = 1.0;
            if (path[p + 1] != DEPOT_ID) {
                ticks += loadTicks(path[p + 1]);
                values[model.loads.getColumn(static_cast<int>(k), path[p + 1])] = ticks;
            }
        }
    }
    return values;
}
