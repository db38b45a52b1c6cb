#include "Parser.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

using namespace std;

namespace {

string trim(const string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// "CLAVE : valor" -> valor
string valueOf(const string& line) {
    size_t colon = line.find(':');
    return (colon == string::npos) ? "" : trim(line.substr(colon + 1));
}

// Clave en mayusculas, sin ':' ni espacios
string keyOf(const string& line) {
    string key = trim(line.substr(0, line.find(':')));
    transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return toupper(c); });
    return key;
}

int toInt(const string& text, const string& key) {
    try {
        size_t used = 0;
        int value = stoi(text, &used);
        if (trim(text.substr(used)).empty()) return value;
    } catch (const logic_error&) {
        // se reporta abajo con la clave
    }
    throw runtime_error("Valor entero invalido para " + key + ": '" + text + "'");
}

}

Parser::Parser(const string& filename, int vehiclesOverride)
    : filename(filename), dimension(0), capacity(0), numVehicles(0), depotFileId(1), hasDemandSection(false) {
    ifstream vrp(filename);
    if (!vrp.is_open()) {
        throw runtime_error("Error abriendo el archivo: " + filename);
    }
    loadData(vrp);
    buildInstance(vehiclesOverride);
}

Parser::Parser(istream& input, const string& sourceName, int vehiclesOverride)
    : filename(sourceName), dimension(0), capacity(0), numVehicles(0), depotFileId(1), hasDemandSection(false) {
    loadData(input);
    buildInstance(vehiclesOverride);
}

void Parser::checkNodeId(int idx, const string& section) const {
    if (idx < 1 || idx > dimension) {
        throw runtime_error(section + ": nodo " + to_string(idx) + " fuera de 1.." + to_string(dimension));
    }
}

void Parser::loadData(istream& vrp) {
    string line;

    while (getline(vrp, line)) {
        line = trim(line);
        if (line.empty()) continue;

        string key = keyOf(line);

        if (key == "NAME") {
            name = valueOf(line);
        } else if (key == "COMMENT") {
            comment = valueOf(line);
        } else if (key == "TYPE") {
            string type = valueOf(line);
            if (type != "CVRP" && type != "ACVRP") {
                throw runtime_error("Tipo de instancia no soportado: " + type);
            }
        } else if (key == "DIMENSION") {
            dimension = toInt(valueOf(line), key);
            if (dimension < 2) throw runtime_error("DIMENSION debe ser al menos 2");
        } else if (key == "CAPACITY") {
            capacity = toInt(valueOf(line), key);
        } else if (key == "VEHICLES") {
            numVehicles = toInt(valueOf(line), key);
        } else if (key == "EDGE_WEIGHT_TYPE") {
            edgeWeightType = valueOf(line);
        } else if (key == "EDGE_WEIGHT_FORMAT") {
            edgeWeightFormat = valueOf(line);
        } else if (key == "NODE_COORD_SECTION") {
            int idx;
            double x, y;
            for (int i = 0; i < dimension; ++i) {
                if (!(vrp >> idx >> x >> y)) throw runtime_error("NODE_COORD_SECTION incompleta");
                checkNodeId(idx, "NODE_COORD_SECTION");
                if (!coords.emplace(idx, make_pair(x, y)).second) {
                    throw runtime_error("NODE_COORD_SECTION repite el nodo " + to_string(idx));
                }
            }
        } else if (key == "DEMAND_SECTION") {
            int idx, q;
            hasDemandSection = true;
            for (int i = 0; i < dimension; ++i) {
                if (!(vrp >> idx >> q)) throw runtime_error("DEMAND_SECTION incompleta");
                checkNodeId(idx, "DEMAND_SECTION");
                if (!demands.emplace(idx, q).second) {
                    throw runtime_error("DEMAND_SECTION repite el nodo " + to_string(idx));
                }
            }
        } else if (key == "DEPOT_SECTION") {
            // Una sola bodega; el -1 final es opcional
            int id;
            if (!(vrp >> id) || id < 0) throw runtime_error("DEPOT_SECTION sin bodega");
            depotFileId = id;
            vrp >> ws;
            int next = vrp.peek();
            if (next == '-' || isdigit(next)) {
                if (!(vrp >> id)) throw runtime_error("DEPOT_SECTION mal formada");
                if (id != -1) throw runtime_error("Solo se admite una bodega (DEPOT_SECTION)");
            }
            vrp.clear();
        } else if (key == "EDGE_WEIGHT_SECTION") {
            if (edgeWeightFormat != "FULL_MATRIX") {
                throw runtime_error("EDGE_WEIGHT_FORMAT no soportado: '" + edgeWeightFormat + "'");
            }
            explicitWeights.resize(static_cast<size_t>(dimension) * dimension);
            for (auto& w : explicitWeights) {
                if (!(vrp >> w)) throw runtime_error("EDGE_WEIGHT_SECTION incompleta");
            }
        } else if (key == "VEHICLE_CAPACITY_SECTION") {
            // Una linea "k capacidad" por vehiculo; requiere VEHICLES antes
            if (numVehicles <= 0) throw runtime_error("VEHICLE_CAPACITY_SECTION requiere VEHICLES");
            int k, q;
            vehicleCapacities.assign(numVehicles, -1);
            for (int i = 0; i < numVehicles; ++i) {
                if (!(vrp >> k >> q)) throw runtime_error("VEHICLE_CAPACITY_SECTION incompleta");
                if (k < 1 || k > numVehicles || vehicleCapacities[k - 1] != -1) {
                    throw runtime_error("VEHICLE_CAPACITY_SECTION: vehiculo invalido " + to_string(k));
                }
                vehicleCapacities[k - 1] = q;
            }
        } else if (key == "EOF") {
            break;
        }
    }
}

// VEHICLES, luego "-kN" en NAME, luego "No of trucks: N" en COMMENT
int Parser::deduceVehicles() const {
    if (numVehicles > 0) return numVehicles;

    smatch match;
    if (regex_search(name, match, regex("-k([0-9]+)"))) {
        return stoi(match[1].str());
    }
    if (regex_search(comment, match, regex("No of trucks:\\s*([0-9]+)", regex::icase))) {
        return stoi(match[1].str());
    }
    return 0;
}

void Parser::buildInstance(int vehiclesOverride) {
    if (dimension == 0) throw runtime_error("Falta DIMENSION en " + filename);
    if (name.empty()) name = filename;

    if (hasDemandSection && static_cast<int>(demands.size()) != dimension) {
        throw runtime_error("DEMAND_SECTION no cubre los " + to_string(dimension) + " puntos");
    }

    // Orden interno: bodega primero, el resto por id de archivo
    vector<int> fileIds;
    fileIds.push_back(depotFileId);
    for (int id = 1; id <= dimension; ++id) {
        if (id != depotFileId) fileIds.push_back(id);
    }
    if (depotFileId < 1 || depotFileId > dimension) {
        throw runtime_error("La bodega " + to_string(depotFileId) + " esta fuera de DIMENSION");
    }

    vector<Location> locations;
    vector<int> demandVector;
    for (int i = 0; i < dimension; ++i) {
        int fileId = fileIds[i];
        auto c = coords.find(fileId);
        double x = (c != coords.end()) ? c->second.first : 0.0;
        double y = (c != coords.end()) ? c->second.second : 0.0;
        locations.push_back(Location(i, x, y));

        auto d = demands.find(fileId);
        demandVector.push_back((d != demands.end()) ? d->second : 0);
    }

    // Flota
    int k = (vehiclesOverride > 0) ? vehiclesOverride : deduceVehicles();
    if (k <= 0) {
        throw runtime_error("No se pudo determinar el numero de vehiculos de " + filename);
    }
    vector<Vehicle> fleet;
    for (int v = 0; v < k; ++v) {
        bool perVehicle = vehiclesOverride <= 0 && static_cast<int>(vehicleCapacities.size()) == k;
        fleet.push_back(Vehicle(v, perVehicle ? vehicleCapacities[v] : capacity));
    }

    // Distancias
    if (edgeWeightType == "EXPLICIT") {
        if (explicitWeights.empty()) throw runtime_error("EXPLICIT sin EDGE_WEIGHT_SECTION");
        DistanceMatrix matrix(dimension);
        for (int i = 0; i < dimension; ++i) {
            for (int j = 0; j < dimension; ++j) {
                int fi = fileIds[i] - 1;
                int fj = fileIds[j] - 1;
                matrix.set(i, j, explicitWeights[static_cast<size_t>(fi) * dimension + fj]);
            }
        }
        instance = Instance(name, locations, demandVector, fleet, matrix);
    } else if (edgeWeightType == "EUC_2D" || edgeWeightType == "EXACT_2D" || edgeWeightType.empty()) {
        if (static_cast<int>(coords.size()) != dimension) {
            throw runtime_error("NODE_COORD_SECTION no cubre los " + to_string(dimension) + " puntos");
        }
        DistanceMetric metric = (edgeWeightType == "EUC_2D") ? DistanceMetric::EuclideanRounded
                                                             : DistanceMetric::Euclidean;
        instance = Instance(name, locations, demandVector, fleet,
                            DistanceMatrix::fromLocations(locations, metric));
    } else {
        throw runtime_error("EDGE_WEIGHT_TYPE no soportado: " + edgeWeightType);
    }
}

const Instance& Parser::getInstance() const { return instance; }
int Parser::getDimension() const { return dimension; }
int Parser::getCapacity() const { return capacity; }
const string& Parser::getName() const { return name; }
