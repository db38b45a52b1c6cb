#include "DistanceMatrix.h"
#include "VrpErrors.h"
#include <cmath>
#include <string>

using namespace std;

DistanceMatrix::DistanceMatrix() : dimension(0) {}

DistanceMatrix::DistanceMatrix(int dimension)
    : dimension(dimension) {
    if (dimension < 0) {
        throw BuilderError("La dimension de la matriz de distancias no puede ser negativa");
    }
    values.assign(static_cast<size_t>(dimension) * dimension, 0.0);
}

DistanceMatrix::DistanceMatrix(const vector<vector<double>>& rows)
    : dimension(static_cast<int>(rows.size())) {
    values.reserve(rows.size() * rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].size() != rows.size()) {
            throw BuilderError("La matriz de distancias debe ser cuadrada (fila " + to_string(i) +
                               " tiene " + to_string(rows[i].size()) + " columnas, se esperaban " +
                               to_string(rows.size()) + ")");
        }
        values.insert(values.end(), rows[i].begin(), rows[i].end());
    }
}

DistanceMatrix DistanceMatrix::fromLocations(const vector<Location>& locations, DistanceMetric metric) {
    int n = static_cast<int>(locations.size());
    DistanceMatrix matrix(n);

    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            if (i == j) continue;
            double dx = locations[i].getX() - locations[j].getX();
            double dy = locations[i].getY() - locations[j].getY();
            double d = sqrt(dx * dx + dy * dy);
            if (metric == DistanceMetric::EuclideanRounded) {
                d = floor(d + 0.5); // nint() de TSPLIB
            }
            matrix.set(i, j, d);
        }
    }
    return matrix;
}

int DistanceMatrix::size() const { return dimension; }

double DistanceMatrix::get(int fromId, int toId) const {
    return values[static_cast<size_t>(fromId) * dimension + toId];
}

void DistanceMatrix::set(int fromId, int toId, double value) {
    values[static_cast<size_t>(fromId) * dimension + toId] = value;
}

double DistanceMatrix::pathLength(const vector<int>& path) const {
    double total = 0.0;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        total += get(path[i], path[i + 1]);
    }
    return total;
}
