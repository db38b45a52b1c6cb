#ifndef DISTANCE_MATRIX_H
#define DISTANCE_MATRIX_H

#include <vector>
#include "Location.h"

// Forma de derivar la matriz a partir de coordenadas
enum class DistanceMetric {
    Euclidean,        // sqrt(dx^2 + dy^2) sin redondeo (EXACT_2D)
    EuclideanRounded  // entero mas cercano, convencion TSPLIB (EUC_2D)
};

// Matriz cuadrada N x N de costos de viaje. No se asume simetria:
// get(i, j) y get(j, i) se guardan por separado.
class DistanceMatrix {
private:
    int dimension;
    std::vector<double> values; // fila mayor: values[i * dimension + j]

public:
    DistanceMatrix();
    explicit DistanceMatrix(int dimension);

    // Lanza BuilderError si las filas no forman una matriz cuadrada
    explicit DistanceMatrix(const std::vector<std::vector<double>>& rows);

    static DistanceMatrix fromLocations(const std::vector<Location>& locations,
                                        DistanceMetric metric = DistanceMetric::Euclidean);

    int size() const;
    double get(int fromId, int toId) const;
    void set(int fromId, int toId, double value);

    // Costo de recorrer la secuencia de ids completa
    double pathLength(const std::vector<int>& path) const;
};

#endif // DISTANCE_MATRIX_H
