#ifndef MODEL_BUILDER_H
#define MODEL_BUILDER_H

#include <memory>
#include <string>
#include <vector>
#include <coin/OsiClpSolverInterface.hpp>
#include "Instance.h"

class Solution;

// Mapea (vehiculo, origen, destino) con origen != destino a la columna
// binaria x(k,i,j) del modelo. Solo se registran arcos reales: no existen
// columnas para i == j.
class ArcVariableMap {
private:
    int numVehicles;
    int numLocations;
    int firstColumn;

public:
    ArcVariableMap();
    ArcVariableMap(int numVehicles, int numLocations, int firstColumn);

    // Lanza std::out_of_range si el arco no esta registrado
    int getColumn(int vehicle, int fromId, int toId) const;

    int getNumArcs() const;
    int getNumVehicles() const;
    int getNumLocations() const;
    int getFirstColumn() const;
};

// Columnas auxiliares w(k,i): carga acumulada (en ticks) del vehiculo k al
// salir del cliente i. Solo existen para clientes, no para la bodega.
class LoadVariableMap {
private:
    int numVehicles;
    int numCustomers;
    int firstColumn;

public:
    LoadVariableMap();
    LoadVariableMap(int numVehicles, int numCustomers, int firstColumn);

    int getColumn(int vehicle, int customerId) const;
    int getNumColumns() const;
    int getFirstColumn() const;
};

// Modelo listo para CBC. Es dueño de la interfaz OSI: se libera al salir
// de alcance, un modelo nuevo por resolucion.
struct BuiltModel {
    std::unique_ptr<OsiClpSolverInterface> solver;
    ArcVariableMap arcs;
    LoadVariableMap loads;
    double loadScale;  // ticks por unidad de demanda (S = clientes + 1)

    int getNumColumns() const { return solver->getNumCols(); }
    int getNumRows() const { return solver->getNumRows(); }
};

// =============================================================================
// ModelBuilder
// =============================================================================
// Formulacion de tres indices x(k,i,j) para CVRP con flota heterogenea:
//
//   min  sum_k sum_{i!=j} c_ij x_kij
//   A. visita unica      sum_k sum_j x_kji = 1,  sum_k sum_j x_kij = 1
//   B. bodega            sum_j x_k0j - sum_j x_kj0 = 0,  sum_j x_k0j en [0,1]
//   C. conservacion      sum_j x_kji - sum_j x_kij = 0   (por vehiculo y cliente)
//   D. capacidad         sum_{i,j} d_j x_kij <= Q_k
//   E. carga (MTZ)       w_kj >= w_ki + t_j - M_k (1 - x_kij)
//   F. 2-ciclos          sum_k (x_kij + x_kji) <= 1
//
// La carga se mide en ticks: visitar j suma t_j = S*d_j + 1, con S = C + 1.
// Como cada visita suma al menos un tick, la carga crece estrictamente a lo
// largo de la ruta y ningun ciclo puede evitar la bodega (aun con demandas 0).
// Con w_ki <= S*Q_k + S - 1 la suma de demandas de la ruta queda <= Q_k.
// =============================================================================
class ModelBuilder {
private:
    const Instance* instance;

    void validateInput() const;

    double loadScale() const;
    double loadTicks(int customerId) const;        // t_i = S*d_i + 1
    double loadUpperBound(int vehicle) const;      // M_k = S*Q_k + S - 1

    // Poda estatica: clientes que no caben en el vehiculo, solos o en pareja
    bool arcAllowed(int vehicle, int fromId, int toId) const;

public:
    explicit ModelBuilder(const Instance* instance);

    // Lanza BuilderError o InfeasibleInstance antes de crear el modelo
    BuiltModel build() const;

    // Codifica rutas (una por vehiculo) como vector completo de columnas,
    // con la carga acumulada consistente. Sirve como MIP start.
    std::vector<double> encodeSolution(const BuiltModel& model, const Solution& solution) const;
};

#endif // MODEL_BUILDER_H
