#ifndef SUBTOUR_CUT_H
#define SUBTOUR_CUT_H

#include <vector>
#include <coin/CglCutGenerator.hpp>  // Clase base del plugin CBC
#include <coin/OsiSolverInterface.hpp>
#include <coin/OsiCuts.hpp>
#include <coin/OsiRowCut.hpp>
#include "Instance.h"
#include "ModelBuilder.h"

// =============================================================================
// SubtourCutGenerator
// =============================================================================
// Generador de cortes DFJ (Dantzig-Fulkerson-Johnson) y de capacidad
// redondeada, registrado en CBC como plugin CglCutGenerator.
//
// La formulacion de ModelBuilder ya elimina subtours con la carga acumulada,
// pero su relajacion LP es debil. Estos cortes la refuerzan: para cada
// subconjunto S de clientes que forma un subtour o excede la capacidad en el
// grafo de soporte agregado  y_ij = sum_k x_kij  se agrega
//
//     sum_{i in S, j in S, i!=j}  sum_k x_kij  <=  |S| - k_s
//
// con k_s = max(1, ceil(demanda(S) / Q_max)). Usar la mayor capacidad de la
// flota mantiene el corte valido con vehiculos distintos.
//
// Uso:
//   SubtourCutGenerator subtourGen(&instance, &model.arcs);
//   cbc.addCutGenerator(&subtourGen, "SubtourDFJ");
// =============================================================================

class SubtourCutGenerator : public CglCutGenerator {
public:
    SubtourCutGenerator(const Instance* instance, const ArcVariableMap* arcs);

    // CBC llama a este metodo en cada nodo. Lee la solucion LP del nodo,
    // detecta conjuntos S invalidos y agrega los cortes al objeto `cs`.
    void generateCuts(const OsiSolverInterface& si,
                      OsiCuts& cs,
                      const CglTreeInfo info = CglTreeInfo()) override;

    // CBC clona el generador; toma ownership de la copia.
    CglCutGenerator* clone() const override;

    ~SubtourCutGenerator() override = default;

    // -------------------------------------------------------------------------
    // findInvalidSets
    //
    //   Paso 1: grafo de soporte agregado, arco activo si y_ij > threshold.
    //   Paso 2: BFS desde la bodega.
    //   Paso 3: componentes no alcanzables = subtours.
    //   Paso 4: rutas desde la bodega cuya demanda supera Q_max.
    //
    // Retorna conjuntos de ids de clientes. Publico para poder probarlo
    // sin pasar por CBC.
    // -------------------------------------------------------------------------
    std::vector<std::vector<int>> findInvalidSets(const double* sol, double threshold) const;

    // Vehiculos minimos que necesita S
    int minVehicles(const std::vector<int>& S) const;

private:
    const Instance* instance;
    const ArcVariableMap* arcs;
    int n;  // Numero de puntos (bodega = 0)

    // Suma de x_kij sobre todos los vehiculos
    double aggregatedValue(const double* sol, int i, int j) const;
};

#endif // SUBTOUR_CUT_H
