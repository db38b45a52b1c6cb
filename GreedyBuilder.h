#ifndef GREEDY_BUILDER_H
#define GREEDY_BUILDER_H

#include "Instance.h"
#include "Solution.h"
#include <vector>

// Solucion inicial Clarke-Wright para usar como MIP start en CBC.
// Puede no ser valida (flota insuficiente tras fusionar): el llamador
// debe revisar Solution::isValid() antes de usarla.
class GreedyBuilder {
private:
    const Instance* instance;

    // Asigna cada ruta fusionada a un vehiculo (best-fit decreciente).
    // Retorna -1 en la posicion de las rutas que no caben.
    std::vector<int> assignVehicles(const std::vector<int>& routeLoads) const;

public:
    explicit GreedyBuilder(const Instance* instance);

    Solution buildSolution() const;
};

#endif // GREEDY_BUILDER_H
