#ifndef SOLVE_STATUS_H
#define SOLVE_STATUS_H

#include <string>

// Resultado de la busqueda de CBC
enum class SolveStatus {
    Optimal,     // optimo probado
    Feasible,    // solucion entera sin prueba de optimalidad
    Infeasible,  // CBC prueba que no existe solucion
    Unknown      // presupuesto agotado sin solucion (incluye timeout)
};

inline std::string toString(SolveStatus status) {
    switch (status) {
        case SolveStatus::Optimal:    return "Optimal";
        case SolveStatus::Feasible:   return "Feasible";
        case SolveStatus::Infeasible: return "Infeasible";
        case SolveStatus::Unknown:    return "Unknown";
    }
    return "Unknown";
}

// Solo estos dos estados traen rutas que dibujar
inline bool hasRoutes(SolveStatus status) {
    return status == SolveStatus::Optimal || status == SolveStatus::Feasible;
}

// Resumen numerico de una busqueda, independiente de COIN-OR
struct SearchSummary {
    SolveStatus status = SolveStatus::Unknown;
    double objectiveValue = 0.0;  // valido solo si hasRoutes(status)
    double bestBound = 0.0;
    double gap = 1.0;             // gap relativo final
    int nodeCount = 0;
    double seconds = 0.0;
    bool limitReached = false;    // tiempo o nodos agotados
};

#endif // SOLVE_STATUS_H
