#ifndef SEARCH_CONFIG_H
#define SEARCH_CONFIG_H

#include <string>

// Parametros de una resolucion con CBC
struct SearchConfig {
    double timeLimitSeconds = 10.0;  // presupuesto de tiempo
    int maxNodes = -1;               // presupuesto de nodos B&B (-1 = sin limite)
    double relativeGap = 0.0;        // gap objetivo (0 = probar optimalidad)
    int logLevel = 0;                // 0 silencioso, 1 progreso, >1 log de CBC

    bool useSubtourCuts = true;      // SubtourCutGenerator (DFJ + capacidad)
    bool useCglCuts = true;          // Gomory, MIR, Clique
    bool useHeuristics = true;       // Feasibility Pump, RINS
    bool useWarmStart = true;        // Clarke-Wright como solucion inicial

    std::string lpExportPath;        // si no esta vacio, escribe <ruta>.lp

    // Lanza std::invalid_argument si algun parametro es invalido
    void validate() const;
};

#endif // SEARCH_CONFIG_H
