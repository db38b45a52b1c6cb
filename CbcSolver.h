#ifndef CBC_SOLVER_H
#define CBC_SOLVER_H

#include <string>
#include <utility>
#include <vector>
#include <coin/CbcModel.hpp>
#include <coin/CbcEventHandler.hpp>
#include <coin/CglCutGenerator.hpp>
#include "ModelBuilder.h"
#include "SearchConfig.h"
#include "SolveStatus.h"

// Resultado crudo de CBC: estado y asignacion sin decodificar
struct SolveResult {
    SearchSummary summary;
    std::vector<double> assignment;  // copia sin modificar de bestSolution()

    bool hasAssignment() const { return !assignment.empty(); }
};

// ─────────────────────────────────────────────────────────────
// CbcProgressHandler
// Reporta nodos, cotas y gap cada `reportEvery` nodos, y cada
// nueva solucion incumbente.
// ─────────────────────────────────────────────────────────────
class CbcProgressHandler : public CbcEventHandler {
public:
    explicit CbcProgressHandler(int reportEvery = 1000);

    CbcAction event(CbcEvent whichEvent) override;
    CbcEventHandler* clone() const override;

private:
    int reportEvery;
    int lastReportNodes;
};

// ─────────────────────────────────────────────────────────────
// CbcSolver
// Adaptador delgado sobre CbcModel. No decodifica rutas: expone el
// estado y la asignacion tal como los entrega CBC.
// ─────────────────────────────────────────────────────────────
class CbcSolver {
private:
    SearchConfig config;
    std::vector<std::pair<CglCutGenerator*, std::string>> extraCutGenerators; // no son dueños
    std::vector<double> mipStart;
    double mipStartObjective;

    static double relativeGap(double objective, double bound);

public:
    explicit CbcSolver(const SearchConfig& config);

    // Generador adicional (ej. SubtourCutGenerator); debe vivir hasta solve()
    void addCutGenerator(CglCutGenerator* generator, const std::string& name);

    // Solucion inicial completa (todas las columnas) y su costo
    void setMipStart(const std::vector<double>& values, double objective);

    // Bloquea hasta terminar o agotar el presupuesto. El modelo no se modifica:
    // CbcModel trabaja sobre una copia.
    SolveResult solve(const BuiltModel& model);
};

#endif // CBC_SOLVER_H
