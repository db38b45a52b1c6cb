#ifndef MENU_H
#define MENU_H

#include <iostream>
#include <vector>
#include <string>

#include "Parser.h"
#include "SearchConfig.h"
#include "Solution.h"
#include "VrpSolver.h"

class Menu {
private:
    Instance instancia;             // copia editable (modo flota obligatoria)
    Solution ultimaSolucion;
    bool instanciaCargada;
    SearchConfig config;

    // Métodos auxiliares privados
    void mostrarEncabezado() const;
    void limpiarEntrada() const;

    // Opciones del Menú
    void cargarInstancia();
    void configurarTiempo();
    void configurarGap();
    void alternarFlotaObligatoria();
    void ejecutarCbc();
    void ingresoManual();
    void exportarSolucion();

public:
    Menu();
    void inicializar();  // El bucle principal del programa
};

#endif // MENU_H
