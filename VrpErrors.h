#ifndef VRP_ERRORS_H
#define VRP_ERRORS_H

#include <stdexcept>
#include <string>

// =============================================================================
// Jerarquia de errores del nucleo VRP
// =============================================================================
//   BuilderError / InfeasibleInstance   -> antes de la busqueda (fatales)
//   MalformedAssignment / InvariantViolation / ConsistencyError
//                                       -> despues de la busqueda (defectos)
//
// Los resultados Infeasible / Unknown de CBC NO son excepciones: viajan como
// SolveStatus dentro de SolveResult / Solution.
// =============================================================================

class VrpError : public std::runtime_error {
public:
    explicit VrpError(const std::string& message) : std::runtime_error(message) {}
};

// Datos de entrada mal formados (tamaños, valores negativos, ids)
class BuilderError : public VrpError {
public:
    explicit BuilderError(const std::string& message) : VrpError(message) {}
};

// Instancia sin solucion posible, detectado antes de invocar a CBC
class InfeasibleInstance : public VrpError {
private:
    int locationId; // -1 si la causa no es un cliente concreto

public:
    InfeasibleInstance(const std::string& message, int locationId = -1)
        : VrpError(message), locationId(locationId) {}

    int getLocationId() const { return locationId; }
};

// La asignacion de CBC no se puede decodificar en rutas
class MalformedAssignment : public VrpError {
private:
    int vehicleId;

public:
    MalformedAssignment(const std::string& message, int vehicleId = -1)
        : VrpError(message), vehicleId(vehicleId) {}

    int getVehicleId() const { return vehicleId; }
};

// Rutas decodificadas que rompen cobertura o capacidad
class InvariantViolation : public VrpError {
public:
    explicit InvariantViolation(const std::string& message) : VrpError(message) {}
};

// Distancia recalculada distinta del objetivo reportado por CBC
class ConsistencyError : public VrpError {
public:
    explicit ConsistencyError(const std::string& message) : VrpError(message) {}
};

#endif // VRP_ERRORS_H
