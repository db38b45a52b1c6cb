#include "Vehicle.h"

Vehicle::Vehicle() : id(0), capacity(0) {}

Vehicle::Vehicle(int id, int capacity) : id(id), capacity(capacity) {}

int Vehicle::getId() const { return id; }
int Vehicle::getCapacity() const { return capacity; }
