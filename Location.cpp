#include "Location.h"

Location::Location() : id(0), x(0.0), y(0.0) {}

Location::Location(int id, double x, double y) : id(id), x(x), y(y) {}

int Location::getId() const { return id; }
double Location::getX() const { return x; }
double Location::getY() const { return y; }
bool Location::isDepot() const { return id == 0; }
