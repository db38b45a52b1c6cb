#ifndef LOCATION_H
#define LOCATION_H

// Punto de la instancia. El id 0 esta reservado para la bodega.
class Location {
private:
    int id;
    double x;
    double y;

public:
    // Constructores
    Location();
    Location(int id, double x, double y);

    // Getters
    int getId() const;
    double getX() const;
    double getY() const;
    bool isDepot() const;
};

#endif // LOCATION_H
