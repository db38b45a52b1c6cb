#ifndef VEHICLE_H
#define VEHICLE_H

class Vehicle {
private:
    int id;
    int capacity;  // Capacidad Q_k del vehiculo

public:
    Vehicle();
    Vehicle(int id, int capacity);

    int getId() const;
    int getCapacity() const;
};

#endif // VEHICLE_H
