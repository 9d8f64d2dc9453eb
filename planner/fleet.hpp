#pragma once
#include <vector>

// Coordinates are relative to the depot at the origin.
struct Order {
    int id;
    double x;
    double y;
    double deadline;
    double weight;
};

struct Drone {
    int id;
    double max_payload;
    double max_distance;
    double speed;        // distance per time unit
    bool available = true;
};
