#pragma once
#include <vector>
#include "fleet.hpp"
#include "routes.hpp"

struct Feasibility {
    bool weight_ok = false;
    bool distance_ok = false;
    bool deadline_ok = false;
    bool overall = false;
};

// Route indices into RouteTable::routes that one drone can fly, in table order.
struct DroneRoutes {
    int drone_id;
    std::vector<int> feasible;
};

bool deadlines_met(const Route& r, double speed);

Feasibility evaluate_route(const Route& r, const Drone& d);

DroneRoutes feasible_routes_for(const RouteTable& table, const Drone& d);

// One entry per drone, in drone order. workers > 1 spreads drones over async tasks.
std::vector<DroneRoutes> feasible_routes(const RouteTable& table,
                                         const std::vector<Drone>& drones,
                                         int workers = 1);
