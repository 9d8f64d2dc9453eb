#pragma once
#include <cstddef>
#include <vector>
#include "fleet.hpp"
#include "selector.hpp"

struct PlannerOptions {
    int workers = 1;
    int max_orders = 8;   // the route table grows factorially with the order count
};

struct PlanStats {
    std::size_t route_count = 0;
    std::vector<std::size_t> feasible_per_drone;
    double cross_product_size = 0.0;
    std::size_t valid_assignments = 0;
};

struct DeliveryPlan {
    std::vector<DronePlan> drones;   // one per available drone, input order
    AssignmentSummary summary;
    int num_orders = 0;
    PlanStats stats;
};

// Exhaustive search over every route-or-idle choice per drone.
// Throws std::invalid_argument when there are no drones or too many orders.
DeliveryPlan plan_deliveries(const std::vector<Order>& orders,
                             const std::vector<Drone>& drones,
                             const PlannerOptions& opts = PlannerOptions());
