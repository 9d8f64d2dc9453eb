#pragma once
#include <cstdint>
#include <functional>
#include <vector>
#include "feasibility.hpp"
#include "routes.hpp"

const int IDLE = -1;

// choice[k] is a route index for the k-th drone, or IDLE.
struct Assignment {
    std::vector<int> choice;
};

struct EnumerationResult {
    std::vector<Assignment> valid;   // cross product order, last drone varies fastest
    double cross_product_size = 0.0;
};

bool is_disjoint(const RouteTable& table, const Assignment& a);

double cross_product_size(const std::vector<DroneRoutes>& per_drone);

// Calls visit once per valid assignment, in the same order enumerate_assignments
// stores them. The assignment passed in is reused between calls.
void for_each_assignment(const RouteTable& table,
                         const std::vector<DroneRoutes>& per_drone,
                         const std::function<void(const Assignment&)>& visit);

EnumerationResult enumerate_assignments(const RouteTable& table,
                                        const std::vector<DroneRoutes>& per_drone);
