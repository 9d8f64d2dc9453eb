#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "assignment.hpp"
#include "feasibility.hpp"
#include "fleet.hpp"
#include "routes.hpp"

struct AssignmentSummary {
    double total_time = 0.0;
    double total_distance = 0.0;
    uint64_t covered = 0;     // bit i set when orders[i] is flown
    int order_count = 0;
    bool all_orders = false;
};

// Final per-drone entry. order_ids is empty for an idle drone.
struct DronePlan {
    int drone_id;
    std::vector<int> order_ids;
    double total_distance = 0.0;
    double flight_time = 0.0;
};

// Time to reach the last stop; 0 for an idle drone.
double flight_time(const RouteTable& table, int route, const Drone& d);

AssignmentSummary summarize(const RouteTable& table, const std::vector<Drone>& drones,
                            const Assignment& a, int num_orders);

// Index of the chosen assignment: full coverage first, else the most orders,
// then least total time. Ties go to the earliest assignment.
int select_best(const RouteTable& table, const std::vector<Drone>& drones,
                const std::vector<Assignment>& assignments, int num_orders);

struct StreamedSelection {
    Assignment best;
    AssignmentSummary summary;
    std::size_t visited = 0;   // valid assignments seen
};

// Same choice as select_best over enumerate_assignments, but keeps only the
// running best instead of every valid assignment.
StreamedSelection select_best_streaming(const RouteTable& table, const std::vector<Drone>& drones,
                                        const std::vector<DroneRoutes>& per_drone, int num_orders);

std::vector<DronePlan> expand_assignment(const RouteTable& table, const std::vector<Drone>& drones,
                                         const Assignment& a);
