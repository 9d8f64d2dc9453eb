#include "planner.hpp"
#include "assignment.hpp"
#include "feasibility.hpp"
#include "routes.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
using namespace std;

static const int MASK_BITS = 64;

DeliveryPlan plan_deliveries(const vector<Order>& orders, const vector<Drone>& drones,
                             const PlannerOptions& opts)
{
    if (drones.empty()) throw invalid_argument("no available drones to plan for");

    int limit = min(opts.max_orders, MASK_BITS);
    if ((int)orders.size() > limit) {
        throw invalid_argument("too many orders for exhaustive search: " +
                               to_string(orders.size()) + " > " + to_string(limit));
    }

    DeliveryPlan plan;
    plan.num_orders = orders.size();

    RouteTable table = generate_routes(orders);
    plan.stats.route_count = table.size();

    vector<DroneRoutes> per_drone = feasible_routes(table, drones, opts.workers);
    for (const auto& dr : per_drone) plan.stats.feasible_per_drone.push_back(dr.feasible.size());

    StreamedSelection sel = select_best_streaming(table, drones, per_drone, plan.num_orders);
    plan.stats.cross_product_size = cross_product_size(per_drone);
    plan.stats.valid_assignments = sel.visited;

    plan.summary = sel.summary;
    plan.drones = expand_assignment(table, drones, sel.best);
    return plan;
}
