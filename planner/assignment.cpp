#include "assignment.hpp"
using namespace std;

bool is_disjoint(const RouteTable& table, const Assignment& a)
{
    uint64_t used = 0;
    for (int c : a.choice) {
        if (c == IDLE) continue;
        uint64_t m = table.routes[c].mask;
        if (used & m) return false;
        used |= m;
    }
    return true;
}

double cross_product_size(const vector<DroneRoutes>& per_drone)
{
    double size = 1.0;
    for (const auto& dr : per_drone) size *= (double)(dr.feasible.size() + 1);
    return size;
}

// Depth-first walk of the cross product. A prefix that already reuses an order
// cannot be completed into a valid tuple, so its subtree is skipped.
static void extend(const RouteTable& table, const vector<DroneRoutes>& per_drone,
                   size_t k, uint64_t used, Assignment& current,
                   const function<void(const Assignment&)>& visit)
{
    if (k == per_drone.size()) {
        visit(current);
        return;
    }

    for (int r : per_drone[k].feasible) {
        uint64_t m = table.routes[r].mask;
        if (used & m) continue;
        current.choice[k] = r;
        extend(table, per_drone, k + 1, used | m, current, visit);
    }

    current.choice[k] = IDLE;
    extend(table, per_drone, k + 1, used, current, visit);
}

void for_each_assignment(const RouteTable& table, const vector<DroneRoutes>& per_drone,
                         const function<void(const Assignment&)>& visit)
{
    Assignment current;
    current.choice.assign(per_drone.size(), IDLE);
    extend(table, per_drone, 0, 0, current, visit);
}

EnumerationResult enumerate_assignments(const RouteTable& table, const vector<DroneRoutes>& per_drone)
{
    EnumerationResult res;
    res.cross_product_size = cross_product_size(per_drone);
    for_each_assignment(table, per_drone, [&](const Assignment& a) { res.valid.push_back(a); });
    return res;
}
