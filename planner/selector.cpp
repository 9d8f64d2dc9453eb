#include "selector.hpp"
#include <algorithm>
#include <bitset>
#include <limits>
#include <numeric>
#include <stdexcept>
using namespace std;

static uint64_t full_mask(int num_orders)
{
    if (num_orders >= 64) return ~(uint64_t)0;
    return ((uint64_t)1 << num_orders) - 1;
}

double flight_time(const RouteTable& table, int route, const Drone& d)
{
    if (route == IDLE) return 0.0;
    const Route& r = table.routes[route];
    if (r.metrics.cumulative_distance.empty()) return 0.0;
    if (d.speed <= 0.0) return numeric_limits<double>::infinity();
    return r.metrics.last_cumulative() / d.speed;
}

AssignmentSummary summarize(const RouteTable& table, const vector<Drone>& drones,
                            const Assignment& a, int num_orders)
{
    AssignmentSummary s;
    for (size_t k = 0; k < a.choice.size(); k++) {
        int c = a.choice[k];
        if (c == IDLE) continue;
        s.total_time += flight_time(table, c, drones[k]);
        s.total_distance += table.routes[c].metrics.total_distance;
        s.covered |= table.routes[c].mask;
    }
    s.order_count = bitset<64>(s.covered).count();
    s.all_orders = s.covered == full_mask(num_orders);
    return s;
}

int select_best(const RouteTable& table, const vector<Drone>& drones,
                const vector<Assignment>& assignments, int num_orders)
{
    if (assignments.empty()) throw invalid_argument("no assignments to select from");

    vector<AssignmentSummary> summary;
    summary.reserve(assignments.size());
    for (const auto& a : assignments) summary.push_back(summarize(table, drones, a, num_orders));

    vector<int> by_time(assignments.size());
    iota(by_time.begin(), by_time.end(), 0);
    stable_sort(by_time.begin(), by_time.end(), [&](int a, int b) {
        return summary[a].total_time < summary[b].total_time;
    });

    for (int i : by_time) {
        if (summary[i].all_orders) return i;
    }

    int best_count = 0;
    for (const auto& s : summary) best_count = max(best_count, s.order_count);

    for (int i : by_time) {
        if (summary[i].order_count == best_count) return i;
    }
    return by_time.front();
}

// Strict ordering on (full coverage, order count, lower time). Equal keys keep
// the earlier assignment, as the stable sort in select_best does.
static bool better(const AssignmentSummary& a, const AssignmentSummary& b)
{
    if (a.all_orders != b.all_orders) return a.all_orders;
    if (a.order_count != b.order_count) return a.order_count > b.order_count;
    return a.total_time < b.total_time;
}

StreamedSelection select_best_streaming(const RouteTable& table, const vector<Drone>& drones,
                                        const vector<DroneRoutes>& per_drone, int num_orders)
{
    StreamedSelection sel;
    for_each_assignment(table, per_drone, [&](const Assignment& a) {
        AssignmentSummary s = summarize(table, drones, a, num_orders);
        if (sel.visited == 0 || better(s, sel.summary)) {
            sel.best = a;
            sel.summary = s;
        }
        sel.visited++;
    });
    return sel;
}

vector<DronePlan> expand_assignment(const RouteTable& table, const vector<Drone>& drones,
                                    const Assignment& a)
{
    vector<DronePlan> plan;
    plan.reserve(drones.size());
    for (size_t k = 0; k < drones.size(); k++) {
        DronePlan p;
        p.drone_id = drones[k].id;
        int c = k < a.choice.size() ? a.choice[k] : IDLE;
        if (c != IDLE) {
            p.order_ids = table.routes[c].order_ids;
            p.total_distance = table.routes[c].metrics.total_distance;
            p.flight_time = flight_time(table, c, drones[k]);
        }
        plan.push_back(p);
    }
    return plan;
}
