#include "feasibility.hpp"
#include <algorithm>
#include <functional>
#include <future>
#include <utility>
using namespace std;

bool deadlines_met(const Route& r, double speed)
{
    const auto& cum = r.metrics.cumulative_distance;
    if (cum.empty()) return true;
    if (speed <= 0.0) return false;

    for (size_t i = 0; i < cum.size() && i < r.deadlines.size(); i++) {
        if (r.deadlines[i] < cum[i] / speed) return false;
    }
    return true;
}

Feasibility evaluate_route(const Route& r, const Drone& d)
{
    Feasibility f;
    f.weight_ok = r.total_weight <= d.max_payload;
    f.distance_ok = r.metrics.total_distance <= d.max_distance;
    f.deadline_ok = deadlines_met(r, d.speed);
    f.overall = f.weight_ok && f.distance_ok && f.deadline_ok;
    return f;
}

DroneRoutes feasible_routes_for(const RouteTable& table, const Drone& d)
{
    DroneRoutes out;
    out.drone_id = d.id;
    for (int i = 0; i < (int)table.routes.size(); i++) {
        if (evaluate_route(table.routes[i], d).overall) out.feasible.push_back(i);
    }
    return out;
}

static vector<DroneRoutes> evaluate_chunk(const RouteTable& table, const vector<Drone>& drones,
                                          size_t begin, size_t end)
{
    vector<DroneRoutes> out;
    out.reserve(end - begin);
    for (size_t i = begin; i < end; i++) out.push_back(feasible_routes_for(table, drones[i]));
    return out;
}

vector<DroneRoutes> feasible_routes(const RouteTable& table, const vector<Drone>& drones, int workers)
{
    size_t n = drones.size();
    size_t w = max(1, workers);
    if (w > n) w = n;
    if (w <= 1) return evaluate_chunk(table, drones, 0, n);

    // fan out contiguous drone ranges, fan in by concatenating in launch order
    vector<future<vector<DroneRoutes>>> parts;
    size_t chunk = (n + w - 1) / w;
    for (size_t begin = 0; begin < n; begin += chunk) {
        size_t end = min(n, begin + chunk);
        parts.push_back(async(launch::async, evaluate_chunk, cref(table), cref(drones), begin, end));
    }

    vector<DroneRoutes> merged;
    merged.reserve(n);
    for (auto& p : parts) {
        auto part = p.get();
        for (auto& dr : part) merged.push_back(std::move(dr));
    }
    return merged;
}
