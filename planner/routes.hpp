#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>
#include "fleet.hpp"
#include "metrics.hpp"

struct Route {
    std::vector<int> order_ids;      // delivery order
    uint64_t mask = 0;               // bit i set when orders[i] is on the route
    RouteMetrics metrics;
    double total_weight = 0.0;
    std::vector<double> deadlines;   // same order as order_ids
};

// Every candidate route with its derived data, keyed by the ordered id sequence.
class RouteTable {
public:
    std::vector<Route> routes;

    void add(Route r);
    int find(const std::vector<int>& order_ids) const;   // -1 when absent
    std::size_t size() const { return routes.size(); }

private:
    std::map<std::vector<int>, int> index;
};

RouteTable generate_routes(const std::vector<Order>& orders);

// Sum over k of n!/(n-k)!, saturating at UINT64_MAX.
uint64_t count_routes(int n);
