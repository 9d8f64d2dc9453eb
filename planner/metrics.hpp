#pragma once
#include <vector>

struct Point {
    double x;
    double y;
};

struct RouteMetrics {
    std::vector<double> distance_from_depot;
    std::vector<double> relative_distance;   // leg i ends at stop i, leg 0 starts at the depot
    std::vector<double> cumulative_distance;
    double total_distance = 0.0;             // out and back to the depot

    double last_cumulative() const {
        return cumulative_distance.empty() ? 0.0 : cumulative_distance.back();
    }
};

double manhattan(const Point& a, const Point& b);

RouteMetrics compute_route_metrics(const std::vector<Point>& stops);
