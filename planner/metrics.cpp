#include "metrics.hpp"
#include <cmath>
using namespace std;

static const Point DEPOT{0.0, 0.0};

double manhattan(const Point& a, const Point& b)
{
    return fabs(a.x - b.x) + fabs(a.y - b.y);
}

RouteMetrics compute_route_metrics(const vector<Point>& stops)
{
    RouteMetrics m;
    if (stops.empty()) return m;

    size_t n = stops.size();
    m.distance_from_depot.reserve(n);
    m.relative_distance.reserve(n);
    m.cumulative_distance.reserve(n);

    for (size_t i = 0; i < n; i++) {
        m.distance_from_depot.push_back(manhattan(stops[i], DEPOT));

        double leg = (i == 0) ? m.distance_from_depot[0] : manhattan(stops[i], stops[i - 1]);
        m.relative_distance.push_back(leg);

        double prev = (i == 0) ? 0.0 : m.cumulative_distance[i - 1];
        m.cumulative_distance.push_back(prev + leg);
    }

    // return leg goes straight home from the last stop
    m.total_distance = m.cumulative_distance.back() + m.distance_from_depot.back();
    return m;
}
