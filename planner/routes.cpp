#include "routes.hpp"
#include <algorithm>
#include <limits>
#include <utility>
using namespace std;

void RouteTable::add(Route r)
{
    index[r.order_ids] = (int)routes.size();
    routes.push_back(std::move(r));
}

int RouteTable::find(const vector<int>& order_ids) const
{
    auto it = index.find(order_ids);
    if (it == index.end()) return -1;
    return it->second;
}

static Route build_route(const vector<Order>& orders, const vector<int>& positions)
{
    Route r;
    vector<Point> stops;
    stops.reserve(positions.size());

    for (int p : positions) {
        const Order& o = orders[p];
        r.order_ids.push_back(o.id);
        r.mask |= (uint64_t)1 << p;
        r.total_weight += o.weight;
        r.deadlines.push_back(o.deadline);
        stops.push_back({o.x, o.y});
    }

    r.metrics = compute_route_metrics(stops);
    return r;
}

// Advances combo to the next k-subset of [0, n) in lexicographic order.
static bool next_combination(vector<int>& combo, int n)
{
    int k = combo.size();
    int i = k - 1;
    while (i >= 0 && combo[i] == n - k + i) i--;
    if (i < 0) return false;

    combo[i]++;
    for (int j = i + 1; j < k; j++) combo[j] = combo[j - 1] + 1;
    return true;
}

RouteTable generate_routes(const vector<Order>& orders)
{
    RouteTable table;
    int n = orders.size();

    for (int k = 1; k <= n; k++) {
        vector<int> combo(k);
        for (int i = 0; i < k; i++) combo[i] = i;

        do {
            vector<int> perm = combo;
            do {
                table.add(build_route(orders, perm));
            } while (next_permutation(perm.begin(), perm.end()));
        } while (next_combination(combo, n));
    }

    return table;
}

uint64_t count_routes(int n)
{
    const uint64_t MAX = numeric_limits<uint64_t>::max();
    uint64_t total = 0;
    uint64_t falling = 1;   // n!/(n-k)!

    for (int k = 1; k <= n; k++) {
        uint64_t f = n - k + 1;
        if (falling > MAX / f) return MAX;
        falling *= f;
        if (total > MAX - falling) return MAX;
        total += falling;
    }
    return total;
}
