#include <iostream>
#include <string>
#include "fleet_io.hpp"
#include "routes.hpp"

using namespace std;

// Dumps every candidate route with its metrics and per-drone checks.
int main(int argc, char** argv) {
    if (argc != 3) {
        cerr << "Usage: ./route_table input.json routes.json\n";
        return 1;
    }

    FleetInput input;
    if (!load_fleet(argv[1], input)) {
        cerr << "Failed to load input\n";
        return 1;
    }

    const int MAX_EXPORT_ORDERS = 8;
    if ((int)input.orders.size() > MAX_EXPORT_ORDERS) {
        cerr << "Error: " << input.orders.size() << " orders would produce "
             << count_routes(input.orders.size()) << " routes, limit is "
             << MAX_EXPORT_ORDERS << " orders\n";
        return 1;
    }

    cout << "Generating routes for " << input.orders.size() << " orders...\n";
    RouteTable table = generate_routes(input.orders);

    if (!write_json(argv[2], route_table_to_json(table, input))) return 1;

    cout << "Route table complete!\n";
    cout << "Routes: " << table.size() << "\n";
    cout << "Drones: " << input.drones.size() << "\n";
    cout << "Output file: " << argv[2] << "\n";
    return 0;
}
