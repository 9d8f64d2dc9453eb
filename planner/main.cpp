#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include "fleet_io.hpp"
#include "options.hpp"
#include "planner.hpp"
#include "routes.hpp"

using namespace std;
using json = nlohmann::json;

static void usage()
{
    cerr << "Usage: ./drone_planner input.json output.json [--workers N] [--max-orders N]\n";
}

int main(int argc, char** argv) {
    CommandLine cmd;
    string error;
    if (!parse_command_line(argc, argv, cmd, error)) {
        cerr << error << "\n";
        usage();
        return 1;
    }

    FleetInput input;
    if (!load_fleet(cmd.input, input)) {
        cerr << "Failed to load orders and drones from " << cmd.input << "\n";
        return 1;
    }

    cout << "Loaded " << input.orders.size() << " orders, "
         << input.drones.size() << " of " << input.drone_refs.size() << " drones available\n";
    cout << "Candidate routes: " << count_routes(input.orders.size()) << "\n";

    auto start_time = chrono::steady_clock::now();

    DeliveryPlan plan;
    try {
        plan = plan_deliveries(input.orders, input.drones, cmd.opts);
    } catch (const exception& e) {
        cerr << "Planning failed: " << e.what() << "\n";
        return 1;
    }

    auto end_time = chrono::steady_clock::now();
    auto duration = chrono::duration_cast<chrono::milliseconds>(end_time - start_time);

    for (size_t k = 0; k < input.drones.size(); k++) {
        cout << "Drone " << input.drone_refs[input.drones[k].id - 1].dump() << ": "
             << plan.stats.feasible_per_drone[k] << " feasible routes\n";
    }
    cout << "Valid assignments: " << plan.stats.valid_assignments
         << " of " << plan.stats.cross_product_size << " combinations\n";
    cout << "Planning completed in " << duration.count() << " ms\n";
    cout << "Orders covered: " << plan.summary.order_count << "/" << plan.num_orders << "\n";
    cout << "Total time: " << plan.summary.total_time
         << ", total distance: " << plan.summary.total_distance << "\n";

    if (!write_json(cmd.output, plan_to_json(plan, input))) return 1;

    cout << "Output written to " << cmd.output << "\n";
    return 0;
}
