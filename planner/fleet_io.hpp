#pragma once
#include <string>
#include <vector>
#include "fleet.hpp"
#include "planner.hpp"
#include "routes.hpp"
#include "nlohmann/json.hpp"

struct FleetInput {
    std::vector<Order> orders;
    std::vector<Drone> drones;               // available drones only
    std::vector<nlohmann::json> order_refs;  // input ids, index Order::id - 1
    std::vector<nlohmann::json> drone_refs;  // input ids of the whole fleet, index Drone::id - 1
};

bool parse_fleet(const nlohmann::json& j, FleetInput& in, std::string& error);
bool load_fleet(const std::string& filename, FleetInput& in);

nlohmann::json plan_to_json(const DeliveryPlan& plan, const FleetInput& in);
nlohmann::json route_table_to_json(const RouteTable& table, const FleetInput& in);

bool write_json(const std::string& filename, const nlohmann::json& j);
