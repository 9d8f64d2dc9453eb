#include "fleet_io.hpp"
#include "feasibility.hpp"
#include <fstream>
#include <iostream>
#include <map>
using namespace std;
using json = nlohmann::json;

static const size_t MAX_INPUT_ORDERS = 64;

static bool read_number(const json& obj, const char* key, const string& where,
                        double& out, string& error)
{
    if (!obj.contains(key) || !obj[key].is_number()) {
        error = where + ": missing or non-numeric \"" + key + "\"";
        return false;
    }
    out = obj[key].get<double>();
    if (out < 0) {
        error = where + ": \"" + key + "\" must not be negative";
        return false;
    }
    return true;
}

// seen maps each id taken so far to whether it was a position fallback.
static bool read_id(const json& obj, int position, const string& where,
                    map<string, bool>& seen, json& out, string& error)
{
    bool fallback = !obj.contains("id");
    out = fallback ? json(position) : obj["id"];
    if (!out.is_primitive() || out.is_null()) {
        error = where + ": \"id\" must be a string, number or boolean";
        return false;
    }

    auto ins = seen.insert({out.dump(), fallback});
    if (ins.second) return true;

    if (fallback) {
        error = where + ": has no \"id\" and its position " + out.dump() +
                " is already taken by an explicit id";
    } else if (ins.first->second) {
        error = where + ": id " + out.dump() +
                " clashes with the position of an earlier entry that has no \"id\"";
    } else {
        error = where + ": duplicate id " + out.dump();
    }
    return false;
}

bool parse_fleet(const json& j, FleetInput& in, string& error)
{
    in = FleetInput();

    if (!j.is_object() || !j.contains("orders") || !j["orders"].is_array()) {
        error = "\"orders\" must be an array";
        return false;
    }
    if (!j.contains("drones") || !j["drones"].is_object() ||
        !j["drones"].contains("fleet") || !j["drones"]["fleet"].is_array()) {
        error = "\"drones.fleet\" must be an array";
        return false;
    }

    const auto& jorders = j["orders"];
    if (jorders.size() > MAX_INPUT_ORDERS) {
        error = "at most " + to_string(MAX_INPUT_ORDERS) + " orders are supported, got " +
                to_string(jorders.size());
        return false;
    }

    map<string, bool> seen;
    for (size_t i = 0; i < jorders.size(); i++) {
        const auto& jo = jorders[i];
        string where = "order #" + to_string(i + 1);
        if (!jo.is_object()) {
            error = where + ": expected an object";
            return false;
        }

        Order o;
        o.id = i + 1;
        json ref;
        if (!read_id(jo, o.id, where, seen, ref, error)) return false;

        // coordinates may be negative, the depot sits at the origin
        if (!jo.contains("delivery_x") || !jo["delivery_x"].is_number() ||
            !jo.contains("delivery_y") || !jo["delivery_y"].is_number()) {
            error = where + ": missing or non-numeric delivery_x/delivery_y";
            return false;
        }
        o.x = jo["delivery_x"].get<double>();
        o.y = jo["delivery_y"].get<double>();

        if (!read_number(jo, "deadline", where, o.deadline, error)) return false;
        if (!read_number(jo, "package_weight", where, o.weight, error)) return false;

        in.orders.push_back(o);
        in.order_refs.push_back(ref);
    }

    seen.clear();
    const auto& jfleet = j["drones"]["fleet"];
    for (size_t i = 0; i < jfleet.size(); i++) {
        const auto& jd = jfleet[i];
        string where = "drone #" + to_string(i + 1);
        if (!jd.is_object()) {
            error = where + ": expected an object";
            return false;
        }

        Drone d;
        d.id = i + 1;
        json ref;
        if (!read_id(jd, d.id, where, seen, ref, error)) return false;
        if (!read_number(jd, "max_payload", where, d.max_payload, error)) return false;
        if (!read_number(jd, "max_distance", where, d.max_distance, error)) return false;
        if (!read_number(jd, "speed", where, d.speed, error)) return false;

        if (jd.contains("available") && !jd["available"].is_boolean()) {
            error = where + ": \"available\" must be a boolean";
            return false;
        }
        d.available = jd.value("available", true);

        in.drone_refs.push_back(ref);
        if (d.available) in.drones.push_back(d);
    }

    return true;
}

bool load_fleet(const string& filename, FleetInput& in)
{
    ifstream fin(filename);
    if (!fin) {
        cerr << "Could not open input file: " << filename << "\n";
        return false;
    }

    json j;
    try {
        fin >> j;
    } catch (const exception& e) {
        cerr << "Error parsing JSON: " << e.what() << "\n";
        return false;
    }

    string error;
    if (!parse_fleet(j, in, error)) {
        cerr << "Invalid input " << filename << ": " << error << "\n";
        return false;
    }
    return true;
}

static json order_refs_of(const vector<int>& order_ids, const FleetInput& in)
{
    json arr = json::array();
    for (int id : order_ids) arr.push_back(in.order_refs[id - 1]);
    return arr;
}

json plan_to_json(const DeliveryPlan& plan, const FleetInput& in)
{
    json out;
    out["assignments"] = json::array();

    for (const auto& dp : plan.drones) {
        json a;
        a["drone"] = in.drone_refs[dp.drone_id - 1];
        a["orders"] = order_refs_of(dp.order_ids, in);
        a["total_distance"] = dp.total_distance;
        out["assignments"].push_back(a);
    }

    out["metrics"] = {
        {"total_time", plan.summary.total_time},
        {"total_distance", plan.summary.total_distance},
        {"orders_covered", plan.summary.order_count},
        {"orders_total", plan.num_orders},
        {"all_orders_covered", plan.summary.all_orders}
    };
    return out;
}

json route_table_to_json(const RouteTable& table, const FleetInput& in)
{
    json out;
    out["routes"] = json::array();

    for (const auto& r : table.routes) {
        json jr;
        jr["orders"] = order_refs_of(r.order_ids, in);
        jr["distance_from_depot"] = r.metrics.distance_from_depot;
        jr["relative_distance"] = r.metrics.relative_distance;
        jr["cumulative_distance"] = r.metrics.cumulative_distance;
        jr["total_distance"] = r.metrics.total_distance;
        jr["weight"] = r.total_weight;
        jr["deadlines"] = r.deadlines;

        jr["drones"] = json::array();
        for (const auto& d : in.drones) {
            Feasibility f = evaluate_route(r, d);
            jr["drones"].push_back({
                {"drone", in.drone_refs[d.id - 1]},
                {"weight", f.weight_ok},
                {"distance", f.distance_ok},
                {"deadline", f.deadline_ok},
                {"overall", f.overall}
            });
        }
        out["routes"].push_back(jr);
    }
    return out;
}

bool write_json(const string& filename, const json& j)
{
    ofstream out(filename);
    if (!out) {
        cerr << "Failed to open output file " << filename << "\n";
        return false;
    }
    out << j.dump(4) << "\n";
    return out.good();
}
