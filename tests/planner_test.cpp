#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <random>
#include <stdexcept>
#include "assignment.hpp"
#include "feasibility.hpp"
#include "planner.hpp"

TEST(Planner, SingleOrderSingleDrone) {
    DeliveryPlan plan = plan_deliveries({{1, 3, 4, 10, 2}}, {{1, 5, 20, 1}});

    ASSERT_EQ(plan.drones.size(), 1u);
    EXPECT_EQ(plan.drones[0].drone_id, 1);
    EXPECT_EQ(plan.drones[0].order_ids, (std::vector<int>{1}));
    EXPECT_DOUBLE_EQ(plan.drones[0].total_distance, 14.0);
    EXPECT_TRUE(plan.summary.all_orders);
    EXPECT_DOUBLE_EQ(plan.summary.total_time, 7.0);
    EXPECT_EQ(plan.stats.route_count, 1u);
    EXPECT_EQ(plan.stats.valid_assignments, 2u);
}

TEST(Planner, OverweightPairCoversOneOrder) {
    DeliveryPlan plan = plan_deliveries({{1, 1, 1, 100, 3}, {2, 4, 0, 100, 3}},
                                        {{1, 5, 100, 1}});

    ASSERT_EQ(plan.stats.feasible_per_drone.size(), 1u);
    EXPECT_EQ(plan.stats.feasible_per_drone[0], 2u);
    EXPECT_FALSE(plan.summary.all_orders);
    EXPECT_EQ(plan.summary.order_count, 1);
    EXPECT_EQ(plan.drones[0].order_ids, (std::vector<int>{1}));
    EXPECT_DOUBLE_EQ(plan.summary.total_time, 2.0);
}

TEST(Planner, PicksFasterDeliverySequence) {
    DeliveryPlan plan = plan_deliveries({{1, 3, 0, 100, 1}, {2, 1, 0, 100, 1}},
                                        {{1, 5, 100, 1}});

    EXPECT_EQ(plan.drones[0].order_ids, (std::vector<int>{2, 1}));
    EXPECT_DOUBLE_EQ(plan.drones[0].total_distance, 6.0);
    EXPECT_DOUBLE_EQ(plan.summary.total_time, 3.0);
}

TEST(Planner, StationaryDroneStaysIdle) {
    DeliveryPlan plan = plan_deliveries({{1, 1, 0, 1000, 1}},
                                        {{1, 10, 100, 0}, {2, 10, 100, 1}});
    EXPECT_TRUE(plan.drones[0].order_ids.empty());
    EXPECT_EQ(plan.drones[1].order_ids, (std::vector<int>{1}));
    EXPECT_EQ(plan.stats.feasible_per_drone[0], 0u);

    DeliveryPlan alone = plan_deliveries({{1, 1, 0, 1000, 1}}, {{1, 10, 100, 0}});
    EXPECT_TRUE(alone.drones[0].order_ids.empty());
    EXPECT_EQ(alone.summary.order_count, 0);
    EXPECT_EQ(alone.stats.valid_assignments, 1u);
}

TEST(Planner, NoOrdersGivesIdleFleet) {
    DeliveryPlan plan = plan_deliveries({}, {{1, 5, 20, 1}, {2, 5, 20, 1}});
    ASSERT_EQ(plan.drones.size(), 2u);
    for (const auto& d : plan.drones) EXPECT_TRUE(d.order_ids.empty());
    EXPECT_TRUE(plan.summary.all_orders);
    EXPECT_EQ(plan.stats.route_count, 0u);
    EXPECT_EQ(plan.stats.valid_assignments, 1u);
}

TEST(Planner, NoDronesIsAnError) {
    EXPECT_THROW(plan_deliveries({{1, 3, 4, 10, 2}}, {}), std::invalid_argument);
}

TEST(Planner, TooManyOrdersIsAnError) {
    PlannerOptions opts;
    opts.max_orders = 2;
    std::vector<Order> orders = {{1, 1, 0, 10, 1}, {2, 2, 0, 10, 1}, {3, 3, 0, 10, 1}};
    EXPECT_THROW(plan_deliveries(orders, {{1, 5, 20, 1}}, opts), std::invalid_argument);

    orders.pop_back();
    EXPECT_NO_THROW(plan_deliveries(orders, {{1, 5, 20, 1}}, opts));
}

TEST(Planner, DefaultOrderLimit) {
    std::vector<Order> orders;
    for (int i = 0; i < 9; i++) orders.push_back({i + 1, (double)i, 1, 100, 1});
    EXPECT_EQ(PlannerOptions().max_orders, 8);
    EXPECT_THROW(plan_deliveries(orders, {{1, 5, 20, 1}}), std::invalid_argument);
}

TEST(Planner, CountsValidAssignmentsWithoutStoringThem) {
    std::vector<Order> orders = {{1, 1, 0, 100, 1}, {2, 0, 1, 100, 1}, {3, 1, 1, 100, 1}};
    std::vector<Drone> drones = {{1, 10, 100, 1}, {2, 10, 100, 1}};
    DeliveryPlan plan = plan_deliveries(orders, drones);

    RouteTable table = generate_routes(orders);
    EnumerationResult res = enumerate_assignments(table, feasible_routes(table, drones));
    EXPECT_EQ(plan.stats.valid_assignments, res.valid.size());
    EXPECT_DOUBLE_EQ(plan.stats.cross_product_size, res.cross_product_size);
    EXPECT_TRUE(plan.summary.all_orders);
}

TEST(Planner, RepeatedRunsAgree) {
    std::vector<Order> orders = {{1, 2, 3, 20, 1}, {2, -1, 4, 15, 2}, {3, 5, -2, 30, 2}, {4, 0, -3, 9, 1}};
    std::vector<Drone> drones = {{1, 3, 30, 1}, {2, 4, 40, 2}, {3, 2, 15, 1}};

    DeliveryPlan first = plan_deliveries(orders, drones);
    PlannerOptions parallel;
    parallel.workers = 3;

    for (const DeliveryPlan& again : {plan_deliveries(orders, drones), plan_deliveries(orders, drones, parallel)}) {
        EXPECT_DOUBLE_EQ(again.summary.total_time, first.summary.total_time);
        EXPECT_EQ(again.summary.covered, first.summary.covered);
        ASSERT_EQ(again.drones.size(), first.drones.size());
        for (size_t k = 0; k < first.drones.size(); k++) {
            EXPECT_EQ(again.drones[k].order_ids, first.drones[k].order_ids);
        }
    }
}

// Random small fleets: the chosen plan never loses coverage to any valid alternative.
TEST(Planner, CoverageIsNeverTradedForTime) {
    std::mt19937 rng(20261019);
    std::uniform_int_distribution<int> coord(-6, 6);
    std::uniform_int_distribution<int> small(1, 4);

    for (int round = 0; round < 25; round++) {
        std::vector<Order> orders;
        for (int i = 0; i < 3; i++) {
            orders.push_back({i + 1, (double)coord(rng), (double)coord(rng),
                              (double)(small(rng) * 5), (double)small(rng)});
        }
        std::vector<Drone> drones;
        for (int k = 0; k < 2; k++) {
            drones.push_back({k + 1, (double)(small(rng) + 1), (double)(small(rng) * 10),
                              (double)small(rng)});
        }

        DeliveryPlan plan = plan_deliveries(orders, drones);

        RouteTable table = generate_routes(orders);
        EnumerationResult res = enumerate_assignments(table, feasible_routes(table, drones));
        bool full_possible = false;
        int best_count = 0;
        for (const auto& a : res.valid) {
            AssignmentSummary s = summarize(table, drones, a, 3);
            full_possible = full_possible || s.all_orders;
            best_count = std::max(best_count, s.order_count);
        }

        EXPECT_EQ(plan.summary.all_orders, full_possible) << "round " << round;
        EXPECT_EQ(plan.summary.order_count, best_count) << "round " << round;

        uint64_t seen = 0;
        for (const auto& d : plan.drones) {
            for (int id : d.order_ids) {
                uint64_t bit = (uint64_t)1 << (id - 1);
                EXPECT_EQ(seen & bit, 0u) << "order " << id << " flown twice";
                seen |= bit;
            }
        }
    }
}
