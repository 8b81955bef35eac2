#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "fixtures.hpp"
#include "route_planner/optimizer.hpp"
#include "route_planner/routing.hpp"

using namespace route_planner;
using namespace route_planner::test_support;

TEST(OptimizeRouteTest, SquareVisitsWaypointsInCheapestOrder)
{
    const auto network = square_network();
    const auto result = optimize_route(network, "A", "D", {"B", "C"});

    expect_valid_route(network, result, "A", "D");
    EXPECT_EQ(result.path, (Route{"A", "B", "C", "D"}));
    EXPECT_DOUBLE_EQ(result.total_distance, 15.0);
    EXPECT_EQ(result.visit_order, (std::vector<std::string>{"B", "C"}));
}

TEST(OptimizeRouteTest, InputOrderDoesNotChangeOptimum)
{
    const auto network = square_network();
    const auto result = optimize_route(network, "A", "D", {"C", "B"});

    expect_valid_route(network, result, "A", "D");
    EXPECT_DOUBLE_EQ(result.total_distance, 15.0);
    EXPECT_EQ(result.visit_order, (std::vector<std::string>{"B", "C"}));
}

TEST(OptimizeRouteTest, NoWaypointsIsTheDirectShortestPath)
{
    const auto network = mixed_network();
    const auto direct = dijkstra_with_parents(network, "P");
    const auto result = optimize_route(network, "P", "T", {});

    expect_valid_route(network, result, "P", "T");
    EXPECT_EQ(result.path, reconstruct_path(direct, "T"));
    EXPECT_DOUBLE_EQ(result.total_distance, distance_to(direct, "T"));
    EXPECT_TRUE(result.visit_order.empty());
}

TEST(OptimizeRouteTest, StartEqualsEnd)
{
    const auto network = square_network();
    const auto direct = optimize_route(network, "B", "B", {});
    ASSERT_TRUE(direct.ok());
    EXPECT_EQ(direct.path, (Route{"B"}));
    EXPECT_DOUBLE_EQ(direct.total_distance, 0.0);

    const auto loop = optimize_route(network, "A", "A", {"C"});
    expect_valid_route(network, loop, "A", "A");
    EXPECT_DOUBLE_EQ(loop.total_distance, 20.0);
}

TEST(OptimizeRouteTest, UnknownStartOrEnd)
{
    const auto network = square_network();

    const auto bad_start = optimize_route(network, "Z", "D", {"B"});
    EXPECT_EQ(bad_start.status, PlanStatus::UnknownCity);
    EXPECT_TRUE(bad_start.path.empty());
    EXPECT_EQ(bad_start.total_distance, -1.0);

    const auto bad_end = optimize_route(network, "A", "Z", {});
    EXPECT_EQ(bad_end.status, PlanStatus::UnknownCity);
}

TEST(OptimizeRouteTest, UnreachableDestinationIsInfeasible)
{
    const auto network = mixed_network();
    const auto result = optimize_route(network, "P", "U", {});
    EXPECT_EQ(result.status, PlanStatus::Infeasible);
    EXPECT_TRUE(result.path.empty());
}

TEST(OptimizeRouteTest, WaypointOutsideNetworkIsInfeasible)
{
    const auto network = square_network();
    const auto result = optimize_route(network, "A", "D", {"B", "E"});
    EXPECT_EQ(result.status, PlanStatus::Infeasible);
    EXPECT_TRUE(result.path.empty());
    EXPECT_TRUE(result.visit_order.empty());
}

TEST(OptimizeRouteTest, WaypointInOtherComponentIsInfeasible)
{
    const auto network = mixed_network();
    const auto result = optimize_route(network, "P", "T", {"R", "V"});
    EXPECT_EQ(result.status, PlanStatus::Infeasible);
}

TEST(OptimizeRouteTest, TooManyWaypointsIsRejectedUpFront)
{
    const auto network = square_network();
    PlannerOptions options;
    options.max_exact_waypoints = 1;

    const auto result = optimize_route(network, "A", "D", {"B", "C"}, options);
    EXPECT_EQ(result.status, PlanStatus::TooManyWaypoints);
    EXPECT_FALSE(result.error_message.empty());

    const auto within = optimize_route(network, "A", "D", {"C"}, options);
    EXPECT_TRUE(within.ok());
}

TEST(OptimizeRouteTest, TiesKeepFirstEnumeratedOrder)
{
    // S reaches X and Y at equal cost and both orders total 4.
    RoadNetwork network;
    network.add_road("S", "X", 1.0);
    network.add_road("S", "Y", 1.0);
    network.add_road("X", "Y", 2.0);
    network.add_road("X", "E", 1.0);
    network.add_road("Y", "E", 1.0);

    const auto xy = optimize_route(network, "S", "E", {"X", "Y"});
    expect_valid_route(network, xy, "S", "E");
    EXPECT_EQ(xy.visit_order, (std::vector<std::string>{"X", "Y"}));

    const auto yx = optimize_route(network, "S", "E", {"Y", "X"});
    expect_valid_route(network, yx, "S", "E");
    EXPECT_EQ(yx.visit_order, (std::vector<std::string>{"Y", "X"}));
    EXPECT_DOUBLE_EQ(xy.total_distance, yx.total_distance);
}

TEST(GreedyRouteTest, SquareMatchesOptimum)
{
    const auto network = square_network();
    const auto result = build_greedy_route(network, "A", "D", {"B", "C"});

    expect_valid_route(network, result, "A", "D");
    EXPECT_EQ(result.path, (Route{"A", "B", "C", "D"}));
    EXPECT_DOUBLE_EQ(result.total_distance, 15.0);
}

TEST(GreedyRouteTest, NearestFirstCanBeWorseThanOptimal)
{
    const auto network = greedy_trap_network();
    const auto greedy = build_greedy_route(network, "S", "E", {"X", "Y"});
    const auto optimal = optimize_route(network, "S", "E", {"X", "Y"});

    expect_valid_route(network, greedy, "S", "E");
    expect_valid_route(network, optimal, "S", "E");
    EXPECT_EQ(greedy.visit_order, (std::vector<std::string>{"X", "Y"}));
    EXPECT_DOUBLE_EQ(greedy.total_distance, 9.0);
    EXPECT_EQ(optimal.visit_order, (std::vector<std::string>{"Y", "X"}));
    EXPECT_DOUBLE_EQ(optimal.total_distance, 7.0);
}

TEST(GreedyRouteTest, TiesGoToFirstListedWaypoint)
{
    RoadNetwork network;
    network.add_road("S", "X", 1.0);
    network.add_road("S", "Y", 1.0);
    network.add_road("X", "E", 1.0);
    network.add_road("Y", "E", 1.0);

    EXPECT_EQ(build_greedy_route(network, "S", "E", {"X", "Y"}).visit_order.front(), "X");
    EXPECT_EQ(build_greedy_route(network, "S", "E", {"Y", "X"}).visit_order.front(), "Y");
}

TEST(GreedyRouteTest, FailureModes)
{
    const auto square = square_network();
    EXPECT_EQ(build_greedy_route(square, "Z", "D", {}).status, PlanStatus::UnknownCity);
    EXPECT_EQ(build_greedy_route(square, "A", "D", {"E"}).status, PlanStatus::Infeasible);

    const auto mixed = mixed_network();
    EXPECT_EQ(build_greedy_route(mixed, "P", "U", {}).status, PlanStatus::Infeasible);
    EXPECT_EQ(build_greedy_route(mixed, "U", "P", {"V"}).status, PlanStatus::Infeasible);
}

TEST(GreedyRouteTest, NoCeilingOnWaypointCount)
{
    RoadNetwork network;
    std::vector<std::string> waypoints;
    network.add_road("start", "c0", 1.0);
    for (int i = 0; i < 15; i++)
    {
        const std::string here = "c" + std::to_string(i);
        const std::string next = "c" + std::to_string(i + 1);
        network.add_road(here, next, 1.0);
        waypoints.push_back(here);
    }

    const auto result = build_greedy_route(network, "start", "c15", waypoints);
    expect_valid_route(network, result, "start", "c15");
    EXPECT_DOUBLE_EQ(result.total_distance, 16.0);

    EXPECT_EQ(optimize_route(network, "start", "c15", waypoints).status, PlanStatus::TooManyWaypoints);
}

TEST(PlannerComparisonTest, OptimalNeverWorseThanGreedy)
{
    struct Case
    {
        RoadNetwork network;
        std::string start;
        std::string end;
        std::vector<std::string> waypoints;
    };

    const std::vector<Case> cases = {
        {square_network(), "A", "D", {"B", "C"}},
        {square_network(), "B", "A", {"D"}},
        {greedy_trap_network(), "S", "E", {"X", "Y"}},
        {greedy_trap_network(), "X", "Y", {"E"}},
        {mixed_network(), "P", "T", {"R", "Q", "S"}},
        {mixed_network(), "T", "T", {"P", "Q"}},
        {mixed_network(), "S", "Q", {"P"}},
    };

    for (const auto &c : cases)
    {
        const auto optimal = optimize_route(c.network, c.start, c.end, c.waypoints);
        const auto greedy = build_greedy_route(c.network, c.start, c.end, c.waypoints);

        expect_valid_route(c.network, optimal, c.start, c.end);
        expect_valid_route(c.network, greedy, c.start, c.end);
        EXPECT_LE(optimal.total_distance, greedy.total_distance + kTolerance);

        if (c.waypoints.size() <= 1)
        {
            EXPECT_NEAR(optimal.total_distance, greedy.total_distance, kTolerance);
        }

        for (const auto &waypoint : c.waypoints)
        {
            EXPECT_TRUE(route_visits(optimal.path, waypoint)) << waypoint;
            EXPECT_TRUE(route_visits(greedy.path, waypoint)) << waypoint;
        }
    }
}
