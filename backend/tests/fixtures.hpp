#pragma once

#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <limits>
#include <string>
#include <unordered_set>
#include <vector>

#include "route_planner/attractions.hpp"
#include "route_planner/graph.hpp"
#include "route_planner/routing.hpp"
#include "route_planner/types.hpp"

namespace route_planner
{
namespace test_support
{

constexpr double kTolerance = 1e-6;

// A-B=5, B-C=5, C-D=5, A-D=20
inline RoadNetwork square_network()
{
    RoadNetwork network;
    network.add_road("A", "B", 5.0);
    network.add_road("B", "C", 5.0);
    network.add_road("C", "D", 5.0);
    network.add_road("A", "D", 20.0);
    return network;
}

// Cities on a line: Y(-2) S(0) X(1) E(3). Greedy from S grabs X first
// and has to double back for Y.
inline RoadNetwork greedy_trap_network()
{
    RoadNetwork network;
    network.add_road("Y", "S", 2.0);
    network.add_road("S", "X", 1.0);
    network.add_road("X", "E", 2.0);
    return network;
}

// Two components plus a parallel road, for reachability and multigraph checks.
inline RoadNetwork mixed_network()
{
    RoadNetwork network;
    network.add_road("P", "Q", 4.0);
    network.add_road("Q", "R", 3.0);
    network.add_road("P", "R", 9.0);
    network.add_road("P", "R", 6.5);
    network.add_road("R", "S", 1.5);
    network.add_road("Q", "T", 8.0);
    network.add_road("S", "T", 2.0);
    network.add_road("U", "V", 1.0);
    return network;
}

// Every city maps to itself under "<city> Attraction".
inline AttractionMapper identity_mapper(const RoadNetwork &network)
{
    AttractionMapper mapper;
    for (const auto &city : network.cities())
    {
        mapper.add_attraction(city + " Attraction", city);
    }
    return mapper;
}

// Minimum over all simple paths, by exhaustive DFS. Small graphs only.
inline double brute_force_distance(const RoadNetwork &network, const std::string &from, const std::string &to)
{
    if (!network.contains(from) || !network.contains(to))
    {
        return kUnreachable;
    }

    double best = kUnreachable;
    std::unordered_set<std::string> on_path;

    std::function<void(const std::string &, double)> visit = [&](const std::string &city, double so_far)
    {
        if (city == to)
        {
            best = std::min(best, so_far);
            return;
        }
        on_path.insert(city);
        for (const auto &[neighbour, distance] : network.neighbours(city))
        {
            if (!on_path.count(neighbour))
            {
                visit(neighbour, so_far + distance);
            }
        }
        on_path.erase(city);
    };

    visit(from, 0.0);
    return best;
}

inline void expect_valid_route(const RoadNetwork &network, const PlanResult &result,
                               const std::string &start, const std::string &end)
{
    ASSERT_TRUE(result.ok()) << result.error_message;
    ASSERT_FALSE(result.path.empty());
    EXPECT_EQ(result.path.front(), start);
    EXPECT_EQ(result.path.back(), end);

    const auto measured = measure_route(network, result.path);
    ASSERT_TRUE(measured.has_value()) << "route uses a pair of cities with no road between them";
    EXPECT_NEAR(*measured, result.total_distance, kTolerance);
}

inline bool route_visits(const Route &path, const std::string &city)
{
    for (const auto &stop : path)
    {
        if (stop == city)
        {
            return true;
        }
    }
    return false;
}

} // namespace test_support
} // namespace route_planner
