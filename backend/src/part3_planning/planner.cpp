#include "route_planner/planner.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "route_planner/keypoints.hpp"
#include "route_planner/optimizer.hpp"

namespace route_planner
{
namespace
{

std::string describe(const std::vector<std::string> &items)
{
    if (items.empty())
    {
        return "None";
    }

    std::string joined = "[";
    for (std::size_t i = 0; i < items.size(); i++)
    {
        if (i > 0)
        {
            joined += ", ";
        }
        joined += items[i];
    }
    return joined + "]";
}

void log_request(const char *title, const std::string &start, const std::string &end, const std::vector<std::string> &names)
{
    std::cout << "\n--- Route Planning (" << title << ") ---" << std::endl;
    std::cout << "Start: " << start << std::endl;
    std::cout << "Destination: " << end << std::endl;
    std::cout << "Attractions: " << describe(names) << std::endl;
}

template <typename Solver>
PlanResult run_timed(const WaypointResolution &resolution, Solver solver)
{
    std::cout << "Intermediate cities to visit: " << describe(resolution.waypoints) << std::endl;

    const auto start_time = std::chrono::high_resolution_clock::now();
    PlanResult result = solver(resolution.waypoints);
    const auto end_time = std::chrono::high_resolution_clock::now();

    result.computation_time_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    result.skipped_attractions = resolution.unknown_attractions;

    std::cout << "----------------------" << std::endl;
    return result;
}

} // namespace

RoutePlanner::RoutePlanner(const RoadNetwork &network, const AttractionMapper &mapper, PlannerOptions options)
    : network_(network), mapper_(mapper), options_(options)
{
}

PlanResult RoutePlanner::plan_optimal(const std::string &start, const std::string &end, const std::vector<std::string> &attraction_names)
{
    log_request("Optimal: Dijkstra + Permutations", start, end, attraction_names);
    last_optimal_distance_ = -1.0;

    const auto resolution = resolve_waypoints(mapper_, start, end, attraction_names);
    PlanResult result = run_timed(resolution, [&](const std::vector<std::string> &waypoints)
                                  { return optimize_route(network_, start, end, waypoints, options_); });

    if (result.ok())
    {
        last_optimal_distance_ = result.total_distance;
    }
    return result;
}

PlanResult RoutePlanner::plan_heuristic(const std::string &start, const std::string &end, const std::vector<std::string> &attraction_names)
{
    log_request("Heuristic: Nearest Neighbor", start, end, attraction_names);
    last_heuristic_distance_ = -1.0;

    const auto resolution = resolve_waypoints(mapper_, start, end, attraction_names);
    PlanResult result = run_timed(resolution, [&](const std::vector<std::string> &waypoints)
                                  { return build_greedy_route(network_, start, end, waypoints); });

    if (result.ok())
    {
        last_heuristic_distance_ = result.total_distance;
    }
    return result;
}

double RoutePlanner::last_optimal_distance() const
{
    return last_optimal_distance_;
}

double RoutePlanner::last_heuristic_distance() const
{
    return last_heuristic_distance_;
}

} // namespace route_planner
