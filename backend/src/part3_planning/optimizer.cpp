#include "route_planner/optimizer.hpp"

#include <algorithm>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>

#include "route_planner/assembler.hpp"
#include "route_planner/keypoints.hpp"
#include "route_planner/routing.hpp"

namespace route_planner
{
namespace
{

bool check_endpoints(const RoadNetwork &network, const std::string &start, const std::string &end, PlanResult &result)
{
    if (!network.contains(start))
    {
        result.status = PlanStatus::UnknownCity;
        result.error_message = "Start city '" + start + "' not found in the road network.";
    }
    else if (!network.contains(end))
    {
        result.status = PlanStatus::UnknownCity;
        result.error_message = "Destination city '" + end + "' not found in the road network.";
    }
    else
    {
        return true;
    }

    std::cerr << "Error: " << result.error_message << std::endl;
    return false;
}

void mark_infeasible(PlanResult &result, const std::string &message)
{
    result.status = PlanStatus::Infeasible;
    result.error_message = message;
    result.path.clear();
    result.visit_order.clear();
    result.total_distance = -1.0;
    std::cerr << "Error: " << message << std::endl;
}

PlanResult direct_route(const DistanceTable &table, const std::string &start, const std::string &end)
{
    PlanResult result;
    std::cout << "No intermediate attractions. Calculating direct shortest path..." << std::endl;

    const double distance = lookup_distance(table, start, end);
    if (distance == kUnreachable)
    {
        mark_infeasible(result, "Destination city '" + end + "' is unreachable from start city '" + start + "'.");
        return result;
    }

    result.path = lookup_path(table, start, end);
    if (result.path.empty())
    {
        mark_infeasible(result, "Cannot reconstruct path from '" + start + "' to '" + end + "'.");
        return result;
    }

    result.status = PlanStatus::Ok;
    result.total_distance = distance;
    std::cout << "Direct Path Found. Distance: " << format_miles(distance) << std::endl;
    return result;
}

// Segments for [start, order..., end], joined into one route.
Route assemble_route(
    const DistanceTable &table,
    const std::string &start,
    const std::string &end,
    const std::vector<std::string> &order)
{
    std::vector<Route> segments;
    segments.reserve(order.size() + 1);

    std::string previous = start;
    for (const auto &city : order)
    {
        segments.push_back(lookup_path(table, previous, city));
        previous = city;
    }
    segments.push_back(lookup_path(table, previous, end));

    return concatenate_segments(segments);
}

} // namespace

PlanResult optimize_route(
    const RoadNetwork &network,
    const std::string &start,
    const std::string &end,
    const std::vector<std::string> &waypoints,
    const PlannerOptions &options)
{
    PlanResult result;
    if (!check_endpoints(network, start, end, result))
    {
        return result;
    }

    const std::size_t k = waypoints.size();
    if (k > options.max_exact_waypoints)
    {
        result.status = PlanStatus::TooManyWaypoints;
        result.error_message = std::to_string(k) + " intermediate cities exceed the exact search limit of " +
                               std::to_string(options.max_exact_waypoints) + ".";
        std::cerr << "Error: " << result.error_message << std::endl;
        return result;
    }

    const DistanceTable table = precompute_key_points(network, collect_key_points(start, end, waypoints));

    if (k == 0)
    {
        return direct_route(table, start, end);
    }

    std::cout << "Calculating shortest path visiting " << k << " intermediate cities..." << std::endl;

    std::vector<std::size_t> indices(k);
    std::iota(indices.begin(), indices.end(), 0);

    double min_total_distance = kUnreachable;
    std::vector<std::size_t> best_order;
    long long evaluated = 0;

    do
    {
        evaluated++;
        double total = lookup_distance(table, start, waypoints[indices.front()]);
        for (std::size_t i = 0; i + 1 < k && total != kUnreachable; i++)
        {
            total += lookup_distance(table, waypoints[indices[i]], waypoints[indices[i + 1]]);
        }
        if (total != kUnreachable)
        {
            total += lookup_distance(table, waypoints[indices.back()], end);
        }

        if (total < min_total_distance)
        {
            min_total_distance = total;
            best_order = indices;
        }
    } while (std::next_permutation(indices.begin(), indices.end()));

    std::cout << "Evaluated " << evaluated << " permutations." << std::endl;

    if (best_order.empty())
    {
        mark_infeasible(result, "Could not find a valid route visiting all specified attractions.");
        return result;
    }

    for (const std::size_t index : best_order)
    {
        result.visit_order.push_back(waypoints[index]);
    }
    result.path = assemble_route(table, start, end, result.visit_order);
    result.total_distance = min_total_distance;
    result.status = PlanStatus::Ok;

    std::cout << "Minimum Total Distance: " << format_miles(min_total_distance) << std::endl;
    return result;
}

PlanResult build_greedy_route(
    const RoadNetwork &network,
    const std::string &start,
    const std::string &end,
    const std::vector<std::string> &waypoints)
{
    PlanResult result;
    if (!check_endpoints(network, start, end, result))
    {
        return result;
    }

    const DistanceTable table = precompute_key_points(network, collect_key_points(start, end, waypoints));

    if (waypoints.empty())
    {
        return direct_route(table, start, end);
    }

    std::cout << "Calculating heuristic path visiting " << waypoints.size() << " intermediate cities..." << std::endl;

    std::vector<bool> visited(waypoints.size(), false);
    std::string current_city = start;
    double total = 0.0;

    for (std::size_t step = 0; step < waypoints.size(); step++)
    {
        std::size_t nearest = waypoints.size();
        double min_distance = kUnreachable;

        for (std::size_t i = 0; i < waypoints.size(); i++)
        {
            if (visited[i])
            {
                continue;
            }

            const double dist = lookup_distance(table, current_city, waypoints[i]);
            if (dist < min_distance)
            {
                min_distance = dist;
                nearest = i;
            }
        }

        if (nearest == waypoints.size())
        {
            mark_infeasible(result, "Cannot find reachable unvisited attraction from " + current_city + ".");
            return result;
        }

        visited[nearest] = true;
        total += min_distance;
        current_city = waypoints[nearest];
        result.visit_order.push_back(current_city);
    }

    const double final_leg = lookup_distance(table, current_city, end);
    if (final_leg == kUnreachable)
    {
        mark_infeasible(result, "Cannot reach final destination " + end + " from " + current_city + ".");
        return result;
    }
    total += final_leg;

    result.path = assemble_route(table, start, end, result.visit_order);
    result.total_distance = total;
    result.status = PlanStatus::Ok;

    std::cout << "Total Distance (Heuristic): " << format_miles(total) << std::endl;
    return result;
}

} // namespace route_planner
