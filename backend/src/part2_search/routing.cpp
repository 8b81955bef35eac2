#include "route_planner/routing.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <iostream>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace route_planner
{
namespace
{

using QueueEntry = std::pair<double, std::string>;
using MinQueue = std::priority_queue<QueueEntry, std::vector<QueueEntry>, std::greater<QueueEntry>>;

} // namespace

DijkstraResult dijkstra_with_parents(const RoadNetwork &network, const std::string &source)
{
    DijkstraResult result;
    result.source = source;

    if (!network.contains(source))
    {
        result.error_message = "Source city '" + source + "' not found in the road network.";
        return result;
    }

    const auto start_time = std::chrono::high_resolution_clock::now();

    for (const auto &city : network.cities())
    {
        result.distances[city] = kUnreachable;
    }
    result.distances[source] = 0.0;

    MinQueue pq;
    std::unordered_set<std::string> finalized;
    pq.push({0.0, source});

    while (!pq.empty())
    {
        const auto current_pair = pq.top();
        pq.pop();
        const double current_dist = current_pair.first;
        const std::string &current_city = current_pair.second;

        // stale entry for a city that was already settled
        if (!finalized.insert(current_city).second)
        {
            continue;
        }

        for (const auto &[neighbour, edge_weight] : network.neighbours(current_city))
        {
            if (finalized.count(neighbour))
            {
                continue;
            }

            const double new_dist = current_dist + edge_weight;
            if (new_dist < result.distances[neighbour])
            {
                result.distances[neighbour] = new_dist;
                result.parents[neighbour] = current_city;
                pq.push({new_dist, neighbour});
            }
        }
    }

    const auto end_time = std::chrono::high_resolution_clock::now();
    result.computation_time_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    result.success = true;

    return result;
}

double distance_to(const DijkstraResult &result, const std::string &target)
{
    const auto it = result.distances.find(target);
    if (it == result.distances.end())
    {
        return kUnreachable;
    }
    return it->second;
}

Route reconstruct_path(const DijkstraResult &result, const std::string &target)
{
    if (!result.success)
    {
        return {};
    }

    if (target == result.source)
    {
        return {result.source};
    }

    if (result.parents.find(target) == result.parents.end())
    {
        return {};
    }

    Route path;
    std::string node = target;
    // a well-formed predecessor chain never visits more cities than it has entries
    const std::size_t max_steps = result.parents.size() + 1;

    while (node != result.source)
    {
        if (path.size() > max_steps)
        {
            std::cerr << "Error: Path reconstruction failed - predecessor cycle on the way to "
                      << target << std::endl;
            return {};
        }

        path.push_back(node);
        const auto parent_it = result.parents.find(node);
        if (parent_it == result.parents.end())
        {
            std::cerr << "Error: Path reconstruction failed - predecessor map incomplete for path "
                      << result.source << " -> " << target << std::endl;
            return {};
        }
        node = parent_it->second;
    }
    path.push_back(result.source);
    std::reverse(path.begin(), path.end());

    return path;
}

DistanceTable precompute_key_points(const RoadNetwork &network, const std::vector<std::string> &key_points)
{
    std::cout << "Pre-calculating shortest paths from " << key_points.size() << " key points..." << std::endl;

    DistanceTable table;
    for (const auto &point : key_points)
    {
        if (table.count(point))
        {
            continue;
        }

        auto result = dijkstra_with_parents(network, point);
        if (result.success)
        {
            std::cout << "Dijkstra complete for " << point << " in "
                      << result.computation_time_ms << " ms." << std::endl;
        }
        table.emplace(point, std::move(result));
    }

    std::cout << "Finished pre-calculation." << std::endl;
    return table;
}

double lookup_distance(const DistanceTable &table, const std::string &from, const std::string &to)
{
    const auto it = table.find(from);
    if (it == table.end())
    {
        return kUnreachable;
    }
    return distance_to(it->second, to);
}

Route lookup_path(const DistanceTable &table, const std::string &from, const std::string &to)
{
    const auto it = table.find(from);
    if (it == table.end() || distance_to(it->second, to) == kUnreachable)
    {
        return {};
    }
    return reconstruct_path(it->second, to);
}

std::optional<double> measure_route(const RoadNetwork &network, const Route &route)
{
    if (route.empty() || !network.contains(route.front()))
    {
        return std::nullopt;
    }

    double total = 0.0;
    for (std::size_t i = 0; i + 1 < route.size(); i++)
    {
        const auto road = network.shortest_road(route[i], route[i + 1]);
        if (!road)
        {
            return std::nullopt;
        }
        total += *road;
    }
    return total;
}

} // namespace route_planner
