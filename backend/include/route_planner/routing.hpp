#pragma once

#include <optional>
#include <string>
#include <vector>

#include "graph.hpp"
#include "types.hpp"

namespace route_planner
{

DijkstraResult dijkstra_with_parents(const RoadNetwork &network, const std::string &source);
Route reconstruct_path(const DijkstraResult &result, const std::string &target);
double distance_to(const DijkstraResult &result, const std::string &target);

DistanceTable precompute_key_points(const RoadNetwork &network, const std::vector<std::string> &key_points);
double lookup_distance(const DistanceTable &table, const std::string &from, const std::string &to);
Route lookup_path(const DistanceTable &table, const std::string &from, const std::string &to);

std::optional<double> measure_route(const RoadNetwork &network, const Route &route);

} // namespace route_planner
