#pragma once

#include <string>
#include <vector>

#include "graph.hpp"
#include "types.hpp"

namespace route_planner
{

// Exact search over every visiting order of the waypoints. Orders are
// enumerated lexicographically by the waypoints' input positions,
// starting with the input order; on equal totals the first order wins.
PlanResult optimize_route(
    const RoadNetwork &network,
    const std::string &start,
    const std::string &end,
    const std::vector<std::string> &waypoints,
    const PlannerOptions &options = {});

// Nearest-neighbour walk over the waypoints. Equal distances go to the
// waypoint listed first.
PlanResult build_greedy_route(
    const RoadNetwork &network,
    const std::string &start,
    const std::string &end,
    const std::vector<std::string> &waypoints);

} // namespace route_planner
