#pragma once

#include <string>
#include <vector>

#include "attractions.hpp"
#include "graph.hpp"
#include "types.hpp"

namespace route_planner
{

// Plans routes over a network that must not change while the planner
// is in use. Each call returns its own PlanResult; the last_* accessors
// only mirror the most recent distance (-1 after a failed call).
class RoutePlanner
{
public:
    RoutePlanner(const RoadNetwork &network, const AttractionMapper &mapper, PlannerOptions options = {});

    PlanResult plan_optimal(const std::string &start, const std::string &end, const std::vector<std::string> &attraction_names);
    PlanResult plan_heuristic(const std::string &start, const std::string &end, const std::vector<std::string> &attraction_names);

    double last_optimal_distance() const;
    double last_heuristic_distance() const;

private:
    const RoadNetwork &network_;
    const AttractionMapper &mapper_;
    PlannerOptions options_;
    double last_optimal_distance_{-1.0};
    double last_heuristic_distance_{-1.0};
};

} // namespace route_planner
