#pragma once

#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "planner.hpp"
#include "types.hpp"

namespace route_planner
{

struct PlannerComparison
{
    std::string start;
    std::string end;
    std::vector<std::string> attractions;
    PlanResult optimal;
    PlanResult heuristic;
    double optimal_elapsed_ms{};
    double heuristic_elapsed_ms{};
};

PlannerComparison compare_planners(
    RoutePlanner &planner,
    const std::string &start,
    const std::string &end,
    const std::vector<std::string> &attraction_names);

nlohmann::json plan_to_json(const PlanResult &result);
nlohmann::json comparison_to_json(const PlannerComparison &comparison);

void print_plan(std::ostream &out, const std::string &title, const PlanResult &result);
void print_comparison(std::ostream &out, const PlannerComparison &comparison);

} // namespace route_planner
