#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace route_planner
{

struct PlannerConfig
{
    std::string roads_source{"data/roads.csv"};
    std::string attractions_source{"data/attractions.csv"};
    std::string host{"0.0.0.0"};
    int port{8080};
    std::size_t max_exact_waypoints{kDefaultMaxExactWaypoints};
};

PlannerConfig config_from_json(const nlohmann::json &body);
PlannerConfig load_config(const std::string &path);
PlannerOptions planner_options(const PlannerConfig &config);

} // namespace route_planner
