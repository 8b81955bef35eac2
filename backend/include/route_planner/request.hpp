#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace route_planner
{

// Body of a POST /plan call. City names are left unresolved; the caller
// maps them onto the network with resolve_city_name.
struct PlanRequest
{
    std::string start;
    std::string end;
    std::vector<std::string> attractions;
    std::string mode{"optimal"};
};

bool is_known_mode(const std::string &mode);

// Throws std::invalid_argument for a malformed body.
PlanRequest parse_plan_request(const nlohmann::json &body);

} // namespace route_planner
