#pragma once

#include <string>
#include <vector>

#include "attractions.hpp"
#include "graph.hpp"

namespace route_planner
{

struct WaypointResolution
{
    std::vector<std::string> waypoints;
    std::vector<std::string> unknown_attractions;
};

struct CityResolution
{
    std::string city;
    std::string error_message;

    bool has_error() const
    {
        return !error_message.empty();
    }
};

WaypointResolution resolve_waypoints(
    const AttractionMapper &mapper,
    const std::string &start,
    const std::string &end,
    const std::vector<std::string> &attraction_names);

std::vector<std::string> collect_key_points(
    const std::string &start,
    const std::string &end,
    const std::vector<std::string> &waypoints);

// Accepts an exact "City ST" name or a two-letter state code that
// matches exactly one city.
CityResolution resolve_city_name(const RoadNetwork &network, const std::string &input);

} // namespace route_planner
