#include "route_planner/keypoints.hpp"

#include <cctype>
#include <iostream>
#include <string>
#include <unordered_set>
#include <vector>

#include "route_planner/csv.hpp"

namespace route_planner
{
namespace
{

bool is_state_code(const std::string &input)
{
    return input.size() == 2 &&
           std::isupper(static_cast<unsigned char>(input[0])) &&
           std::isupper(static_cast<unsigned char>(input[1]));
}

bool ends_with(const std::string &value, const std::string &suffix)
{
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string join(const std::vector<std::string> &items)
{
    std::string joined;
    for (std::size_t i = 0; i < items.size(); i++)
    {
        if (i > 0)
        {
            joined += ", ";
        }
        joined += items[i];
    }
    return joined;
}

} // namespace

WaypointResolution resolve_waypoints(
    const AttractionMapper &mapper,
    const std::string &start,
    const std::string &end,
    const std::vector<std::string> &attraction_names)
{
    WaypointResolution resolution;
    std::unordered_set<std::string> seen;

    for (const auto &name : attraction_names)
    {
        const auto city = mapper.resolve(name);
        if (!city)
        {
            std::cerr << "Warning: Attraction '" << name << "' not found. Skipping." << std::endl;
            resolution.unknown_attractions.push_back(name);
            continue;
        }

        if (*city == start || *city == end)
        {
            continue;
        }

        if (seen.insert(*city).second)
        {
            resolution.waypoints.push_back(*city);
        }
    }

    return resolution;
}

std::vector<std::string> collect_key_points(
    const std::string &start,
    const std::string &end,
    const std::vector<std::string> &waypoints)
{
    std::vector<std::string> key_points;
    key_points.reserve(waypoints.size() + 2);
    key_points.push_back(start);
    if (end != start)
    {
        key_points.push_back(end);
    }
    key_points.insert(key_points.end(), waypoints.begin(), waypoints.end());
    return key_points;
}

CityResolution resolve_city_name(const RoadNetwork &network, const std::string &input)
{
    CityResolution resolution;
    const std::string name = trim(input);

    if (name.empty())
    {
        resolution.error_message = "input can not be empty.";
        return resolution;
    }

    if (network.contains(name))
    {
        resolution.city = name;
        return resolution;
    }

    if (is_state_code(name))
    {
        std::vector<std::string> matches;
        for (const auto &city : network.cities())
        {
            if (ends_with(city, " " + name))
            {
                matches.push_back(city);
            }
        }

        if (matches.size() == 1)
        {
            resolution.city = matches.front();
        }
        else if (matches.empty())
        {
            resolution.error_message = "no city found for state abbreviation '" + name + "'.";
        }
        else
        {
            resolution.error_message = "state abbreviation '" + name + "' matches multiple cities (" +
                                       join(matches) + "). Please enter the full 'City ST' name.";
        }
        return resolution;
    }

    resolution.error_message = "city or state abbreviation '" + name + "' not recognised.";
    return resolution;
}

} // namespace route_planner
