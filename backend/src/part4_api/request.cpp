#include "route_planner/request.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace route_planner
{
namespace
{

std::vector<std::string> read_attractions(const nlohmann::json &body)
{
    std::vector<std::string> attractions;
    if (!body.contains("attractions"))
    {
        return attractions;
    }

    const auto &list = body["attractions"];
    if (!list.is_array())
    {
        throw std::invalid_argument("'attractions' must be an array of names.");
    }
    for (const auto &name : list)
    {
        if (!name.is_string())
        {
            throw std::invalid_argument("'attractions' must be an array of names.");
        }
        attractions.push_back(name.get<std::string>());
    }
    return attractions;
}

std::string read_string(const nlohmann::json &body, const char *key, const std::string &fallback)
{
    if (!body.contains(key))
    {
        return fallback;
    }
    if (!body[key].is_string())
    {
        throw std::invalid_argument("'" + std::string(key) + "' must be a string.");
    }
    return body[key].get<std::string>();
}

} // namespace

bool is_known_mode(const std::string &mode)
{
    return mode == "optimal" || mode == "heuristic" || mode == "compare";
}

PlanRequest parse_plan_request(const nlohmann::json &body)
{
    if (!body.is_object())
    {
        throw std::invalid_argument("Request body must be a JSON object.");
    }

    PlanRequest request;
    request.start = read_string(body, "start", "");
    request.end = read_string(body, "end", "");
    request.mode = read_string(body, "mode", request.mode);
    request.attractions = read_attractions(body);

    if (!is_known_mode(request.mode))
    {
        throw std::invalid_argument("Unknown mode '" + request.mode + "'. Use optimal, heuristic or compare.");
    }
    return request;
}

} // namespace route_planner
