#include "route_planner/config.hpp"

#include <cstddef>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace route_planner
{

PlannerConfig config_from_json(const nlohmann::json &body)
{
    if (!body.is_object())
    {
        throw std::runtime_error("Configuration must be a JSON object.");
    }

    PlannerConfig config;
    config.roads_source = body.value("roads", config.roads_source);
    config.attractions_source = body.value("attractions", config.attractions_source);
    config.host = body.value("host", config.host);
    config.port = body.value("port", config.port);
    const long long max_exact_waypoints = body.value("max_exact_waypoints", static_cast<long long>(config.max_exact_waypoints));

    if (config.port <= 0 || config.port > 65535)
    {
        throw std::runtime_error("Configuration port out of range: " + std::to_string(config.port));
    }
    if (max_exact_waypoints < 0)
    {
        throw std::runtime_error("Configuration max_exact_waypoints must not be negative: " + std::to_string(max_exact_waypoints));
    }
    config.max_exact_waypoints = static_cast<std::size_t>(max_exact_waypoints);

    return config;
}

PlannerConfig load_config(const std::string &path)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        throw std::runtime_error("Unable to open " + path);
    }

    try
    {
        const auto body = nlohmann::json::parse(in);
        std::cout << "Loaded configuration from " << path << std::endl;
        return config_from_json(body);
    }
    catch (const nlohmann::json::exception &ex)
    {
        throw std::runtime_error("Invalid configuration in " + path + ": " + ex.what());
    }
}

PlannerOptions planner_options(const PlannerConfig &config)
{
    PlannerOptions options;
    options.max_exact_waypoints = config.max_exact_waypoints;
    return options;
}

} // namespace route_planner
