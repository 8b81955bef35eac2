#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "route_planner/attractions.hpp"
#include "route_planner/config.hpp"
#include "route_planner/graph.hpp"
#include "route_planner/keypoints.hpp"
#include "route_planner/planner.hpp"
#include "route_planner/report.hpp"
#include "route_planner/request.hpp"

namespace route_planner
{
namespace
{

struct CliRequest
{
    std::string config_path;
    std::string roads_source;
    std::string attractions_source;
    std::string from;
    std::string to;
    std::vector<std::string> via;
    std::string mode{"compare"};
    bool json_output{false};
};

void print_usage(const char *program)
{
    std::cerr << "Usage: " << program
              << " --from CITY --to CITY [--via ATTRACTION]... [--mode optimal|heuristic|compare]"
              << " [--config FILE] [--roads SOURCE] [--attractions SOURCE] [--json]" << std::endl;
}

CliRequest parse_arguments(int argc, char **argv)
{
    CliRequest request;

    for (int i = 1; i < argc; i++)
    {
        const std::string arg = argv[i];
        if (arg == "--json")
        {
            request.json_output = true;
            continue;
        }

        if (i + 1 >= argc)
        {
            throw std::invalid_argument("Missing value for " + arg);
        }
        const std::string value = argv[++i];

        if (arg == "--config")
        {
            request.config_path = value;
        }
        else if (arg == "--roads")
        {
            request.roads_source = value;
        }
        else if (arg == "--attractions")
        {
            request.attractions_source = value;
        }
        else if (arg == "--from")
        {
            request.from = value;
        }
        else if (arg == "--to")
        {
            request.to = value;
        }
        else if (arg == "--via")
        {
            request.via.push_back(value);
        }
        else if (arg == "--mode")
        {
            request.mode = value;
        }
        else
        {
            throw std::invalid_argument("Unknown option " + arg);
        }
    }

    if (request.from.empty() || request.to.empty())
    {
        throw std::invalid_argument("--from and --to are required.");
    }
    if (!is_known_mode(request.mode))
    {
        throw std::invalid_argument("Unknown mode '" + request.mode + "'.");
    }

    return request;
}

} // namespace
} // namespace route_planner

int main(int argc, char **argv)
{
    using namespace route_planner;

    CliRequest request;
    try
    {
        request = parse_arguments(argc, argv);
    }
    catch (const std::invalid_argument &ex)
    {
        std::cerr << ex.what() << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    try
    {
        PlannerConfig config;
        if (!request.config_path.empty())
        {
            config = load_config(request.config_path);
        }
        if (!request.roads_source.empty())
        {
            config.roads_source = request.roads_source;
        }
        if (!request.attractions_source.empty())
        {
            config.attractions_source = request.attractions_source;
        }

        RoadNetwork network;
        AttractionMapper mapper;
        load_roads_from_source(config.roads_source, network);
        load_attractions_from_source(config.attractions_source, mapper);

        const auto start = resolve_city_name(network, request.from);
        const auto end = resolve_city_name(network, request.to);
        if (start.has_error() || end.has_error())
        {
            if (start.has_error())
            {
                std::cerr << "Input error: start city: " << start.error_message << std::endl;
            }
            if (end.has_error())
            {
                std::cerr << "Input error: end city: " << end.error_message << std::endl;
            }
            return 2;
        }

        RoutePlanner planner(network, mapper, planner_options(config));

        if (request.mode == "compare")
        {
            const auto comparison = compare_planners(planner, start.city, end.city, request.via);
            if (request.json_output)
            {
                std::cout << comparison_to_json(comparison).dump(2) << std::endl;
            }
            else
            {
                print_comparison(std::cout, comparison);
            }
            return comparison.optimal.ok() ? 0 : 3;
        }

        const auto result = request.mode == "heuristic"
                                ? planner.plan_heuristic(start.city, end.city, request.via)
                                : planner.plan_optimal(start.city, end.city, request.via);
        if (request.json_output)
        {
            std::cout << plan_to_json(result).dump(2) << std::endl;
        }
        else
        {
            print_plan(std::cout, request.mode == "heuristic" ? "Heuristic (Nearest Neighbor)" : "Optimal (Dijkstra + Permutations)", result);
        }
        return result.ok() ? 0 : 3;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
