#include <httplib.h>
#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <string>

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

using json = nlohmann::json;

void send_error(httplib::Response &res, int status, const std::string &message)
{
    json error;
    error["status"] = "error";
    error["message"] = message;
    res.status = status;
    res.set_content(error.dump(), "application/json");
}

} // namespace
} // namespace route_planner

int main(int argc, char **argv)
{
    using namespace route_planner;

    PlannerConfig config;
    RoadNetwork network;
    AttractionMapper mapper;

    try
    {
        if (argc > 1)
        {
            config = load_config(argv[1]);
        }

        load_roads_from_source(config.roads_source, network);
        load_attractions_from_source(config.attractions_source, mapper);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Error during data loading: " << ex.what() << std::endl;
        return 1;
    }

    if (network.empty())
    {
        std::cerr << "Error: road network is empty, nothing to plan on." << std::endl;
        return 1;
    }
    std::cout << "Data loading complete. " << network.city_count() << " cities found." << std::endl;

    const PlannerOptions options = planner_options(config);

    httplib::Server server;

    server.set_pre_routing_handler([](const httplib::Request &req, httplib::Response &res)
                                   {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        if (req.method == "OPTIONS")
        {
            res.status = 200;
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled; });

    server.Get("/health", [&](const httplib::Request &, httplib::Response &res)
               {
        json response;
        response["status"] = "success";
        response["cities_count"] = network.city_count();
        response["roads_count"] = network.road_count();
        response["attractions_count"] = mapper.size();
        response["max_exact_waypoints"] = options.max_exact_waypoints;
        res.set_content(response.dump(), "application/json"); });

    server.Get("/cities", [&](const httplib::Request &, httplib::Response &res)
               {
        json response;
        response["status"] = "success";
        response["cities"] = network.cities();
        res.set_content(response.dump(), "application/json"); });

    // The network and mapper are read-only from here on, so concurrent
    // requests each get their own planner without locking.
    server.Post("/plan", [&](const httplib::Request &req, httplib::Response &res)
                {
        PlanRequest request;

        try
        {
            request = parse_plan_request(json::parse(req.body));
        }
        catch (const std::exception &ex)
        {
            send_error(res, 400, ex.what());
            return;
        }

        const CityResolution start = resolve_city_name(network, request.start);
        const CityResolution end = resolve_city_name(network, request.end);
        const auto &attractions = request.attractions;
        const auto &mode = request.mode;

        if (start.has_error() || end.has_error())
        {
            std::string message = "Input error:";
            if (start.has_error())
            {
                message += " start city: " + start.error_message;
            }
            if (end.has_error())
            {
                message += " end city: " + end.error_message;
            }
            send_error(res, 400, message);
            return;
        }

        try
        {
            RoutePlanner planner(network, mapper, options);

            json response;
            response["status"] = "success";
            response["start"] = start.city;
            response["end"] = end.city;

            if (mode == "compare")
            {
                response["comparison"] = comparison_to_json(compare_planners(planner, start.city, end.city, attractions));
            }
            else if (mode == "heuristic")
            {
                response["result"] = plan_to_json(planner.plan_heuristic(start.city, end.city, attractions));
            }
            else
            {
                response["result"] = plan_to_json(planner.plan_optimal(start.city, end.city, attractions));
            }

            res.set_content(response.dump(), "application/json");
        }
        catch (const std::exception &ex)
        {
            std::cerr << "Planning failed: " << ex.what() << std::endl;
            send_error(res, 500, ex.what());
        } });

    std::cout << "Server starting on http://" << config.host << ":" << config.port << std::endl;
    if (!server.listen(config.host.c_str(), config.port))
    {
        std::cerr << "Unable to listen on " << config.host << ":" << config.port << std::endl;
        return 1;
    }
    return 0;
}
