#include "route_planner/report.hpp"

#include <chrono>
#include <iomanip>
#include <ostream>
#include <string>
#include <vector>

namespace route_planner
{
namespace
{

using json = nlohmann::json;

double elapsed_ms(std::chrono::high_resolution_clock::time_point start_time,
                  std::chrono::high_resolution_clock::time_point end_time)
{
    return std::chrono::duration<double, std::milli>(end_time - start_time).count();
}

std::string format_route(const Route &path)
{
    std::string joined = "[";
    for (std::size_t i = 0; i < path.size(); i++)
    {
        if (i > 0)
        {
            joined += ", ";
        }
        joined += path[i];
    }
    return joined + "]";
}

} // namespace

PlannerComparison compare_planners(
    RoutePlanner &planner,
    const std::string &start,
    const std::string &end,
    const std::vector<std::string> &attraction_names)
{
    PlannerComparison comparison;
    comparison.start = start;
    comparison.end = end;
    comparison.attractions = attraction_names;

    const auto optimal_start = std::chrono::high_resolution_clock::now();
    comparison.optimal = planner.plan_optimal(start, end, attraction_names);
    const auto optimal_end = std::chrono::high_resolution_clock::now();
    comparison.optimal_elapsed_ms = elapsed_ms(optimal_start, optimal_end);

    const auto heuristic_start = std::chrono::high_resolution_clock::now();
    comparison.heuristic = planner.plan_heuristic(start, end, attraction_names);
    const auto heuristic_end = std::chrono::high_resolution_clock::now();
    comparison.heuristic_elapsed_ms = elapsed_ms(heuristic_start, heuristic_end);

    return comparison;
}

json plan_to_json(const PlanResult &result)
{
    json result_json;
    result_json["status"] = to_string(result.status);
    result_json["path"] = result.path;
    result_json["visit_order"] = result.visit_order;
    result_json["total_distance"] = result.ok() ? json(result.total_distance) : json();
    result_json["skipped_attractions"] = result.skipped_attractions;
    result_json["computation_time_ms"] = result.computation_time_ms;
    if (!result.error_message.empty())
    {
        result_json["error_message"] = result.error_message;
    }
    return result_json;
}

json comparison_to_json(const PlannerComparison &comparison)
{
    json response;
    response["start"] = comparison.start;
    response["end"] = comparison.end;
    response["attractions"] = comparison.attractions;
    response["optimal"] = plan_to_json(comparison.optimal);
    response["heuristic"] = plan_to_json(comparison.heuristic);
    response["timing"] = {
        {"optimal_ms", comparison.optimal_elapsed_ms},
        {"heuristic_ms", comparison.heuristic_elapsed_ms}};

    if (comparison.optimal.ok() && comparison.heuristic.ok())
    {
        response["heuristic_excess"] = comparison.heuristic.total_distance - comparison.optimal.total_distance;
    }
    return response;
}

void print_plan(std::ostream &out, const std::string &title, const PlanResult &result)
{
    out << "\n" << title << ":" << std::endl;
    if (result.ok())
    {
        out << "  Route: " << format_route(result.path) << std::endl;
        out << "  Distance: " << format_miles(result.total_distance) << std::endl;
    }
    else
    {
        out << "  Route: Not found or path is impossible (" << to_string(result.status) << ")." << std::endl;
        out << "  Distance: N/A" << std::endl;
    }

    if (!result.skipped_attractions.empty())
    {
        out << "  Skipped attractions: " << format_route(result.skipped_attractions) << std::endl;
    }
}

void print_comparison(std::ostream &out, const PlannerComparison &comparison)
{
    const auto saved_flags = out.flags();
    const auto saved_precision = out.precision();

    out << "\n==================================================" << std::endl;
    out << "Test Case:" << std::endl;
    out << "  From: " << comparison.start << std::endl;
    out << "  To:   " << comparison.end << std::endl;
    out << "  Via:  " << (comparison.attractions.empty() ? std::string("None") : format_route(comparison.attractions)) << std::endl;
    out << "--------------------------------------------------" << std::endl;

    print_plan(out, "Optimal (Dijkstra + Permutations)", comparison.optimal);
    out << "  Execution Time: " << std::fixed << std::setprecision(3)
        << comparison.optimal_elapsed_ms << " ms" << std::endl;

    print_plan(out, "Heuristic (Nearest Neighbor)", comparison.heuristic);
    out << "  Execution Time: " << std::fixed << std::setprecision(3)
        << comparison.heuristic_elapsed_ms << " ms" << std::endl;

    out << "==================================================" << std::endl;
    out.flags(saved_flags);
    out.precision(saved_precision);
}

} // namespace route_planner
