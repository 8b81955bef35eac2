#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace route_planner
{

constexpr double kUnreachable = std::numeric_limits<double>::infinity();
constexpr std::size_t kDefaultMaxExactWaypoints = 10;

using Road = std::pair<std::string, double>;
using Route = std::vector<std::string>;

struct DijkstraResult
{
    std::string source;
    std::unordered_map<std::string, double> distances;
    std::unordered_map<std::string, std::string> parents;
    long long computation_time_ms{};
    bool success{false};
    std::string error_message;
};

// One Dijkstra tree per key point, computed once per planning call.
using DistanceTable = std::unordered_map<std::string, DijkstraResult>;

enum class PlanStatus
{
    Ok,
    UnknownCity,
    Infeasible,
    TooManyWaypoints
};

struct PlanResult
{
    PlanStatus status{PlanStatus::Infeasible};
    Route path;
    std::vector<std::string> visit_order;
    double total_distance{-1.0};
    std::vector<std::string> skipped_attractions;
    long long computation_time_ms{};
    std::string error_message;

    bool ok() const
    {
        return status == PlanStatus::Ok;
    }
};

struct PlannerOptions
{
    std::size_t max_exact_waypoints{kDefaultMaxExactWaypoints};
};

const char *to_string(PlanStatus status);
std::string format_miles(double distance);

} // namespace route_planner
