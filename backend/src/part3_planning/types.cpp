#include "route_planner/types.hpp"

#include <iomanip>
#include <sstream>
#include <string>

namespace route_planner
{

const char *to_string(PlanStatus status)
{
    switch (status)
    {
    case PlanStatus::Ok:
        return "ok";
    case PlanStatus::UnknownCity:
        return "unknown_city";
    case PlanStatus::Infeasible:
        return "infeasible";
    case PlanStatus::TooManyWaypoints:
        return "too_many_waypoints";
    }
    return "unknown";
}

std::string format_miles(double distance)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << distance << " miles";
    return out.str();
}

} // namespace route_planner
