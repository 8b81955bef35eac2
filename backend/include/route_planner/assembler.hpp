#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "types.hpp"

namespace route_planner
{

class SegmentJoinError : public std::logic_error
{
public:
    explicit SegmentJoinError(const std::string &message)
        : std::logic_error(message) {}
};

// Joins shortest-path segments where the last city of each segment is
// the first city of the next. Throws SegmentJoinError on an empty
// segment or a mismatched join.
Route concatenate_segments(const std::vector<Route> &segments);

} // namespace route_planner
