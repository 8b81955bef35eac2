#include "route_planner/assembler.hpp"

#include <string>
#include <vector>

namespace route_planner
{

Route concatenate_segments(const std::vector<Route> &segments)
{
    Route final_path;

    for (std::size_t i = 0; i < segments.size(); i++)
    {
        const auto &segment = segments[i];
        if (segment.empty())
        {
            throw SegmentJoinError("Found empty segment " + std::to_string(i) + " during path concatenation.");
        }

        if (i == 0)
        {
            final_path.insert(final_path.end(), segment.begin(), segment.end());
            continue;
        }

        if (final_path.back() != segment.front())
        {
            throw SegmentJoinError("Path segments do not connect: last city was " + final_path.back() +
                                   ", next segment starts with " + segment.front() + ".");
        }
        final_path.insert(final_path.end(), segment.begin() + 1, segment.end());
    }

    return final_path;
}

} // namespace route_planner
