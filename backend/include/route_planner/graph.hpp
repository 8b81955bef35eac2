#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace route_planner
{

class RoadNetwork
{
public:
    void add_road(const std::string &city_a, const std::string &city_b, double distance);

    const std::vector<Road> &neighbours(const std::string &city) const;
    std::vector<std::string> cities() const;
    bool contains(const std::string &city) const;
    std::optional<double> shortest_road(const std::string &city_a, const std::string &city_b) const;

    std::size_t city_count() const;
    std::size_t road_count() const;
    bool empty() const;

private:
    std::unordered_map<std::string, std::vector<Road>> adjacency_;
    std::size_t road_count_{0};
};

struct LoadSummary
{
    std::size_t records{0};
    std::size_t skipped_lines{0};
};

LoadSummary load_roads(std::istream &input, RoadNetwork &network);
LoadSummary load_roads_from_source(const std::string &source, RoadNetwork &network);

} // namespace route_planner
