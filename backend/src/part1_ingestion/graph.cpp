#include "route_planner/graph.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "route_planner/csv.hpp"
#include "route_planner/fetch.hpp"

namespace route_planner
{
namespace
{

std::optional<double> parse_distance(const std::string &field)
{
    try
    {
        std::size_t consumed = 0;
        const double value = std::stod(field, &consumed);
        if (consumed != field.size() || !std::isfinite(value) || value < 0.0)
        {
            return std::nullopt;
        }
        return value;
    }
    catch (const std::invalid_argument &)
    {
        return std::nullopt;
    }
    catch (const std::out_of_range &)
    {
        return std::nullopt;
    }
}

} // namespace

void RoadNetwork::add_road(const std::string &city_a, const std::string &city_b, double distance)
{
    adjacency_[city_a].push_back({city_b, distance});
    adjacency_[city_b].push_back({city_a, distance});
    road_count_++;
}

const std::vector<Road> &RoadNetwork::neighbours(const std::string &city) const
{
    static const std::vector<Road> no_roads;

    const auto it = adjacency_.find(city);
    if (it == adjacency_.end())
    {
        return no_roads;
    }
    return it->second;
}

std::vector<std::string> RoadNetwork::cities() const
{
    std::vector<std::string> names;
    names.reserve(adjacency_.size());
    for (const auto &entry : adjacency_)
    {
        names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool RoadNetwork::contains(const std::string &city) const
{
    return adjacency_.find(city) != adjacency_.end();
}

std::optional<double> RoadNetwork::shortest_road(const std::string &city_a, const std::string &city_b) const
{
    std::optional<double> best;
    for (const auto &[neighbour, distance] : neighbours(city_a))
    {
        if (neighbour == city_b && (!best || distance < *best))
        {
            best = distance;
        }
    }
    return best;
}

std::size_t RoadNetwork::city_count() const
{
    return adjacency_.size();
}

std::size_t RoadNetwork::road_count() const
{
    return road_count_;
}

bool RoadNetwork::empty() const
{
    return adjacency_.empty();
}

LoadSummary load_roads(std::istream &input, RoadNetwork &network)
{
    LoadSummary summary;
    std::string line;
    int line_number = 0;

    while (std::getline(input, line))
    {
        line_number++;
        if (is_blank(line))
        {
            continue;
        }

        const auto fields = split_record(line);
        if (fields.size() != 3)
        {
            std::cerr << "Warning: Skipping line " << line_number
                      << " due to incorrect number of columns: " << line << std::endl;
            summary.skipped_lines++;
            continue;
        }

        const auto distance = parse_distance(fields[2]);
        if (fields[0].empty() || fields[1].empty() || !distance)
        {
            std::cerr << "Warning: Skipping line " << line_number
                      << " due to invalid record: " << line << std::endl;
            summary.skipped_lines++;
            continue;
        }

        network.add_road(fields[0], fields[1], *distance);
        summary.records++;
    }

    return summary;
}

LoadSummary load_roads_from_source(const std::string &source, RoadNetwork &network)
{
    std::cout << "Loading roads from: " << source << std::endl;

    std::istringstream input(read_source_text(source));
    const auto summary = load_roads(input, network);

    std::cout << "Finished loading roads. " << summary.records << " roads, "
              << network.city_count() << " cities, "
              << summary.skipped_lines << " lines skipped." << std::endl;
    return summary;
}

} // namespace route_planner
