#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <unordered_map>

#include "graph.hpp"

namespace route_planner
{

class AttractionMapper
{
public:
    void add_attraction(const std::string &attraction, const std::string &city);
    std::optional<std::string> resolve(const std::string &attraction) const;
    std::size_t size() const;

private:
    std::unordered_map<std::string, std::string> attraction_to_city_;
};

LoadSummary load_attractions(std::istream &input, AttractionMapper &mapper);
LoadSummary load_attractions_from_source(const std::string &source, AttractionMapper &mapper);

} // namespace route_planner
