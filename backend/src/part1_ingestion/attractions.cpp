#include "route_planner/attractions.hpp"

#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include "route_planner/csv.hpp"
#include "route_planner/fetch.hpp"

namespace route_planner
{

void AttractionMapper::add_attraction(const std::string &attraction, const std::string &city)
{
    attraction_to_city_[attraction] = city;
}

std::optional<std::string> AttractionMapper::resolve(const std::string &attraction) const
{
    const auto it = attraction_to_city_.find(attraction);
    if (it == attraction_to_city_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::size_t AttractionMapper::size() const
{
    return attraction_to_city_.size();
}

LoadSummary load_attractions(std::istream &input, AttractionMapper &mapper)
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
        if (fields.size() != 2 || fields[0].empty() || fields[1].empty())
        {
            std::cerr << "Warning: Skipping line " << line_number
                      << " in attractions file due to incorrect format: " << line << std::endl;
            summary.skipped_lines++;
            continue;
        }

        mapper.add_attraction(fields[0], fields[1]);
        summary.records++;
    }

    return summary;
}

LoadSummary load_attractions_from_source(const std::string &source, AttractionMapper &mapper)
{
    std::cout << "Loading attractions from: " << source << std::endl;

    std::istringstream input(read_source_text(source));
    const auto summary = load_attractions(input, mapper);

    std::cout << "Finished loading attractions. Found " << mapper.size() << " attractions." << std::endl;
    return summary;
}

} // namespace route_planner
