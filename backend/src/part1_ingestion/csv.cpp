#include "route_planner/csv.hpp"

#include <cctype>
#include <sstream>
#include <string>
#include <vector>

namespace route_planner
{

std::string trim(const std::string &value)
{
    std::size_t first = 0;
    while (first < value.size() && std::isspace(static_cast<unsigned char>(value[first])))
    {
        first++;
    }

    std::size_t last = value.size();
    while (last > first && std::isspace(static_cast<unsigned char>(value[last - 1])))
    {
        last--;
    }

    return value.substr(first, last - first);
}

std::vector<std::string> split_record(const std::string &line)
{
    std::vector<std::string> fields;
    std::stringstream stream(line);
    std::string field;

    while (std::getline(stream, field, ','))
    {
        fields.push_back(trim(field));
    }

    // getline drops a trailing empty field ("a,b,")
    if (!line.empty() && line.back() == ',')
    {
        fields.push_back("");
    }

    return fields;
}

bool is_blank(const std::string &line)
{
    return trim(line).empty();
}

} // namespace route_planner
