#pragma once

#include <string>
#include <vector>

namespace route_planner
{

std::string trim(const std::string &value);

// Splits on commas and trims every field. No quoting support: city and
// attraction names in the datasets never contain commas.
std::vector<std::string> split_record(const std::string &line);

bool is_blank(const std::string &line);

} // namespace route_planner
