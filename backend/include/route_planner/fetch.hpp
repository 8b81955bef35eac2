#pragma once

#include <string>

namespace route_planner
{

bool is_remote_source(const std::string &source);
std::string fetch_remote_text(const std::string &url);

// Reads a dataset from a local path or an http(s) URL.
std::string read_source_text(const std::string &source);

} // namespace route_planner
