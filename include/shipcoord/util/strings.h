#pragma once

#include <string>
#include <vector>

namespace shipcoord {

// ASCII lower-casing; enum names and CLI values are ASCII.
std::string to_lower(std::string s);

// Strips leading and trailing spaces, tabs and line breaks.
std::string trim(const std::string& s);

// Quotes a CSV cell when it holds a comma, quote or line break.
std::string csv_escape(const std::string& s);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

} // namespace shipcoord
