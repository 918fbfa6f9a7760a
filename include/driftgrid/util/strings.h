#pragma once

#include <string>
#include <string_view>

namespace driftgrid {

std::string to_lower(std::string s);

// Strips leading/trailing ASCII whitespace.
std::string trim(std::string_view s);

// printf-style "%.*f" without pulling iostreams into callers.
std::string format_fixed(double v, int decimals);

} // namespace driftgrid
