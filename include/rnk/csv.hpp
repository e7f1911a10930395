#pragma once
#include <optional>
#include <string>
#include <vector>

namespace rnk::csv {

// Minimal CSV: no quoting, comma separated, cells trimmed.
std::string trim(std::string s);
std::vector<std::string> split_line(const std::string& line);

// Skip blank lines and '#' comments; returns the trimmed line otherwise.
std::optional<std::string> content_line(const std::string& line);

// Whole-cell parses; nullopt on trailing junk or overflow.
std::optional<double> to_double(const std::string& s);
std::optional<int> to_int(const std::string& s);

} // namespace rnk::csv
