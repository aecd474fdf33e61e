#pragma once

#include <string>
#include <utility>
#include <vector>

namespace XRobots {
namespace Utils {
namespace Text {

std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
bool        starts_with(const std::string& str, const std::string& prefix);

bool iequals(const std::string& a, const std::string& b);
bool icontains(const std::string& haystack, const std::string& needle);

// Splits on every occurrence of `delim`, trimming each piece. Empty pieces are kept.
std::vector<std::string> split_trimmed(const std::string& str, char delim);

// Splits on the first occurrence of `delim`. The second element is empty when
// `delim` is absent; `found` reports which case applied.
std::pair<std::string, std::string> split_once(const std::string& str, char delim, bool* found = nullptr);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

}  // namespace Text
}  // namespace Utils
}  // namespace XRobots
