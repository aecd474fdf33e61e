#include "string_utils.hpp"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"

namespace XRobots {
namespace Utils {
namespace Text {

std::string trim(const std::string& str) {
    return std::string(absl::StripAsciiWhitespace(str));
}

std::string to_lower(const std::string& str) {
    return absl::AsciiStrToLower(str);
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return absl::StartsWith(str, prefix);
}

bool iequals(const std::string& a, const std::string& b) {
    return absl::EqualsIgnoreCase(a, b);
}

bool icontains(const std::string& haystack, const std::string& needle) {
    return absl::StrContains(absl::AsciiStrToLower(haystack), absl::AsciiStrToLower(needle));
}

std::vector<std::string> split_trimmed(const std::string& str, char delim) {
    std::vector<std::string> parts = absl::StrSplit(str, delim);
    for (auto& part : parts)
        absl::StripAsciiWhitespace(&part);
    return parts;
}

std::pair<std::string, std::string> split_once(const std::string& str, char delim, bool* found) {
    auto pos = str.find(delim);
    if (found)
        *found = (pos != std::string::npos);
    if (pos == std::string::npos)
        return {str, ""};
    return {str.substr(0, pos), str.substr(pos + 1)};
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    return absl::StrJoin(parts, sep);
}

}  // namespace Text
}  // namespace Utils
}  // namespace XRobots
