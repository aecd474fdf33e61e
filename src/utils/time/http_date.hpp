#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace XRobots {
namespace Utils {
namespace Time {

using TimePoint = std::chrono::system_clock::time_point;

// Parses the date formats crawlers accept in `unavailable_after`: RFC 1123,
// RFC 850, asctime and ISO 8601, with an optional zone suffix (GMT, UTC, the
// US zone abbreviations, Z, or a numeric offset). A missing zone means UTC.
std::optional<TimePoint> parse_http_date(const std::string& text);

// ISO 8601 in UTC, e.g. 2010-06-25T23:00:00Z.
std::string format_iso8601(TimePoint tp);

}  // namespace Time
}  // namespace Utils
}  // namespace XRobots
