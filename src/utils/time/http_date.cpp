#include "http_date.hpp"
#include <cctype>
#include <ctime>
#include <map>
#include <vector>
#include "../text/string_utils.hpp"

namespace XRobots {
namespace Utils {
namespace Time {

namespace {

const std::map<std::string, int>& zone_offsets() {
    static const std::map<std::string, int> zones = {
        {"gmt", 0},       {"ut", 0},        {"utc", 0},       {"z", 0},
        {"est", -5 * 60}, {"edt", -4 * 60}, {"cst", -6 * 60}, {"cdt", -5 * 60},
        {"mst", -7 * 60}, {"mdt", -6 * 60}, {"pst", -8 * 60}, {"pdt", -7 * 60}};
    return zones;
}

const std::vector<const char*>& date_formats() {
    static const std::vector<const char*> formats = {
        "%a, %d %b %Y %H:%M:%S",
        "%a, %d %b %Y %H:%M",
        "%a, %d-%b-%y %H:%M:%S",
        "%a, %d-%b-%Y %H:%M:%S",
        "%d %b %Y %H:%M:%S",
        "%d %b %Y %H:%M",
        "%a %b %d %H:%M:%S %Y",
        "%Y-%m-%dT%H:%M:%S",
        "%Y-%m-%dT%H:%M",
        "%Y-%m-%d %H:%M:%S",
        "%Y-%m-%d",
        "%a, %d %b %Y",
        "%d %b %Y"};
    return formats;
}

// "+hhmm", "-hh:mm", "+hh". Returns the offset in minutes.
std::optional<int> parse_numeric_offset(const std::string& s) {
    if (s.size() < 3 || (s[0] != '+' && s[0] != '-'))
        return std::nullopt;

    std::string digits;
    for (size_t i = 1; i < s.size(); ++i) {
        if (s[i] == ':' && i == 3)
            continue;
        if (!std::isdigit(static_cast<unsigned char>(s[i])))
            return std::nullopt;
        digits += s[i];
    }
    if (digits.size() != 2 && digits.size() != 4)
        return std::nullopt;

    int hours   = std::stoi(digits.substr(0, 2));
    int minutes = digits.size() == 4 ? std::stoi(digits.substr(2, 2)) : 0;
    if (hours > 14 || minutes > 59)
        return std::nullopt;

    int total = hours * 60 + minutes;
    return s[0] == '-' ? -total : total;
}

std::optional<int> parse_zone(const std::string& token) {
    auto it = zone_offsets().find(Text::to_lower(token));
    if (it != zone_offsets().end())
        return it->second;
    return parse_numeric_offset(token);
}

bool looks_like_iso(const std::string& s) {
    return s.size() >= 10 && s[4] == '-' && s[7] == '-';
}

// Strips a trailing zone from `s` and returns its offset in minutes.
int take_zone(std::string& s) {
    auto space = s.find_last_of(' ');
    if (space != std::string::npos) {
        if (auto offset = parse_zone(s.substr(space + 1))) {
            s = Text::trim(s.substr(0, space));
            return *offset;
        }
    }

    // 2010-06-25T15:00:00Z, 2010-06-25T15:00:00.250+02:00
    if (looks_like_iso(s) && s.size() > 19 && (s[10] == 'T' || s[10] == 't' || s[10] == ' ')) {
        std::string head = s.substr(0, 19);
        std::string tail = s.substr(19);
        if (!tail.empty() && tail[0] == '.') {
            size_t i = 1;
            while (i < tail.size() && std::isdigit(static_cast<unsigned char>(tail[i])))
                ++i;
            tail = tail.substr(i);
        }
        if (tail.empty()) {
            s = head;
            return 0;
        }
        if (auto offset = parse_zone(tail)) {
            s = head;
            return *offset;
        }
    }
    return 0;
}

bool only_whitespace(const char* p) {
    while (*p) {
        if (!std::isspace(static_cast<unsigned char>(*p)))
            return false;
        ++p;
    }
    return true;
}

}  // namespace

std::optional<TimePoint> parse_http_date(const std::string& text) {
    std::string s = Text::trim(text);
    if (s.empty())
        return std::nullopt;

    int offset_minutes = take_zone(s);

    for (const char* format : date_formats()) {
        std::tm     tm{};
        const char* end = strptime(s.c_str(), format, &tm);
        if (!end || !only_whitespace(end))
            continue;

        std::time_t utc = timegm(&tm) - static_cast<std::time_t>(offset_minutes) * 60;
        return std::chrono::system_clock::from_time_t(utc);
    }
    return std::nullopt;
}

std::string format_iso8601(TimePoint tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm     tm{};
    gmtime_r(&t, &tm);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

}  // namespace Time
}  // namespace Utils
}  // namespace XRobots
