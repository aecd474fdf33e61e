#pragma once
#include <string>

namespace XRobots {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
};

class Url {
public:
    static UrlParsed parse(const std::string& url);

    // An absolute http(s) URL with a non-empty host and a numeric port in range, if present.
    static bool is_valid(const std::string& url);

    // Percent-encodes bytes that may not appear literally in a URL. Existing
    // escapes and reserved characters are left untouched.
    static std::string encode(const std::string& url);
};

}  // namespace Utils
}  // namespace XRobots
