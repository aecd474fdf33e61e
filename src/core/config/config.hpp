#pragma once
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace XRobots {
namespace Core {

struct Config {
    std::vector<std::string> urls;
    std::string              user_agent = Constants::USER_AGENT_DEFAULT;
    std::vector<std::string> headers;  // pre-fetched header lines
    std::string              headers_file;
    std::string              meaning;  // directive to describe instead of checking
    bool                     raw         = false;
    bool                     export_all  = false;
    bool                     json        = false;
    int                      threads     = Constants::DEFAULT_THREADS;
    int                      timeout     = Constants::REQUEST_TIMEOUT_SECONDS;  // seconds
    std::string              log_level   = "warn";
    std::string              config_path;

    static Config parse(int argc, char* argv[]);
};

// Reads one header line per line of `path`. Blank lines and lines starting with '#' are skipped.
std::vector<std::string> load_header_lines(const std::string& path);

}  // namespace Core
}  // namespace XRobots
