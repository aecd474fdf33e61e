#pragma once
#include <chrono>
#include <string>

namespace XRobots {
namespace Core {

struct Constants {
    static constexpr const char* VERSION            = "0.1.0";
    static constexpr const char* HEADER_RULE_NAME   = "x-robots-tag";
    static constexpr const char* USER_AGENT_DEFAULT = "";
    static constexpr const char* USER_AGENT         = "XRobots-Checker/1.0";

    static constexpr int DEFAULT_THREADS         = 4;
    static constexpr int REQUEST_TIMEOUT_SECONDS = 10;
    static constexpr int MAX_REDIRECTS           = 5;
};

}  // namespace Core
}  // namespace XRobots
