#pragma once
#include <string>
#include <vector>

#include "../../core/types/constants.hpp"

namespace XRobots {
namespace Parser {

// Picks the header scope that applies to a crawler. A scope matches when it
// appears inside the crawler's user-agent ("googlebot" in
// "Mozilla/5.0 (compatible; Googlebot/2.1)") or the other way round. The
// longest matching scope wins.
class UserAgentMatcher {
public:
    explicit UserAgentMatcher(const std::string& user_agent);

    std::string match(const std::vector<std::string>& scopes,
                      const std::string& fallback = Core::Constants::USER_AGENT_DEFAULT) const;

private:
    bool matches(const std::string& scope) const;

    std::string user_agent_;
};

}  // namespace Parser
}  // namespace XRobots
