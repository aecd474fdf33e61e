#include "user_agent_matcher.hpp"
#include "../../utils/text/string_utils.hpp"

namespace XRobots {
namespace Parser {

using namespace XRobots::Utils;

UserAgentMatcher::UserAgentMatcher(const std::string& user_agent)
    : user_agent_(Text::to_lower(Text::trim(user_agent))) {}

bool UserAgentMatcher::matches(const std::string& scope) const {
    std::string token = Text::to_lower(Text::trim(scope));
    if (token.empty() || user_agent_.empty())
        return false;
    return Text::icontains(user_agent_, token) || Text::icontains(token, user_agent_);
}

std::string UserAgentMatcher::match(const std::vector<std::string>& scopes,
                                    const std::string&              fallback) const {
    if (user_agent_.empty())
        return fallback;

    const std::string* best = nullptr;
    for (const auto& scope : scopes) {
        if (!matches(scope))
            continue;
        if (!best || scope.size() > best->size() || (scope.size() == best->size() && scope < *best))
            best = &scope;
    }
    return best ? *best : fallback;
}

}  // namespace Parser
}  // namespace XRobots
