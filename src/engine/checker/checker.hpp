#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../../core/types/constants.hpp"
#include "../../network/http/http_client.hpp"
#include "../../parser/directive/directive.hpp"
#include "../../parser/rules/rule_set.hpp"

namespace XRobots {
namespace Engine {

struct CheckerConfig {
    std::string                             user_agent = Core::Constants::USER_AGENT_DEFAULT;
    std::optional<std::vector<std::string>> headers;
    bool                                    raw     = false;
    int                                     threads = Core::Constants::DEFAULT_THREADS;
    int                                     timeout = Core::Constants::REQUEST_TIMEOUT_SECONDS;
};

struct CheckResult {
    std::string          url;
    std::string          matched_user_agent;
    Parser::DirectiveMap rules;
    Parser::ScopeRules   scopes;
    std::string          error;
    bool                 success = false;
};

// Checks many URLs in parallel. Every URL gets its own parser and HTTP client,
// so tasks share nothing but the configuration.
class Checker {
public:
    using ClientFactory = std::function<std::unique_ptr<Network::Http::HttpClient>()>;

    explicit Checker(const CheckerConfig& config);
    Checker(const CheckerConfig& config, ClientFactory factory);

    // Results follow the order of `urls`.
    std::vector<CheckResult> check(const std::vector<std::string>& urls) const;
    CheckResult              check_one(const std::string& url) const;

private:
    CheckerConfig config_;
    ClientFactory factory_;
};

}  // namespace Engine
}  // namespace XRobots
