#pragma once
#include <optional>
#include <string>
#include <vector>

#include "../network/http/http_client.hpp"
#include "../utils/time/http_date.hpp"
#include "directive/directive.hpp"
#include "rules/rule_set.hpp"

namespace XRobots {
namespace Parser {

struct ParserOptions {
    // Pre-fetched header lines. When set, no request is made.
    std::optional<std::vector<std::string>> headers;
    // Instant `unavailable_after` is compared against. Defaults to construction time.
    std::optional<Utils::Time::TimePoint> reference_time;
};

/**
 * X-Robots-Tag rules for one resource, as seen by one crawler.
 *
 * Headers are scanned and the crawler's scope resolved once, at construction.
 * Queries only combine the default scope with the resolved one.
 */
class XRobotsTagParser {
public:
    XRobotsTagParser(const std::string&                    user_agent,
                     const std::vector<std::string>&       headers,
                     std::optional<Utils::Time::TimePoint> reference_time = std::nullopt);

    // Fetches the headers of `url` through `client` unless `options.headers` is set.
    // An invalid URL is reported as a warning, a failed fetch as an error; neither throws.
    XRobotsTagParser(const std::string&         url,
                     const std::string&         user_agent,
                     Network::Http::HttpClient& client,
                     const ParserOptions&       options = {});

    // Default scope overlaid with the matched scope; normalized unless `raw`.
    DirectiveMap      get_rules(bool raw = false) const;
    const ScopeRules& export_rules() const;

    const std::string& matched_user_agent() const {
        return matched_user_agent_;
    }
    const std::string& url() const {
        return url_;
    }
    bool fetch_failed() const {
        return !fetch_error_.empty();
    }
    const std::string& fetch_error() const {
        return fetch_error_;
    }

    // Throws UnknownDirectiveError for names that are not directives.
    static std::string get_directive_meaning(const std::string& directive);

private:
    void parse(const std::vector<std::string>& headers);
    void resolve_user_agent(const std::string& user_agent);
    std::vector<std::string> fetch_headers(Network::Http::HttpClient& client);

    std::string            url_;
    RuleSet                rules_;
    std::string            matched_user_agent_;
    std::string            fetch_error_;
    Utils::Time::TimePoint reference_time_;
};

}  // namespace Parser
}  // namespace XRobots
