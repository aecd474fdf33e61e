#include "x_robots_tag_parser.hpp"
#include <chrono>
#include "../core/logger/logger.hpp"
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"
#include "rebuild/rebuild.hpp"
#include "scanner/header_scanner.hpp"
#include "user_agent/user_agent_matcher.hpp"

namespace XRobots {
namespace Parser {

using namespace XRobots::Core;
using namespace XRobots::Utils;

XRobotsTagParser::XRobotsTagParser(const std::string&                    user_agent,
                                   const std::vector<std::string>&       headers,
                                   std::optional<Utils::Time::TimePoint> reference_time)
    : reference_time_(reference_time.value_or(std::chrono::system_clock::now())) {
    parse(headers);
    resolve_user_agent(user_agent);
}

XRobotsTagParser::XRobotsTagParser(const std::string&         url,
                                   const std::string&         user_agent,
                                   Network::Http::HttpClient& client,
                                   const ParserOptions&       options)
    : reference_time_(options.reference_time.value_or(std::chrono::system_clock::now())) {
    url_ = Text::trim(url);
    if (!Url::is_valid(url_))
        Logger::warn("Invalid URL: " + url_);
    url_ = Url::encode(url_);

    if (options.headers)
        parse(*options.headers);
    else
        parse(fetch_headers(client));
    resolve_user_agent(user_agent);
}

std::vector<std::string> XRobotsTagParser::fetch_headers(Network::Http::HttpClient& client) {
    Logger::info("Fetching headers: " + url_);
    Network::Http::Response res = client.head(url_);
    if (!res.success) {
        fetch_error_ = res.error.empty() ? "request failed" : res.error;
        Logger::error("Unable to fetch HTTP headers for " + url_ + ": " + fetch_error_);
        return {};
    }
    Logger::info("HTTP " + std::to_string(res.status_code) + " from " + res.effective_url);
    return res.headers;
}

void XRobotsTagParser::parse(const std::vector<std::string>& headers) {
    for (const auto& header : headers) {
        auto line = HeaderScanner::scan(header);
        if (!line)
            continue;
        Logger::debug("Scope '" + line->scope + "': " + std::to_string(line->directives.size())
                      + " directive(s) in '" + header + "'");
        rules_.add(*line);
    }
}

void XRobotsTagParser::resolve_user_agent(const std::string& user_agent) {
    auto scopes = rules_.scope_names();
    Logger::debug("Scopes: [" + Text::join(scopes, ", ") + "]");

    UserAgentMatcher matcher(user_agent);
    matched_user_agent_ = matcher.match(scopes, Constants::USER_AGENT_DEFAULT);
    if (!matched_user_agent_.empty())
        Logger::debug("User-agent '" + user_agent + "' matched scope '" + matched_user_agent_ + "'");
}

DirectiveMap XRobotsTagParser::get_rules(bool raw) const {
    DirectiveMap rules = rules_.overlay(matched_user_agent_);
    if (raw)
        return rules;
    return rebuild(rules, reference_time_);
}

const ScopeRules& XRobotsTagParser::export_rules() const {
    return rules_.scopes();
}

std::string XRobotsTagParser::get_directive_meaning(const std::string& directive) {
    return directive_meaning(directive);
}

}  // namespace Parser
}  // namespace XRobots
