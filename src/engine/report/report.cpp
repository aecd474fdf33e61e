#include "report.hpp"
#include <sstream>
#include "../../utils/time/http_date.hpp"

namespace XRobots {
namespace Engine {

using namespace XRobots::Parser;

namespace {

void append_rules(std::ostringstream& out, const DirectiveMap& rules, const std::string& indent) {
    if (rules.empty()) {
        out << indent << "(no directives)\n";
        return;
    }
    for (const auto& [directive, value] : rules) {
        out << indent << to_string(directive);
        if (as_unavailable_after(value))
            out << ": " << Report::value_to_string(value);
        out << "\n";
    }
}

}  // namespace

std::string Report::value_to_string(const DirectiveValue& value) {
    if (const auto* expiry = as_unavailable_after(value)) {
        if (expiry->when)
            return Utils::Time::format_iso8601(*expiry->when);
        return expiry->text + " (unparsed)";
    }
    return is_present(value) ? "true" : "false";
}

nlohmann::json Report::value_to_json(const DirectiveValue& value) {
    if (const auto* expiry = as_unavailable_after(value)) {
        nlohmann::json j;
        j["text"] = expiry->text;
        j["time"] = expiry->when ? nlohmann::json(Utils::Time::format_iso8601(*expiry->when))
                                 : nlohmann::json(nullptr);
        return j;
    }
    return is_present(value);
}

nlohmann::json Report::rules_to_json(const DirectiveMap& rules) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [directive, value] : rules)
        j[to_string(directive)] = value_to_json(value);
    return j;
}

std::string Report::to_text(const CheckResult& result, ReportMode mode) {
    std::ostringstream out;
    out << result.url;
    if (!result.matched_user_agent.empty())
        out << " (user-agent: " << result.matched_user_agent << ")";
    out << "\n";
    if (!result.success)
        out << "  error: " << result.error << "\n";

    if (mode == ReportMode::Export) {
        if (result.scopes.empty())
            out << "  (no directives)\n";
        for (const auto& [scope, rules] : result.scopes) {
            out << "  [" << (scope.empty() ? "*" : scope) << "]\n";
            append_rules(out, rules, "    ");
        }
    }
    else {
        append_rules(out, result.rules, "  ");
    }
    return out.str();
}

nlohmann::json Report::to_json(const CheckResult& result, ReportMode mode) {
    nlohmann::json j;
    j["url"]        = result.url;
    j["user_agent"] = result.matched_user_agent;
    j["success"]    = result.success;
    if (!result.error.empty())
        j["error"] = result.error;

    if (mode == ReportMode::Export) {
        nlohmann::json scopes = nlohmann::json::object();
        for (const auto& [scope, rules] : result.scopes)
            scopes[scope] = rules_to_json(rules);
        j["scopes"] = scopes;
    }
    else {
        j["rules"] = rules_to_json(result.rules);
    }
    return j;
}

std::string Report::to_json_text(const std::vector<CheckResult>& results, ReportMode mode) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& result : results)
        j.push_back(to_json(result, mode));
    return j.dump(2);
}

}  // namespace Engine
}  // namespace XRobots
