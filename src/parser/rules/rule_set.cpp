#include "rule_set.hpp"
#include "../../core/types/constants.hpp"

namespace XRobots {
namespace Parser {

using XRobots::Core::Constants;

void RuleSet::add(const std::string& scope, Directive directive, DirectiveValue value) {
    rules_[scope][directive] = std::move(value);
}

void RuleSet::add(const ParsedHeaderLine& line) {
    for (const auto& scanned : line.directives)
        add(line.scope, scanned.directive, scanned.value);
}

const ScopeRules& RuleSet::scopes() const {
    return rules_;
}

std::vector<std::string> RuleSet::scope_names() const {
    std::vector<std::string> names;
    names.reserve(rules_.size());
    for (const auto& [scope, directives] : rules_)
        names.push_back(scope);
    return names;
}

const DirectiveMap* RuleSet::find(const std::string& scope) const {
    auto it = rules_.find(scope);
    return it != rules_.end() ? &it->second : nullptr;
}

bool RuleSet::empty() const {
    return rules_.empty();
}

DirectiveMap RuleSet::overlay(const std::string& scope) const {
    DirectiveMap merged;
    if (const auto* defaults = find(Constants::USER_AGENT_DEFAULT))
        merged = *defaults;
    if (scope == Constants::USER_AGENT_DEFAULT)
        return merged;
    if (const auto* scoped = find(scope)) {
        for (const auto& [directive, value] : *scoped)
            merged[directive] = value;
    }
    return merged;
}

}  // namespace Parser
}  // namespace XRobots
