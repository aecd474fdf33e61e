#include "rebuild.hpp"

namespace XRobots {
namespace Parser {

namespace {

bool has(const DirectiveMap& rules, Directive directive) {
    auto it = rules.find(directive);
    return it != rules.end() && is_present(it->second);
}

bool is_expired(const DirectiveMap& rules, Utils::Time::TimePoint now) {
    auto it = rules.find(Directive::UnavailableAfter);
    if (it == rules.end())
        return false;
    const auto* value = as_unavailable_after(it->second);
    return value && value->when && *value->when <= now;
}

}  // namespace

const std::vector<Implication>& implication_table() {
    static const std::vector<Implication> table = {
        {Directive::None, {Directive::NoIndex, Directive::NoFollow}, true},
        {Directive::NoIndex, {Directive::NoArchive}, false},
        {Directive::NoSnippet, {Directive::NoArchive}, false}};
    return table;
}

DirectiveMap rebuild(const DirectiveMap& raw, Utils::Time::TimePoint now) {
    DirectiveMap rules = raw;

    if (is_expired(rules, now))
        rules.emplace(Directive::NoIndex, true);

    // Rows run in order, so directives added by one row trigger the rows below it.
    for (const auto& rule : implication_table()) {
        if (!has(rules, rule.trigger))
            continue;
        for (Directive implied : rule.implies)
            rules.emplace(implied, true);
        if (rule.replaces_trigger)
            rules.erase(rule.trigger);
    }

    if (rules.size() > 1)
        rules.erase(Directive::All);

    return rules;
}

}  // namespace Parser
}  // namespace XRobots
