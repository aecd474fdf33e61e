#pragma once
#include <map>
#include <string>
#include <vector>

#include "../directive/directive.hpp"
#include "../scanner/header_scanner.hpp"

namespace XRobots {
namespace Parser {

// scope -> directive -> value. The default scope is the empty string.
using ScopeRules = std::map<std::string, DirectiveMap>;

class RuleSet {
public:
    RuleSet() = default;

    // Later writes to the same scope and directive replace earlier ones.
    void add(const std::string& scope, Directive directive, DirectiveValue value);
    void add(const ParsedHeaderLine& line);

    const ScopeRules&        scopes() const;
    std::vector<std::string> scope_names() const;
    const DirectiveMap*      find(const std::string& scope) const;
    bool                     empty() const;

    // Default scope rules with `scope` rules laid over them.
    DirectiveMap overlay(const std::string& scope) const;

private:
    ScopeRules rules_;
};

}  // namespace Parser
}  // namespace XRobots
