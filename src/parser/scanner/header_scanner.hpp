#pragma once
#include <optional>
#include <string>
#include <vector>

#include "../directive/directive.hpp"

namespace XRobots {
namespace Parser {

struct ScannedDirective {
    Directive      directive;
    std::string    fragment;
    DirectiveValue value;
};

struct ParsedHeaderLine {
    std::string                   scope;  // empty for the default scope
    std::vector<ScannedDirective> directives;
};

class HeaderScanner {
public:
    // Returns std::nullopt for lines that are not X-Robots-Tag headers. A
    // matching line may still carry no recognized directive.
    static std::optional<ParsedHeaderLine> scan(const std::string& line);

private:
    static std::string take_scope(std::vector<std::string>& fragments);
    static bool        is_value_continuation(const std::string& value_fragment,
                                             const std::string& fragment);
};

}  // namespace Parser
}  // namespace XRobots
