#pragma once
#include <string>
#include "directive.hpp"

namespace XRobots {
namespace Parser {

// Any text after the directive name is ignored.
DirectiveValue parse_flag(const std::string& fragment);

// Parses the date after the first colon. An unparsable or missing date still
// yields a value, with an empty `when`.
DirectiveValue parse_unavailable_after(const std::string& fragment);

// Dispatches through the directive table.
DirectiveValue parse_value(Directive directive, const std::string& fragment);

}  // namespace Parser
}  // namespace XRobots
