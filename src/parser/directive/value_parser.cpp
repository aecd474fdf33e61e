#include "value_parser.hpp"
#include "../../core/logger/logger.hpp"
#include "../../utils/text/string_utils.hpp"

namespace XRobots {
namespace Parser {

using namespace XRobots::Core;

DirectiveValue parse_flag(const std::string& /*fragment*/) {
    return true;
}

DirectiveValue parse_unavailable_after(const std::string& fragment) {
    bool found = false;
    auto parts = Utils::Text::split_once(fragment, ':', &found);

    UnavailableAfter value;
    value.text = found ? Utils::Text::trim(parts.second) : "";
    value.when = Utils::Time::parse_http_date(value.text);

    if (!value.when)
        Logger::warn("unavailable_after: unrecognized date '" + value.text + "'");
    return value;
}

DirectiveValue parse_value(Directive directive, const std::string& fragment) {
    return directive_info(directive).parse(fragment);
}

}  // namespace Parser
}  // namespace XRobots
