#include "header_scanner.hpp"
#include <cctype>
#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/time/http_date.hpp"
#include "../directive/value_parser.hpp"

namespace XRobots {
namespace Parser {

using namespace XRobots::Core;
using namespace XRobots::Utils;

std::optional<ParsedHeaderLine> HeaderScanner::scan(const std::string& line) {
    bool is_header = false;
    auto header    = Text::split_once(line, ':', &is_header);
    if (!is_header || !Text::iequals(Text::trim(header.first), Constants::HEADER_RULE_NAME))
        return std::nullopt;

    std::vector<std::string> fragments = Text::split_trimmed(header.second, ',');

    ParsedHeaderLine parsed;
    parsed.scope = take_scope(fragments);

    ScannedDirective* open_value = nullptr;
    for (const auto& fragment : fragments) {
        if (fragment.empty())
            continue;

        auto directive = find_directive(Text::split_once(fragment, ':').first);
        if (!directive) {
            // Dates carry commas: "unavailable_after: Friday, 25 Jun 2010 15:00:00 PST"
            if (open_value && is_value_continuation(open_value->fragment, fragment)) {
                open_value->fragment += ", " + fragment;
                continue;
            }
            open_value = nullptr;
            Logger::debug("Skipping unsupported directive '" + fragment + "'");
            continue;
        }

        parsed.directives.push_back({*directive, fragment, true});
        open_value = directive_info(*directive).kind == DirectiveKind::Valued
                         ? &parsed.directives.back()
                         : nullptr;
    }

    for (auto& scanned : parsed.directives)
        scanned.value = parse_value(scanned.directive, scanned.fragment);

    return parsed;
}

// "googlebot: noindex" names a scope; "unavailable_after: ..." does not.
std::string HeaderScanner::take_scope(std::vector<std::string>& fragments) {
    if (fragments.empty())
        return Constants::USER_AGENT_DEFAULT;

    bool has_colon = false;
    auto pair      = Text::split_once(fragments.front(), ':', &has_colon);
    auto token     = Text::trim(pair.first);
    if (!has_colon || token.empty() || is_directive_name(token))
        return Constants::USER_AGENT_DEFAULT;

    fragments.front() = Text::trim(pair.second);
    return Text::to_lower(token);
}

namespace {

bool looks_like_date_part(const std::string& fragment) {
    if (std::isdigit(static_cast<unsigned char>(fragment.front())))
        return true;
    auto name = Text::split_once(fragment, ':').first;
    for (char c : Text::trim(name)) {
        if (std::isspace(static_cast<unsigned char>(c)))
            return true;
    }
    return false;
}

bool value_is_date(const std::string& fragment) {
    return Time::parse_http_date(Text::trim(Text::split_once(fragment, ':').second)).has_value();
}

}  // namespace

// A complete date is only extended when the longer text is still a date.
bool HeaderScanner::is_value_continuation(const std::string& value_fragment,
                                          const std::string& fragment) {
    if (!looks_like_date_part(fragment))
        return false;
    return !value_is_date(value_fragment) || value_is_date(value_fragment + ", " + fragment);
}

}  // namespace Parser
}  // namespace XRobots
