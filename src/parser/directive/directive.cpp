#include "directive.hpp"
#include "../../utils/text/string_utils.hpp"
#include "value_parser.hpp"

namespace XRobots {
namespace Parser {

const std::vector<DirectiveInfo>& directive_table() {
    static const std::vector<DirectiveInfo> table = {
        {Directive::All, "all", DirectiveKind::Flag, &parse_flag,
         "There are no restrictions for indexing or serving. This is the default and has no "
         "effect if explicitly listed."},
        {Directive::None, "none", DirectiveKind::Flag, &parse_flag,
         "Equivalent to noindex, nofollow."},
        {Directive::NoArchive, "noarchive", DirectiveKind::Flag, &parse_flag,
         "Do not show a cached link in search results."},
        {Directive::NoFollow, "nofollow", DirectiveKind::Flag, &parse_flag,
         "Do not follow the links on this page."},
        {Directive::NoImageIndex, "noimageindex", DirectiveKind::Flag, &parse_flag,
         "Do not index images on this page."},
        {Directive::NoIndex, "noindex", DirectiveKind::Flag, &parse_flag,
         "Do not show this page in search results and do not show a cached link in search "
         "results."},
        {Directive::NoOdp, "noodp", DirectiveKind::Flag, &parse_flag,
         "Do not use metadata from the Open Directory project for titles or snippets shown for "
         "this page."},
        {Directive::NoSnippet, "nosnippet", DirectiveKind::Flag, &parse_flag,
         "Do not show a snippet in the search results for this page."},
        {Directive::NoTranslate, "notranslate", DirectiveKind::Flag, &parse_flag,
         "Do not offer translation of this page in search results."},
        {Directive::UnavailableAfter, "unavailable_after", DirectiveKind::Valued,
         &parse_unavailable_after,
         "Do not show this page in search results after the specified date and time."}};
    return table;
}

const DirectiveInfo& directive_info(Directive directive) {
    // Table rows follow enum order.
    return directive_table()[static_cast<size_t>(directive)];
}

std::optional<Directive> find_directive(const std::string& name) {
    std::string key = Utils::Text::to_lower(Utils::Text::trim(name));
    for (const auto& info : directive_table()) {
        if (key == info.name)
            return info.directive;
    }
    return std::nullopt;
}

bool is_directive_name(const std::string& name) {
    return find_directive(name).has_value();
}

std::string to_string(Directive directive) {
    return directive_info(directive).name;
}

std::string directive_meaning(const std::string& name) {
    auto directive = find_directive(name);
    if (!directive)
        throw UnknownDirectiveError(name);
    return directive_info(*directive).meaning;
}

bool is_present(const DirectiveValue& value) {
    if (const bool* flag = std::get_if<bool>(&value))
        return *flag;
    return true;
}

const UnavailableAfter* as_unavailable_after(const DirectiveValue& value) {
    return std::get_if<UnavailableAfter>(&value);
}

}  // namespace Parser
}  // namespace XRobots
