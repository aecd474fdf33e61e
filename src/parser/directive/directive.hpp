#pragma once
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "../../utils/time/http_date.hpp"

namespace XRobots {
namespace Parser {

enum class Directive {
    All,
    None,
    NoArchive,
    NoFollow,
    NoImageIndex,
    NoIndex,
    NoOdp,
    NoSnippet,
    NoTranslate,
    UnavailableAfter
};

enum class DirectiveKind { Flag, Valued };

struct UnavailableAfter {
    std::string                           text;
    std::optional<Utils::Time::TimePoint> when;  // empty when `text` is not a date we understand

    bool operator==(const UnavailableAfter& other) const {
        return text == other.text && when == other.when;
    }
};

using DirectiveValue = std::variant<bool, UnavailableAfter>;
using DirectiveMap   = std::map<Directive, DirectiveValue>;

// Signature shared by every per-directive value parser. `fragment` is the whole
// directive text as written, e.g. "unavailable_after: 25 Jun 2010 15:00:00 PST".
using ValueParser = DirectiveValue (*)(const std::string& fragment);

struct DirectiveInfo {
    Directive     directive;
    const char*   name;
    DirectiveKind kind;
    ValueParser   parse;
    const char*   meaning;
};

class UnknownDirectiveError : public std::invalid_argument {
public:
    explicit UnknownDirectiveError(const std::string& name)
        : std::invalid_argument("Unknown directive: " + name), name_(name) {}

    const std::string& name() const {
        return name_;
    }

private:
    std::string name_;
};

const std::vector<DirectiveInfo>& directive_table();
const DirectiveInfo&              directive_info(Directive directive);

// Case-insensitive; surrounding whitespace is ignored.
std::optional<Directive> find_directive(const std::string& name);
bool                     is_directive_name(const std::string& name);

std::string to_string(Directive directive);

// Throws UnknownDirectiveError for names outside the table.
std::string directive_meaning(const std::string& name);

// A recorded directive is present whatever its payload.
bool is_present(const DirectiveValue& value);

// The pointer borrows from `value`; keep the owning map alive while using it.
const UnavailableAfter* as_unavailable_after(const DirectiveValue& value);

}  // namespace Parser
}  // namespace XRobots
