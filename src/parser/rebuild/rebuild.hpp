#pragma once
#include <vector>

#include "../../utils/time/http_date.hpp"
#include "../directive/directive.hpp"

namespace XRobots {
namespace Parser {

struct Implication {
    Directive              trigger;
    std::vector<Directive> implies;
    bool                   replaces_trigger;  // umbrella directives are expanded away
};

const std::vector<Implication>& implication_table();

// Turns an overlaid raw directive map into the effective one:
//   unavailable_after <= `now`    -> + noindex
//   none                          -> noindex, nofollow
//   noindex                       -> + noarchive
//   nosnippet                     -> + noarchive
//   all                           -> dropped next to any other directive
// Pure: the result depends only on the arguments.
DirectiveMap rebuild(const DirectiveMap& raw, Utils::Time::TimePoint now);

}  // namespace Parser
}  // namespace XRobots
