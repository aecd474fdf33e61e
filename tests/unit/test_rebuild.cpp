#include <gtest/gtest.h>
#include "../../src/parser/rebuild/rebuild.hpp"

using namespace XRobots::Parser;
using XRobots::Utils::Time::TimePoint;

namespace {

TimePoint at(const std::string& text) {
    return *XRobots::Utils::Time::parse_http_date(text);
}

const TimePoint NOW = at("2015-01-01T00:00:00Z");

}  // namespace

TEST(RebuildTest, ImplicationTableIsSelfConsistent) {
    for (const auto& rule : implication_table()) {
        for (Directive implied : rule.implies)
            EXPECT_NE(implied, rule.trigger);
    }
}

TEST(RebuildTest, EmptyStaysEmpty) {
    EXPECT_TRUE(rebuild({}, NOW).empty());
}

TEST(RebuildTest, NoneExpandsToNoIndexNoFollow) {
    auto rules = rebuild({{Directive::None, true}}, NOW);
    EXPECT_EQ(rules,
              (DirectiveMap{{Directive::NoArchive, true},
                            {Directive::NoFollow, true},
                            {Directive::NoIndex, true}}));
}

TEST(RebuildTest, NoIndexImpliesNoArchive) {
    auto rules = rebuild({{Directive::NoIndex, true}}, NOW);
    EXPECT_EQ(rules, (DirectiveMap{{Directive::NoArchive, true}, {Directive::NoIndex, true}}));
    EXPECT_NE(directive_meaning("noindex").find("cached link"), std::string::npos);
}

TEST(RebuildTest, NoSnippetImpliesNoArchive) {
    auto rules = rebuild({{Directive::NoSnippet, true}}, NOW);
    EXPECT_EQ(rules, (DirectiveMap{{Directive::NoArchive, true}, {Directive::NoSnippet, true}}));
}

TEST(RebuildTest, AllAloneIsKept) {
    EXPECT_EQ(rebuild({{Directive::All, true}}, NOW), (DirectiveMap{{Directive::All, true}}));
}

TEST(RebuildTest, AllIsDroppedNextToRestrictions) {
    auto rules = rebuild({{Directive::All, true}, {Directive::NoFollow, true}}, NOW);
    EXPECT_EQ(rules, (DirectiveMap{{Directive::NoFollow, true}}));

    rules = rebuild({{Directive::All, true}, {Directive::None, true}}, NOW);
    EXPECT_EQ(rules,
              (DirectiveMap{{Directive::NoArchive, true},
                            {Directive::NoFollow, true},
                            {Directive::NoIndex, true}}));
}

TEST(RebuildTest, ExpiredUnavailableAfterImpliesNoIndex) {
    UnavailableAfter expiry{"2010-06-25", at("2010-06-25")};
    auto             rules = rebuild({{Directive::UnavailableAfter, expiry}}, NOW);
    EXPECT_EQ(rules.size(), 3u);
    EXPECT_TRUE(rules.count(Directive::NoIndex));
    EXPECT_TRUE(rules.count(Directive::NoArchive));
    EXPECT_EQ(rules.at(Directive::UnavailableAfter), DirectiveValue(expiry));
}

TEST(RebuildTest, FutureOrUnparsedUnavailableAfterImpliesNothing) {
    UnavailableAfter future{"2030-01-01", at("2030-01-01")};
    EXPECT_FALSE(rebuild({{Directive::UnavailableAfter, future}}, NOW).count(Directive::NoIndex));

    UnavailableAfter unparsed{"someday", std::nullopt};
    EXPECT_FALSE(rebuild({{Directive::UnavailableAfter, unparsed}}, NOW).count(Directive::NoIndex));
}

TEST(RebuildTest, ExpiryIsInclusive) {
    UnavailableAfter expiry{"2015-01-01T00:00:00Z", NOW};
    EXPECT_TRUE(rebuild({{Directive::UnavailableAfter, expiry}}, NOW).count(Directive::NoIndex));
}

TEST(RebuildTest, EveryDirectiveTogether) {
    DirectiveMap raw;
    for (const auto& info : directive_table())
        raw[info.directive] = true;
    raw[Directive::UnavailableAfter] = UnavailableAfter{"2010-06-25", at("2010-06-25")};

    auto rules = rebuild(raw, NOW);
    EXPECT_FALSE(rules.count(Directive::All));
    EXPECT_FALSE(rules.count(Directive::None));
    EXPECT_EQ(rules.size(), 8u);
}

TEST(RebuildTest, IsPure) {
    DirectiveMap raw = {{Directive::None, true}, {Directive::NoSnippet, true}};
    auto         copy = raw;
    auto         first = rebuild(raw, NOW);
    EXPECT_EQ(raw, copy);
    EXPECT_EQ(rebuild(raw, NOW), first);
}
