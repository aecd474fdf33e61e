#include <gtest/gtest.h>
#include "../../src/parser/directive/directive.hpp"
#include "../../src/parser/directive/value_parser.hpp"

using namespace XRobots::Parser;

TEST(DirectiveTest, TableCoversEveryDirectiveInEnumOrder) {
    const auto& table = directive_table();
    ASSERT_EQ(table.size(), 10u);
    for (size_t i = 0; i < table.size(); ++i) {
        EXPECT_EQ(static_cast<size_t>(table[i].directive), i);
        EXPECT_EQ(&directive_info(table[i].directive), &table[i]);
        EXPECT_NE(std::string(table[i].meaning), "");
    }
}

TEST(DirectiveTest, OnlyUnavailableAfterCarriesAValue) {
    for (const auto& info : directive_table()) {
        auto expected = info.directive == Directive::UnavailableAfter ? DirectiveKind::Valued
                                                                      : DirectiveKind::Flag;
        EXPECT_EQ(info.kind, expected) << info.name;
    }
}

TEST(DirectiveTest, FindIsCaseInsensitive) {
    EXPECT_EQ(find_directive("noindex"), Directive::NoIndex);
    EXPECT_EQ(find_directive("NoIndex"), Directive::NoIndex);
    EXPECT_EQ(find_directive("  UNAVAILABLE_AFTER "), Directive::UnavailableAfter);
    EXPECT_EQ(find_directive("none"), Directive::None);
    EXPECT_EQ(to_string(Directive::NoImageIndex), "noimageindex");
}

TEST(DirectiveTest, UnknownNamesAreNotErrors) {
    EXPECT_FALSE(find_directive("max-snippet").has_value());
    EXPECT_FALSE(find_directive("googlebot").has_value());
    EXPECT_FALSE(find_directive("").has_value());
    EXPECT_FALSE(is_directive_name("no index"));
}

TEST(DirectiveTest, MeaningLookup) {
    EXPECT_EQ(directive_meaning("none"), "Equivalent to noindex, nofollow.");
    EXPECT_EQ(directive_meaning("NOFOLLOW"), directive_meaning("nofollow"));
    for (const auto& info : directive_table())
        EXPECT_FALSE(directive_meaning(info.name).empty());
}

TEST(DirectiveTest, MeaningOfUnknownDirectiveThrows) {
    EXPECT_THROW(directive_meaning("noai"), UnknownDirectiveError);
    EXPECT_THROW(directive_meaning(""), std::invalid_argument);
    try {
        directive_meaning("max-snippet");
        FAIL() << "expected UnknownDirectiveError";
    } catch (const UnknownDirectiveError& e) {
        EXPECT_EQ(e.name(), "max-snippet");
    }
}

TEST(ValueParserTest, FlagIgnoresTrailingText) {
    EXPECT_EQ(parse_value(Directive::NoIndex, "noindex"), DirectiveValue(true));
    EXPECT_EQ(parse_value(Directive::NoIndex, "noindex: whatever"), DirectiveValue(true));
}

TEST(ValueParserTest, UnavailableAfterParsesDate) {
    auto value  = parse_value(Directive::UnavailableAfter,
                             "unavailable_after: Friday, 25 Jun 2010 15:00:00 PST");
    auto expiry = as_unavailable_after(value);
    ASSERT_NE(expiry, nullptr);
    EXPECT_EQ(expiry->text, "Friday, 25 Jun 2010 15:00:00 PST");
    ASSERT_TRUE(expiry->when.has_value());
    EXPECT_EQ(XRobots::Utils::Time::format_iso8601(*expiry->when), "2010-06-25T23:00:00Z");
    EXPECT_TRUE(is_present(value));
}

TEST(ValueParserTest, UnavailableAfterKeepsUnparsedText) {
    auto value  = parse_value(Directive::UnavailableAfter, "unavailable_after: someday");
    auto expiry = as_unavailable_after(value);
    ASSERT_NE(expiry, nullptr);
    EXPECT_EQ(expiry->text, "someday");
    EXPECT_FALSE(expiry->when.has_value());
    EXPECT_TRUE(is_present(value));

    auto bare = as_unavailable_after(parse_value(Directive::UnavailableAfter, "unavailable_after"));
    ASSERT_NE(bare, nullptr);
    EXPECT_EQ(bare->text, "");
    EXPECT_FALSE(bare->when.has_value());
}
