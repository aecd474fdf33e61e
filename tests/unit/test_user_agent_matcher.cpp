#include <gtest/gtest.h>
#include "../../src/parser/user_agent/user_agent_matcher.hpp"

using namespace XRobots::Parser;

TEST(UserAgentMatcherTest, ExactAndCaseInsensitive) {
    std::vector<std::string> scopes = {"", "bingbot", "googlebot"};
    EXPECT_EQ(UserAgentMatcher("googlebot").match(scopes), "googlebot");
    EXPECT_EQ(UserAgentMatcher("GoogleBot").match(scopes), "googlebot");
    EXPECT_EQ(UserAgentMatcher("  bingbot ").match(scopes), "bingbot");
}

TEST(UserAgentMatcherTest, FullUserAgentStrings) {
    std::vector<std::string> scopes = {"", "bingbot", "googlebot"};
    EXPECT_EQ(UserAgentMatcher("Mozilla/5.0 (compatible; Googlebot/2.1; "
                               "+http://www.google.com/bot.html)")
                  .match(scopes),
              "googlebot");
    EXPECT_EQ(UserAgentMatcher("Mozilla/5.0 (compatible; bingbot/2.0)").match(scopes), "bingbot");
}

TEST(UserAgentMatcherTest, ShortNameMatchesLongerScope) {
    EXPECT_EQ(UserAgentMatcher("google").match({"googlebot"}), "googlebot");
}

TEST(UserAgentMatcherTest, MostSpecificScopeWins) {
    std::vector<std::string> scopes = {"", "googlebot", "googlebot-news"};
    EXPECT_EQ(UserAgentMatcher("Googlebot-News").match(scopes), "googlebot-news");
    EXPECT_EQ(UserAgentMatcher("Googlebot/2.1").match(scopes), "googlebot");
}

TEST(UserAgentMatcherTest, NoMatchFallsBackToDefault) {
    std::vector<std::string> scopes = {"", "googlebot"};
    EXPECT_EQ(UserAgentMatcher("yandex").match(scopes), "");
    EXPECT_EQ(UserAgentMatcher("yandex").match(scopes, "fallback"), "fallback");
    EXPECT_EQ(UserAgentMatcher("googlebot").match({}), "");
}

TEST(UserAgentMatcherTest, EmptyUserAgentUsesDefault) {
    std::vector<std::string> scopes = {"", "googlebot"};
    EXPECT_EQ(UserAgentMatcher("").match(scopes), "");
    EXPECT_EQ(UserAgentMatcher("   ").match(scopes), "");
}
