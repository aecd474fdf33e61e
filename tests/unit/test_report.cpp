#include <gtest/gtest.h>
#include "../../src/engine/report/report.hpp"

using namespace XRobots::Engine;
using namespace XRobots::Parser;

namespace {

CheckResult sample_result() {
    CheckResult result;
    result.url                = "http://example.com/";
    result.matched_user_agent = "googlebot";
    result.success            = true;
    result.rules              = {{Directive::NoIndex, true},
                                 {Directive::UnavailableAfter,
                                  UnavailableAfter{"25 Jun 2010 15:00:00 PST",
                                                   XRobots::Utils::Time::parse_http_date(
                                                       "25 Jun 2010 15:00:00 PST")}}};
    result.scopes[""]          = {{Directive::NoIndex, true}};
    result.scopes["googlebot"] = {{Directive::UnavailableAfter, UnavailableAfter{"someday", std::nullopt}}};
    return result;
}

}  // namespace

TEST(ReportTest, ValueToString) {
    EXPECT_EQ(Report::value_to_string(true), "true");
    EXPECT_EQ(Report::value_to_string(UnavailableAfter{"someday", std::nullopt}),
              "someday (unparsed)");
    EXPECT_EQ(Report::value_to_string(UnavailableAfter{
                  "2010-06-25", XRobots::Utils::Time::parse_http_date("2010-06-25")}),
              "2010-06-25T00:00:00Z");
}

TEST(ReportTest, RulesAsText) {
    std::string text = Report::to_text(sample_result(), ReportMode::Rules);
    EXPECT_EQ(text,
              "http://example.com/ (user-agent: googlebot)\n"
              "  noindex\n"
              "  unavailable_after: 2010-06-25T23:00:00Z\n");
}

TEST(ReportTest, ExportAsText) {
    std::string text = Report::to_text(sample_result(), ReportMode::Export);
    EXPECT_EQ(text,
              "http://example.com/ (user-agent: googlebot)\n"
              "  [*]\n"
              "    noindex\n"
              "  [googlebot]\n"
              "    unavailable_after: someday (unparsed)\n");
}

TEST(ReportTest, FailureAsText) {
    CheckResult result;
    result.url   = "http://down.example/";
    result.error = "Couldn't resolve host name";
    EXPECT_EQ(Report::to_text(result, ReportMode::Rules),
              "http://down.example/\n"
              "  error: Couldn't resolve host name\n"
              "  (no directives)\n");
}

TEST(ReportTest, RulesAsJson) {
    auto j = Report::to_json(sample_result(), ReportMode::Rules);
    EXPECT_EQ(j["url"], "http://example.com/");
    EXPECT_EQ(j["user_agent"], "googlebot");
    EXPECT_EQ(j["success"], true);
    EXPECT_FALSE(j.contains("error"));
    EXPECT_EQ(j["rules"]["noindex"], true);
    EXPECT_EQ(j["rules"]["unavailable_after"]["time"], "2010-06-25T23:00:00Z");
    EXPECT_EQ(j["rules"]["unavailable_after"]["text"], "25 Jun 2010 15:00:00 PST");
    EXPECT_FALSE(j.contains("scopes"));
}

TEST(ReportTest, ExportAsJson) {
    auto j = Report::to_json(sample_result(), ReportMode::Export);
    EXPECT_EQ(j["scopes"][""]["noindex"], true);
    EXPECT_TRUE(j["scopes"]["googlebot"]["unavailable_after"]["time"].is_null());
    EXPECT_FALSE(j.contains("rules"));
}

TEST(ReportTest, JsonArray) {
    auto parsed = nlohmann::json::parse(
        Report::to_json_text({sample_result(), sample_result()}, ReportMode::Rules));
    ASSERT_TRUE(parsed.is_array());
    EXPECT_EQ(parsed.size(), 2u);
}
