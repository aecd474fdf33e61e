#include <curl/curl.h>
#include <iostream>
#include <stdexcept>
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "engine/checker/checker.hpp"
#include "engine/report/report.hpp"
#include "parser/x_robots_tag_parser.hpp"

using namespace XRobots;

namespace {

constexpr int EXIT_USAGE       = 1;
constexpr int EXIT_FETCH_ERROR = 2;

void print(const std::vector<Engine::CheckResult>& results,
           const Core::Config&                     config,
           Engine::ReportMode                      mode) {
    if (config.json) {
        std::cout << Engine::Report::to_json_text(results, mode) << std::endl;
        return;
    }
    for (const auto& result : results)
        std::cout << Engine::Report::to_text(result, mode);
}

int describe_directive(const std::string& name) {
    try {
        std::cout << name << ": " << Parser::XRobotsTagParser::get_directive_meaning(name)
                  << std::endl;
        return 0;
    } catch (const Parser::UnknownDirectiveError& e) {
        Core::Logger::error(e.what());
        return EXIT_USAGE;
    }
}

int check_supplied_headers(const Core::Config& config, Engine::ReportMode mode) {
    Parser::XRobotsTagParser parser(config.user_agent, config.headers);

    Engine::CheckResult result;
    result.url                = "-";
    result.matched_user_agent = parser.matched_user_agent();
    result.rules              = parser.get_rules(config.raw);
    result.scopes             = parser.export_rules();
    result.success            = true;
    print({result}, config, mode);
    return 0;
}

int check_urls(const Core::Config& config, Engine::ReportMode mode) {
    Engine::CheckerConfig checker_config;
    checker_config.user_agent = config.user_agent;
    checker_config.raw        = config.raw;
    checker_config.threads    = config.threads;
    checker_config.timeout    = config.timeout;
    if (!config.headers.empty())
        checker_config.headers = config.headers;

    curl_global_init(CURL_GLOBAL_ALL);
    std::vector<Engine::CheckResult> results;
    {
        Engine::Checker checker(checker_config);
        results = checker.check(config.urls);
    }
    curl_global_cleanup();

    print(results, config, mode);
    for (const auto& result : results) {
        if (!result.success)
            return EXIT_FETCH_ERROR;
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    Core::Config config;
    try {
        config = Core::Config::parse(argc, argv);
        Core::Logger::set_level(Core::Logger::parse_level(config.log_level));
    } catch (const std::exception& e) {
        Core::Logger::error(e.what());
        return EXIT_USAGE;
    }

    if (!config.meaning.empty())
        return describe_directive(config.meaning);

    auto mode = config.export_all ? Engine::ReportMode::Export : Engine::ReportMode::Rules;

    if (config.urls.empty()) {
        if (config.headers.empty()) {
            Core::Logger::error("No URLs or headers provided. See --help.");
            return EXIT_USAGE;
        }
        return check_supplied_headers(config, mode);
    }
    return check_urls(config, mode);
}
