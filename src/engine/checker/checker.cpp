#include "checker.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include "../../core/logger/logger.hpp"
#include "../../network/http/curl_client.hpp"
#include "../../parser/x_robots_tag_parser.hpp"

namespace XRobots {
namespace Engine {

using namespace XRobots::Core;

Checker::Checker(const CheckerConfig& config)
    : Checker(config, [] { return std::make_unique<Network::Http::CurlClient>(); }) {}

Checker::Checker(const CheckerConfig& config, ClientFactory factory)
    : config_(config), factory_(std::move(factory)) {}

CheckResult Checker::check_one(const std::string& url) const {
    CheckResult result;
    result.url = url;

    try {
        auto client = factory_();
        client->set_timeout(std::chrono::seconds(config_.timeout));
        client->set_user_agent(config_.user_agent.empty() ? Constants::USER_AGENT
                                                          : config_.user_agent);

        Parser::ParserOptions options;
        options.headers = config_.headers;

        Parser::XRobotsTagParser parser(url, config_.user_agent, *client, options);
        result.url                = parser.url();
        result.matched_user_agent = parser.matched_user_agent();
        result.rules              = parser.get_rules(config_.raw);
        result.scopes             = parser.export_rules();
        result.error              = parser.fetch_error();
        result.success            = !parser.fetch_failed();
    } catch (const std::exception& e) {
        result.error   = e.what();
        result.success = false;
        Logger::error("Check failed for " + url + ": " + result.error);
    }
    return result;
}

std::vector<CheckResult> Checker::check(const std::vector<std::string>& urls) const {
    std::vector<CheckResult> results(urls.size());
    if (urls.empty())
        return results;

    size_t threads = std::min<size_t>(urls.size(), static_cast<size_t>(std::max(1, config_.threads)));
    Logger::info("Checking " + std::to_string(urls.size()) + " URL(s) on "
                 + std::to_string(threads) + " thread(s)");

    boost::asio::thread_pool pool(threads);
    for (size_t i = 0; i < urls.size(); ++i) {
        boost::asio::post(pool, [this, &urls, &results, i]() { results[i] = check_one(urls[i]); });
    }
    pool.join();

    size_t failed = std::count_if(
        results.begin(), results.end(), [](const CheckResult& r) { return !r.success; });
    if (failed == 0)
        Logger::success("Checked " + std::to_string(results.size()) + " URL(s)");
    else
        Logger::warn(std::to_string(failed) + " of " + std::to_string(results.size())
                     + " URL(s) could not be fetched");
    return results;
}

}  // namespace Engine
}  // namespace XRobots
