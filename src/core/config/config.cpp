#include "config.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace XRobots {
namespace Core {

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["user_agent"])
            config.user_agent = yaml["user_agent"].as<std::string>();
        if (yaml["headers_file"])
            config.headers_file = yaml["headers_file"].as<std::string>();
        if (yaml["raw"])
            config.raw = yaml["raw"].as<bool>();
        if (yaml["export"])
            config.export_all = yaml["export"].as<bool>();
        if (yaml["json"])
            config.json = yaml["json"].as<bool>();
        if (yaml["threads"])
            config.threads = yaml["threads"].as<int>();
        if (yaml["timeout"])
            config.timeout = yaml["timeout"].as<int>();
        if (yaml["log_level"])
            config.log_level = yaml["log_level"].as<std::string>();

        if (yaml["headers"] && yaml["headers"].IsSequence()) {
            for (const auto& node : yaml["headers"])
                config.headers.push_back(node.as<std::string>());
        }

        if (yaml["urls"] && yaml["urls"].IsSequence()) {
            for (const auto& node : yaml["urls"])
                config.urls.push_back(node.as<std::string>());
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

std::vector<std::string> load_header_lines(const std::string& path) {
    std::ifstream file(path);
    if (!file)
        throw std::runtime_error("Unable to open headers file: " + path);

    std::vector<std::string> lines;
    std::string              line;
    while (std::getline(file, line)) {
        size_t f = line.find_first_not_of(" \t\r\n");
        if (f == std::string::npos || line[f] == '#')
            continue;
        size_t l = line.find_last_not_of(" \t\r\n");
        lines.push_back(line.substr(f, l - f + 1));
    }
    return lines;
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"xrobots - X-Robots-Tag header inspector"};

    std::vector<std::string> cli_headers;
    std::vector<std::string> cli_urls;

    app.add_option("-u,--user-agent", config.user_agent, "Crawler user-agent to resolve rules for");
    app.add_option("-H,--header", cli_headers, "Pre-fetched header line (repeatable)")
        ->allow_extra_args(false);
    app.add_option("--headers-file", config.headers_file, "File with one header line per line");
    app.add_option("--meaning", config.meaning, "Describe a directive and exit");
    app.add_option("-t,--threads", config.threads, "Number of URLs checked in parallel")
        ->check(CLI::PositiveNumber);
    app.add_option("--timeout", config.timeout, "Request timeout in seconds")
        ->check(CLI::PositiveNumber);
    app.add_option("--log-level", config.log_level, "Log verbosity")
        ->check(CLI::IsMember({"none", "error", "warn", "info", "debug", "all"}));
    app.add_option("--config", config.config_path, "Path to YAML configuration file");

    app.add_flag("--raw", config.raw, "Print rules without normalization");
    app.add_flag("--export", config.export_all, "Print the rules of every user-agent scope");
    app.add_flag("--json", config.json, "Print JSON instead of text");

    app.add_option("urls", cli_urls, "URLs to check");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    if (!config.headers_file.empty()) {
        auto lines = load_header_lines(config.headers_file);
        config.headers.insert(config.headers.end(), lines.begin(), lines.end());
    }
    config.headers.insert(config.headers.end(), cli_headers.begin(), cli_headers.end());
    config.urls.insert(config.urls.end(), cli_urls.begin(), cli_urls.end());

    return config;
}

}  // namespace Core
}  // namespace XRobots
