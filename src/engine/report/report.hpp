#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "../checker/checker.hpp"

namespace XRobots {
namespace Engine {

enum class ReportMode { Rules, Export };

class Report {
public:
    static std::string    value_to_string(const Parser::DirectiveValue& value);
    static nlohmann::json value_to_json(const Parser::DirectiveValue& value);
    static nlohmann::json rules_to_json(const Parser::DirectiveMap& rules);

    static std::string    to_text(const CheckResult& result, ReportMode mode);
    static nlohmann::json to_json(const CheckResult& result, ReportMode mode);
    static std::string    to_json_text(const std::vector<CheckResult>& results, ReportMode mode);
};

}  // namespace Engine
}  // namespace XRobots
