#pragma once

#include <string>

namespace firewatch {

constexpr const char* kDefaultRisk = "NORMAL";
constexpr const char* kDefaultAction = "routine monitoring";
constexpr const char* kNoRuleId = "NO_RULE";

struct EvaluationResult {
    std::string risk = kDefaultRisk;
    std::string action = kDefaultAction;
    std::string matched_rule_id = kNoRuleId;

    bool matched() const { return matched_rule_id != kNoRuleId; }

    bool operator==(const EvaluationResult& other) const {
        return risk == other.risk && action == other.action &&
               matched_rule_id == other.matched_rule_id;
    }
    bool operator!=(const EvaluationResult& other) const { return !(*this == other); }
};

} // namespace firewatch
