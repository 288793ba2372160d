#pragma once

#include "engine/record.h"
#include "rules/condition.h"

#include <string>
#include <vector>

namespace firewatch {

struct RuleOutcome {
    std::string risk;
    std::string action;
};

struct Rule {
    std::string id;
    int priority = 0;
    std::string description;
    std::vector<Condition> conditions;
    RuleOutcome outcome;

    // AND across conditions in declared order, stopping at the first failure.
    // An empty condition list always matches.
    bool matches(const IRecord& record) const {
        for (const auto& condition : conditions) {
            if (!condition.holds(record)) {
                return false;
            }
        }
        return true;
    }
};

} // namespace firewatch
