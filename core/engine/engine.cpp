#include "engine/engine.h"

#include <stdexcept>

namespace firewatch {

ResultStream::ResultStream(std::shared_ptr<const RuleStore> store,
                           const std::vector<Record>& records)
    : store_(std::move(store)), records_(&records) {}

std::optional<EvaluationResult> ResultStream::next() {
    if (done()) {
        return std::nullopt;
    }
    const Record& record = (*records_)[position_++];
    return Engine::evaluate_with(*store_, record);
}

Engine::Engine(std::shared_ptr<const RuleStore> store)
    : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("engine requires a rule store");
    }
}

EvaluationResult Engine::evaluate_one(const IRecord& record) const {
    return evaluate_with(*store_, record);
}

ResultStream Engine::evaluate_batch(const std::vector<Record>& records) const {
    return ResultStream(store_, records);
}

std::vector<EvaluationResult> Engine::evaluate_all(const std::vector<Record>& records) const {
    std::vector<EvaluationResult> results;
    results.reserve(records.size());

    auto stream = evaluate_batch(records);
    while (auto result = stream.next()) {
        results.push_back(std::move(*result));
    }
    return results;
}

EvaluationResult Engine::evaluate_with(const RuleStore& store, const IRecord& record) {
    // First matching rule in priority order wins
    for (const auto& rule : store.rules()) {
        if (rule.matches(record)) {
            EvaluationResult result;
            result.risk = rule.outcome.risk;
            result.action = rule.outcome.action;
            result.matched_rule_id = rule.id;
            return result;
        }
    }

    return EvaluationResult{};
}

} // namespace firewatch
