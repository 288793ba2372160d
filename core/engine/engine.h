#pragma once

#include "engine/evaluation_result.h"
#include "engine/record.h"
#include "rules/rule_store.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace firewatch {

class Engine;

// One-shot, order-preserving sequence of results over a batch of records.
// Each call to next() evaluates exactly one record. Holds the rule store it
// was created with, so a later reload does not affect it.
class ResultStream {
public:
    // Returns nullopt once every record has been evaluated, and forever after.
    std::optional<EvaluationResult> next();

    bool done() const { return position_ >= records_->size(); }
    std::size_t position() const { return position_; }

private:
    friend class Engine;

    ResultStream(std::shared_ptr<const RuleStore> store,
                 const std::vector<Record>& records);

    std::shared_ptr<const RuleStore> store_;
    const std::vector<Record>* records_;
    std::size_t position_ = 0;
};

// Classifies records against one rule store. Evaluation never throws and
// never mutates the store, so a single Engine may be shared across threads.
class Engine {
public:
    explicit Engine(std::shared_ptr<const RuleStore> store);

    EvaluationResult evaluate_one(const IRecord& record) const;

    // The records vector must outlive the returned stream.
    ResultStream evaluate_batch(const std::vector<Record>& records) const;
    ResultStream evaluate_batch(std::vector<Record>&& records) const = delete;

    std::vector<EvaluationResult> evaluate_all(const std::vector<Record>& records) const;

    const RuleStore& store() const { return *store_; }
    std::shared_ptr<const RuleStore> store_ptr() const { return store_; }

private:
    friend class ResultStream;

    static EvaluationResult evaluate_with(const RuleStore& store, const IRecord& record);

    std::shared_ptr<const RuleStore> store_;
};

} // namespace firewatch
