#include "engine/engine.h"

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

using namespace firewatch;

// Record double that remembers which fields the engine asked for.
class RecordingRecord : public IRecord {
public:
    explicit RecordingRecord(Record inner) : inner_(std::move(inner)) {}

    const Value* find(const std::string& field) const override {
        lookups_.push_back(field);
        return inner_.find(field);
    }

    const std::vector<std::string>& lookups() const { return lookups_; }

private:
    Record inner_;
    mutable std::vector<std::string> lookups_;
};

template <typename Records, typename = void>
struct can_evaluate_batch : std::false_type {};

template <typename Records>
struct can_evaluate_batch<
    Records, std::void_t<decltype(std::declval<const Engine&>().evaluate_batch(
                 std::declval<Records>()))>> : std::true_type {};

static Rule make_rule(const std::string& id, int priority,
                      std::vector<Condition> conditions,
                      const std::string& risk, const std::string& action) {
    Rule rule;
    rule.id = id;
    rule.priority = priority;
    rule.conditions = std::move(conditions);
    rule.outcome = {risk, action};
    return rule;
}

static Record make_record(double temp, double hum, const std::string& event_type) {
    Record r;
    r.set("temp", temp);
    r.set("hum", hum);
    r.set("event_type", event_type);
    return r;
}

// The two-rule fire scenario: hot and dry first, dry lightning second.
static std::shared_ptr<const RuleStore> scenario_store() {
    std::vector<Rule> rules;
    rules.push_back(make_rule("rule1", 1,
                              {Condition("temp", ComparisonOp::GT, 40),
                               Condition("hum", ComparisonOp::LT, 20)},
                              "CRITICAL", "mobilize"));
    rules.push_back(make_rule("rule2", 2,
                              {Condition("event_type", ComparisonOp::EQ, "raio_seco")},
                              "HIGH", "send patrol"));
    return std::make_shared<const RuleStore>(std::move(rules));
}

// --- Scenarios ---

TEST(Engine, HotAndDryRecordIsCritical) {
    Engine engine(scenario_store());
    auto result = engine.evaluate_one(make_record(42, 18, "nenhum"));
    EXPECT_EQ(result.risk, "CRITICAL");
    EXPECT_EQ(result.action, "mobilize");
    EXPECT_EQ(result.matched_rule_id, "rule1");
    EXPECT_TRUE(result.matched());
}

TEST(Engine, DryLightningRecordIsHigh) {
    Engine engine(scenario_store());
    auto result = engine.evaluate_one(make_record(20, 50, "raio_seco"));
    EXPECT_EQ(result.risk, "HIGH");
    EXPECT_EQ(result.action, "send patrol");
    EXPECT_EQ(result.matched_rule_id, "rule2");
}

TEST(Engine, QuietRecordFallsBackToNormal) {
    Engine engine(scenario_store());
    auto result = engine.evaluate_one(make_record(20, 50, "nenhum"));
    EXPECT_EQ(result.risk, "NORMAL");
    EXPECT_EQ(result.action, "routine monitoring");
    EXPECT_EQ(result.matched_rule_id, "NO_RULE");
    EXPECT_FALSE(result.matched());
}

TEST(Engine, LoadedScenarioMatchesBuiltScenario) {
    std::istringstream in(R"([
        {"id": "rule2", "priority": 2,
         "conditions": [{"field": "event_type", "operator": "==", "value": "raio_seco"}],
         "result": {"risk": "HIGH", "action": "send patrol"}},
        {"id": "rule1", "priority": 1,
         "conditions": [{"field": "temp", "operator": ">", "value": 40},
                        {"field": "hum", "operator": "<", "value": 20}],
         "result": {"risk": "CRITICAL", "action": "mobilize"}}
    ])");
    Engine engine(RuleStore::load(in, "inline"));

    EXPECT_EQ(engine.evaluate_one(make_record(42, 18, "raio_seco")).matched_rule_id, "rule1");
    EXPECT_EQ(engine.evaluate_one(make_record(20, 50, "raio_seco")).matched_rule_id, "rule2");
    EXPECT_EQ(engine.evaluate_one(make_record(20, 50, "nenhum")).matched_rule_id, "NO_RULE");
}

// --- Priority ordering ---

TEST(Engine, LowerPriorityValueWins) {
    std::vector<Rule> rules;
    rules.push_back(make_rule("late", 5, {Condition("temp", ComparisonOp::GT, 30)},
                              "LOW", "monitor"));
    rules.push_back(make_rule("early", 1, {Condition("temp", ComparisonOp::GT, 30)},
                              "HIGH", "act"));
    Engine engine(std::make_shared<const RuleStore>(std::move(rules)));

    EXPECT_EQ(engine.evaluate_one(make_record(35, 50, "nenhum")).matched_rule_id, "early");
}

TEST(Engine, TiesResolveToEarlierDeclaration) {
    std::vector<Rule> rules;
    rules.push_back(make_rule("first", 2, {Condition("temp", ComparisonOp::GT, 30)},
                              "A", "a"));
    rules.push_back(make_rule("second", 2, {Condition("temp", ComparisonOp::GT, 30)},
                              "B", "b"));
    Engine engine(std::make_shared<const RuleStore>(std::move(rules)));

    EXPECT_EQ(engine.evaluate_one(make_record(35, 50, "nenhum")).matched_rule_id, "first");
}

TEST(Engine, EmptyConditionListAlwaysMatches) {
    std::vector<Rule> rules;
    rules.push_back(make_rule("catch_all", 100, {}, "LOW", "log"));
    rules.push_back(make_rule("specific", 1, {Condition("temp", ComparisonOp::GT, 45)},
                              "CRITICAL", "mobilize"));
    Engine engine(std::make_shared<const RuleStore>(std::move(rules)));

    EXPECT_EQ(engine.evaluate_one(make_record(50, 10, "nenhum")).matched_rule_id, "specific");
    EXPECT_EQ(engine.evaluate_one(make_record(20, 10, "nenhum")).matched_rule_id, "catch_all");
    EXPECT_EQ(engine.evaluate_one(Record{}).matched_rule_id, "catch_all");
}

// --- Short-circuit ---

TEST(Engine, FailingConditionStopsRule) {
    std::vector<Rule> rules;
    rules.push_back(make_rule("r", 1,
                              {Condition("temp", ComparisonOp::GT, 40),
                               Condition("hum", ComparisonOp::LT, 20)},
                              "CRITICAL", "mobilize"));
    Engine engine(std::make_shared<const RuleStore>(std::move(rules)));

    RecordingRecord record(make_record(20, 10, "nenhum"));
    auto result = engine.evaluate_one(record);

    EXPECT_EQ(result.matched_rule_id, "NO_RULE");
    ASSERT_EQ(record.lookups().size(), 1u);
    EXPECT_EQ(record.lookups()[0], "temp");
}

TEST(Engine, MatchingRuleStopsScan) {
    Engine engine(scenario_store());

    RecordingRecord record(make_record(42, 18, "raio_seco"));
    auto result = engine.evaluate_one(record);

    EXPECT_EQ(result.matched_rule_id, "rule1");
    // rule2's event_type condition is never consulted
    EXPECT_EQ(record.lookups(), (std::vector<std::string>{"temp", "hum"}));
}

// --- Missing fields ---

TEST(Engine, MissingFieldFallsThroughToNextRule) {
    Engine engine(scenario_store());

    Record record;
    record.set("hum", 10.0);
    record.set("event_type", "raio_seco");

    auto result = engine.evaluate_one(record);
    EXPECT_EQ(result.matched_rule_id, "rule2");
}

TEST(Engine, EmptyRecordYieldsDefault) {
    Engine engine(scenario_store());
    EXPECT_EQ(engine.evaluate_one(Record{}), EvaluationResult{});
}

TEST(Engine, NonNumericFieldFailsOrdering) {
    Engine engine(scenario_store());

    Record record;
    record.set("temp", "very hot");
    record.set("hum", 10.0);
    record.set("event_type", "nenhum");

    EXPECT_EQ(engine.evaluate_one(record).matched_rule_id, "NO_RULE");
}

TEST(Engine, EmptyStoreAlwaysYieldsDefault) {
    Engine engine(std::make_shared<const RuleStore>(std::vector<Rule>{}));
    EXPECT_EQ(engine.evaluate_one(make_record(50, 5, "raio_seco")).matched_rule_id, "NO_RULE");
}

// --- Determinism ---

TEST(Engine, RepeatedEvaluationIsIdentical) {
    Engine engine(scenario_store());
    auto record = make_record(42, 18, "nenhum");

    auto first = engine.evaluate_one(record);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(engine.evaluate_one(record), first);
    }
}

TEST(Engine, NullStoreIsRejected) {
    EXPECT_THROW(Engine(nullptr), std::invalid_argument);
}

// --- Batch ---

TEST(Engine, BatchPreservesOrderAndLength) {
    Engine engine(scenario_store());
    std::vector<Record> records = {
        make_record(20, 50, "nenhum"),
        make_record(42, 18, "nenhum"),
        make_record(20, 50, "raio_seco"),
        Record{},
    };

    auto stream = engine.evaluate_batch(records);
    std::vector<std::string> ids;
    while (auto result = stream.next()) {
        ids.push_back(result->matched_rule_id);
    }

    EXPECT_EQ(ids, (std::vector<std::string>{"NO_RULE", "rule1", "rule2", "NO_RULE"}));
}

TEST(Engine, BatchStreamIsOneShot) {
    Engine engine(scenario_store());
    std::vector<Record> records = {make_record(42, 18, "nenhum")};

    auto stream = engine.evaluate_batch(records);
    EXPECT_FALSE(stream.done());
    EXPECT_TRUE(stream.next().has_value());
    EXPECT_TRUE(stream.done());
    EXPECT_EQ(stream.position(), 1u);
    EXPECT_FALSE(stream.next().has_value());
    EXPECT_FALSE(stream.next().has_value());
}

TEST(Engine, BatchOverEmptyInputYieldsNothing) {
    Engine engine(scenario_store());
    std::vector<Record> records;

    auto stream = engine.evaluate_batch(records);
    EXPECT_FALSE(stream.next().has_value());
    EXPECT_TRUE(engine.evaluate_all(records).empty());
}

TEST(Engine, BatchAcceptsOnlyLvalueRecords) {
    // A stream borrows its records, so a temporary vector must not bind
    static_assert(can_evaluate_batch<std::vector<Record>&>::value, "");
    static_assert(can_evaluate_batch<const std::vector<Record>&>::value, "");
    static_assert(!can_evaluate_batch<std::vector<Record>>::value, "");
    static_assert(!can_evaluate_batch<std::vector<Record>&&>::value, "");
}

TEST(Engine, StreamOutlivesEngine) {
    std::vector<Record> records = {make_record(20, 50, "raio_seco")};

    auto stream = [&records]() {
        Engine engine(scenario_store());
        return engine.evaluate_batch(records);
    }();

    auto result = stream.next();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->matched_rule_id, "rule2");
}

TEST(Engine, EvaluateAllMatchesEvaluateOne) {
    Engine engine(scenario_store());
    std::vector<Record> records = {
        make_record(42, 18, "raio_seco"),
        make_record(39, 25, "nenhum"),
        make_record(20, 50, "raio_seco"),
    };

    auto results = engine.evaluate_all(records);
    ASSERT_EQ(results.size(), records.size());
    for (std::size_t i = 0; i < records.size(); ++i) {
        EXPECT_EQ(results[i], engine.evaluate_one(records[i]));
    }
}
