#include "rules/rule_store.h"
#include "rules/rule_errors.h"

#include <algorithm>
#include <climits>
#include <cstdint>
#include <fstream>
#include <nlohmann/json.hpp>

namespace firewatch {

namespace {

using json = nlohmann::json;

// Rule files exist in English and in the legacy Portuguese spelling.
const json* find_key(const json& object, const char* key, const char* alias) {
    auto it = object.find(key);
    if (it != object.end()) {
        return &*it;
    }
    it = object.find(alias);
    if (it != object.end()) {
        return &*it;
    }
    return nullptr;
}

const json& require(const json& object, const char* key, const char* alias,
                    const std::string& rule_id, const std::string& path) {
    const json* value = find_key(object, key, alias);
    if (value == nullptr) {
        throw InvalidRuleError(rule_id, path, "missing required field");
    }
    return *value;
}

std::string require_string(const json& object, const char* key, const char* alias,
                           const std::string& rule_id, const std::string& path) {
    const json& value = require(object, key, alias, rule_id, path);
    if (!value.is_string()) {
        throw InvalidRuleError(rule_id, path, "expected a string");
    }
    return value.get<std::string>();
}

int parse_priority(const json& value, const std::string& rule_id) {
    if (!value.is_number_integer()) {
        throw InvalidRuleError(rule_id, "priority", "expected an integer");
    }

    bool in_range = value.is_number_unsigned()
        ? value.get<std::uint64_t>() <= static_cast<std::uint64_t>(INT_MAX)
        : value.get<std::int64_t>() >= INT_MIN && value.get<std::int64_t>() <= INT_MAX;
    if (!in_range) {
        throw InvalidRuleError(rule_id, "priority", "out of range");
    }
    return static_cast<int>(value.get<std::int64_t>());
}

Value parse_operand(const json& value, const std::string& rule_id,
                    const std::string& path) {
    if (value.is_number()) {
        return Value(value.get<double>());
    }
    if (value.is_string()) {
        return Value(value.get<std::string>());
    }
    throw InvalidRuleError(rule_id, path, "expected a number or a string");
}

Condition parse_condition(const json& entry, const std::string& rule_id,
                          std::size_t index) {
    std::string prefix = "conditions[" + std::to_string(index) + "]";
    if (!entry.is_object()) {
        throw InvalidRuleError(rule_id, prefix, "expected an object");
    }

    std::string field = require_string(entry, "field", "variavel", rule_id,
                                       prefix + ".field");
    std::string symbol = require_string(entry, "operator", "operador", rule_id,
                                        prefix + ".operator");
    auto op = parse_comparison_op(symbol);
    if (!op) {
        throw InvalidRuleError(rule_id, prefix + ".operator",
                               "unrecognised operator '" + symbol + "'");
    }
    Value operand = parse_operand(require(entry, "value", "valor", rule_id, prefix + ".value"),
                                  rule_id, prefix + ".value");

    return Condition(std::move(field), *op, std::move(operand));
}

Rule parse_rule(const json& entry, std::size_t index) {
    std::string label = "#" + std::to_string(index);
    if (!entry.is_object()) {
        throw InvalidRuleError(label, "", "expected an object");
    }

    Rule rule;
    rule.id = require_string(entry, "id", "id", label, "id");
    label = rule.id;

    rule.priority = parse_priority(require(entry, "priority", "prioridade", label, "priority"),
                                   label);

    if (const json* description = find_key(entry, "description", "descricao")) {
        if (!description->is_string()) {
            throw InvalidRuleError(label, "description", "expected a string");
        }
        rule.description = description->get<std::string>();
    }

    const json& conditions = require(entry, "conditions", "condicoes", label, "conditions");
    if (!conditions.is_array()) {
        throw InvalidRuleError(label, "conditions", "expected an array");
    }
    rule.conditions.reserve(conditions.size());
    for (std::size_t i = 0; i < conditions.size(); ++i) {
        rule.conditions.push_back(parse_condition(conditions[i], label, i));
    }

    const json& result = require(entry, "result", "resultado", label, "result");
    if (!result.is_object()) {
        throw InvalidRuleError(label, "result", "expected an object");
    }
    rule.outcome.risk = require_string(result, "risk", "risco", label, "result.risk");
    rule.outcome.action = require_string(result, "action", "acao", label, "result.action");

    return rule;
}

} // namespace

RuleStore::RuleStore(std::vector<Rule> rules, std::string source)
    : rules_(std::move(rules)), source_(std::move(source)) {
    std::stable_sort(rules_.begin(), rules_.end(),
                     [](const Rule& a, const Rule& b) { return a.priority < b.priority; });
}

std::shared_ptr<const RuleStore> RuleStore::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw SourceNotFoundError(path);
    }
    return load(file, path);
}

std::shared_ptr<const RuleStore> RuleStore::load(std::istream& in,
                                                 const std::string& source_name) {
    json document;
    try {
        document = json::parse(in);
    } catch (const json::parse_error& e) {
        throw MalformedSourceError(source_name, e.what());
    }
    return from_json(document, source_name);
}

std::shared_ptr<const RuleStore> RuleStore::from_json(const json& document,
                                                      const std::string& source_name) {
    const json* entries = &document;
    if (document.is_object()) {
        auto it = document.find("rules");
        if (it == document.end()) {
            throw MalformedSourceError(source_name, "object has no 'rules' member");
        }
        entries = &*it;
    }
    if (!entries->is_array()) {
        throw MalformedSourceError(source_name, "expected an array of rules");
    }

    std::vector<Rule> rules;
    rules.reserve(entries->size());
    for (std::size_t i = 0; i < entries->size(); ++i) {
        rules.push_back(parse_rule((*entries)[i], i));
    }

    return std::make_shared<const RuleStore>(std::move(rules), source_name);
}

} // namespace firewatch
