#pragma once

#include "engine/record.h"
#include "rules/value.h"

#include <optional>
#include <string>

namespace firewatch {

enum class ComparisonOp {
    GT,
    LT,
    EQ,
    NE,
    GE,
    LE
};

const char* to_string(ComparisonOp op);

// Returns nullopt for anything other than the six recognised symbols.
std::optional<ComparisonOp> parse_comparison_op(const std::string& symbol);

// One field/operator/operand comparison. The operator is bound to its
// comparison functions at construction so evaluation does no string dispatch.
class Condition {
public:
    Condition(std::string field, ComparisonOp op, Value operand);

    // False when the field is missing or the operator is not defined for
    // strings. When the record value and the operand differ in kind only !=
    // holds.
    bool holds(const IRecord& record) const;

    const std::string& field() const { return field_; }
    ComparisonOp op() const { return op_; }
    const Value& operand() const { return operand_; }

private:
    using NumberComparator = bool (*)(double, double);
    using StringComparator = bool (*)(const std::string&, const std::string&);

    std::string field_;
    ComparisonOp op_;
    Value operand_;
    NumberComparator compare_numbers_ = nullptr;
    StringComparator compare_strings_ = nullptr;
};

} // namespace firewatch
