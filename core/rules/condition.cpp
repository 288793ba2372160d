#include "rules/condition.h"

namespace firewatch {

namespace {

bool number_gt(double a, double b) { return a > b; }
bool number_lt(double a, double b) { return a < b; }
bool number_eq(double a, double b) { return a == b; }
bool number_ne(double a, double b) { return a != b; }
bool number_ge(double a, double b) { return a >= b; }
bool number_le(double a, double b) { return a <= b; }

bool string_eq(const std::string& a, const std::string& b) { return a == b; }
bool string_ne(const std::string& a, const std::string& b) { return a != b; }

} // namespace

const char* to_string(ComparisonOp op) {
    switch (op) {
        case ComparisonOp::GT: return ">";
        case ComparisonOp::LT: return "<";
        case ComparisonOp::EQ: return "==";
        case ComparisonOp::NE: return "!=";
        case ComparisonOp::GE: return ">=";
        case ComparisonOp::LE: return "<=";
    }
    return "?";
}

std::optional<ComparisonOp> parse_comparison_op(const std::string& symbol) {
    if (symbol == ">")  return ComparisonOp::GT;
    if (symbol == "<")  return ComparisonOp::LT;
    if (symbol == "==") return ComparisonOp::EQ;
    if (symbol == "!=") return ComparisonOp::NE;
    if (symbol == ">=") return ComparisonOp::GE;
    if (symbol == "<=") return ComparisonOp::LE;
    return std::nullopt;
}

Condition::Condition(std::string field, ComparisonOp op, Value operand)
    : field_(std::move(field)), op_(op), operand_(std::move(operand)) {
    switch (op_) {
        case ComparisonOp::GT:
            compare_numbers_ = number_gt;
            break;
        case ComparisonOp::LT:
            compare_numbers_ = number_lt;
            break;
        case ComparisonOp::EQ:
            compare_numbers_ = number_eq;
            compare_strings_ = string_eq;
            break;
        case ComparisonOp::NE:
            compare_numbers_ = number_ne;
            compare_strings_ = string_ne;
            break;
        case ComparisonOp::GE:
            compare_numbers_ = number_ge;
            break;
        case ComparisonOp::LE:
            compare_numbers_ = number_le;
            break;
    }
}

bool Condition::holds(const IRecord& record) const {
    const Value* actual = record.find(field_);
    if (actual == nullptr) {
        return false;
    }

    // Values of different kinds are never equal, and never ordered
    if (actual->kind() != operand_.kind()) {
        return op_ == ComparisonOp::NE;
    }

    if (operand_.is_number()) {
        return compare_numbers_(actual->as_number(), operand_.as_number());
    }

    // Ordering operators are numeric only
    if (compare_strings_ == nullptr) {
        return false;
    }
    return compare_strings_(actual->as_string(), operand_.as_string());
}

} // namespace firewatch
