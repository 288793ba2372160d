#pragma once

#include <string>
#include <variant>

namespace firewatch {

enum class ValueKind {
    NUMBER,
    STRING
};

inline const char* to_string(ValueKind kind) {
    switch (kind) {
        case ValueKind::NUMBER: return "number";
        case ValueKind::STRING: return "string";
    }
    return "unknown";
}

// A rule operand or record field: either numeric or text.
class Value {
public:
    Value() : data_(0.0) {}
    Value(double number) : data_(number) {}
    Value(int number) : data_(static_cast<double>(number)) {}
    Value(std::string text) : data_(std::move(text)) {}
    Value(const char* text) : data_(std::string(text)) {}

    ValueKind kind() const {
        return std::holds_alternative<double>(data_) ? ValueKind::NUMBER
                                                     : ValueKind::STRING;
    }

    bool is_number() const { return kind() == ValueKind::NUMBER; }
    bool is_string() const { return kind() == ValueKind::STRING; }

    double as_number() const { return std::get<double>(data_); }
    const std::string& as_string() const { return std::get<std::string>(data_); }

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return data_ != other.data_; }

private:
    std::variant<double, std::string> data_;
};

} // namespace firewatch
