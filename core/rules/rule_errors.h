#pragma once

#include <stdexcept>
#include <string>

namespace firewatch {

enum class LoadErrorKind {
    SOURCE_NOT_FOUND,
    MALFORMED_SOURCE,
    INVALID_RULE
};

inline const char* to_string(LoadErrorKind kind) {
    switch (kind) {
        case LoadErrorKind::SOURCE_NOT_FOUND: return "SourceNotFound";
        case LoadErrorKind::MALFORMED_SOURCE: return "MalformedSource";
        case LoadErrorKind::INVALID_RULE:     return "InvalidRule";
    }
    return "Unknown";
}

// Base of every error raised while loading rules or records.
class RuleLoadError : public std::runtime_error {
public:
    RuleLoadError(LoadErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    LoadErrorKind kind() const { return kind_; }

private:
    LoadErrorKind kind_;
};

class SourceNotFoundError : public RuleLoadError {
public:
    explicit SourceNotFoundError(const std::string& source)
        : RuleLoadError(LoadErrorKind::SOURCE_NOT_FOUND,
                        "cannot open source: " + source),
          source_(source) {}

    const std::string& source() const { return source_; }

private:
    std::string source_;
};

class MalformedSourceError : public RuleLoadError {
public:
    MalformedSourceError(const std::string& source, const std::string& detail)
        : RuleLoadError(LoadErrorKind::MALFORMED_SOURCE,
                        "malformed source " + source + ": " + detail),
          source_(source) {}

    const std::string& source() const { return source_; }

private:
    std::string source_;
};

// rule_id is "#<index>" when the rule has no usable id.
class InvalidRuleError : public RuleLoadError {
public:
    InvalidRuleError(const std::string& rule_id, const std::string& field,
                     const std::string& detail)
        : RuleLoadError(LoadErrorKind::INVALID_RULE,
                        "invalid rule '" + rule_id + "' at '" + field + "': " + detail),
          rule_id_(rule_id), field_(field) {}

    const std::string& rule_id() const { return rule_id_; }
    const std::string& field() const { return field_; }

private:
    std::string rule_id_;
    std::string field_;
};

} // namespace firewatch
