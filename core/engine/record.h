#pragma once

#include "rules/value.h"

#include <cstddef>
#include <string>
#include <unordered_map>

namespace firewatch {

// Read-only view of one observation to classify.
class IRecord {
public:
    virtual ~IRecord() = default;

    // Returns nullptr when the record has no such field.
    virtual const Value* find(const std::string& field) const = 0;
};

class Record : public IRecord {
public:
    Record() = default;
    explicit Record(std::unordered_map<std::string, Value> fields)
        : fields_(std::move(fields)) {}

    const Value* find(const std::string& field) const override {
        auto it = fields_.find(field);
        return it == fields_.end() ? nullptr : &it->second;
    }

    void set(const std::string& field, Value value) {
        fields_[field] = std::move(value);
    }

    void erase(const std::string& field) { fields_.erase(field); }

    bool contains(const std::string& field) const {
        return fields_.find(field) != fields_.end();
    }

    std::size_t size() const { return fields_.size(); }

    const std::unordered_map<std::string, Value>& fields() const { return fields_; }

private:
    std::unordered_map<std::string, Value> fields_;
};

} // namespace firewatch
