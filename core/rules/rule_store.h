#pragma once

#include "rules/rule.h"

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace firewatch {

// Immutable, priority-ordered rule set. Rules are sorted once on construction
// (ascending priority, declaration order kept on ties) and never change; a
// reload builds a new store.
class RuleStore {
public:
    explicit RuleStore(std::vector<Rule> rules, std::string source = "");

    // Throws SourceNotFoundError, MalformedSourceError or InvalidRuleError.
    static std::shared_ptr<const RuleStore> load(const std::string& path);
    static std::shared_ptr<const RuleStore> load(std::istream& in,
                                                 const std::string& source_name);
    static std::shared_ptr<const RuleStore> from_json(const nlohmann::json& document,
                                                      const std::string& source_name);

    const std::vector<Rule>& rules() const { return rules_; }
    std::size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }
    const std::string& source() const { return source_; }

private:
    std::vector<Rule> rules_;
    std::string source_;
};

} // namespace firewatch
