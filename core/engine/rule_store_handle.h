#pragma once

#include "engine/engine.h"
#include "rules/rule_store.h"

#include <memory>
#include <string>

namespace firewatch {

// Publishes the rule store used by new evaluations. Swaps are atomic; an
// evaluation already holding the previous store finishes against it.
class RuleStoreHandle {
public:
    explicit RuleStoreHandle(std::shared_ptr<const RuleStore> initial);

    std::shared_ptr<const RuleStore> current() const;

    void publish(std::shared_ptr<const RuleStore> store);

    // Loads a fresh store from path and publishes it. On any load error the
    // exception propagates and the current store stays published.
    std::shared_ptr<const RuleStore> reload(const std::string& path);

    Engine engine() const { return Engine(current()); }

private:
    std::shared_ptr<const RuleStore> store_;
};

} // namespace firewatch
