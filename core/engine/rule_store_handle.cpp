#include "engine/rule_store_handle.h"

#include <atomic>
#include <stdexcept>

namespace firewatch {

RuleStoreHandle::RuleStoreHandle(std::shared_ptr<const RuleStore> initial) {
    publish(std::move(initial));
}

std::shared_ptr<const RuleStore> RuleStoreHandle::current() const {
    return std::atomic_load(&store_);
}

void RuleStoreHandle::publish(std::shared_ptr<const RuleStore> store) {
    if (!store) {
        throw std::invalid_argument("cannot publish a null rule store");
    }
    std::atomic_store(&store_, std::move(store));
}

std::shared_ptr<const RuleStore> RuleStoreHandle::reload(const std::string& path) {
    auto fresh = RuleStore::load(path);
    publish(fresh);
    return fresh;
}

} // namespace firewatch
