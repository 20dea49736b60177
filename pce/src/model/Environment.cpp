#include "model/Environment.h"

namespace PCE {

std::shared_ptr<const Environment> Environment::empty() {
    static const std::shared_ptr<const Environment> emptyEnv = std::make_shared<Environment>();
    return emptyEnv;
}

std::shared_ptr<const Environment> Environment::with(const std::string &name, const Value &value) const {
    auto next = std::make_shared<Environment>(*this);
    next->bindings_.insert_or_assign(name, value);
    return next;
}

std::shared_ptr<const Environment> Environment::withAll(const BindingList &bindings) const {
    auto next = std::make_shared<Environment>(*this);
    for (const auto &[name, value] : bindings) {
        next->bindings_.insert_or_assign(name, value);
    }
    return next;
}

std::shared_ptr<const Environment> Environment::without(const std::string &name) const {
    auto next = std::make_shared<Environment>(*this);
    next->bindings_.erase(name);
    return next;
}

std::optional<Value> Environment::lookup(const std::string &name) const {
    auto it = bindings_.find(name);
    if (it == bindings_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> Environment::names() const {
    std::vector<std::string> result;
    result.reserve(bindings_.size());
    for (const auto &entry : bindings_) {
        result.push_back(entry.first);
    }
    return result;
}

}  // namespace PCE
