#pragma once

#include "model/Value.h"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace PCE {

/**
 * @brief Immutable name-to-value mapping scoped to one instance
 *
 * Every modification returns a new Environment; existing snapshots held by
 * children, queued events or channel store entries are never mutated.
 */
class Environment {
public:
    Environment() = default;

    static std::shared_ptr<const Environment> empty();

    /**
     * @brief Copy-on-write extension with a single binding
     */
    std::shared_ptr<const Environment> with(const std::string &name, const Value &value) const;

    /**
     * @brief Copy-on-write extension with an ordered list of bindings
     *
     * Later bindings shadow earlier ones with the same name.
     */
    std::shared_ptr<const Environment> withAll(const BindingList &bindings) const;

    /**
     * @brief Copy-on-write removal of a binding (used by `move` references)
     */
    std::shared_ptr<const Environment> without(const std::string &name) const;

    std::optional<Value> lookup(const std::string &name) const;

    bool contains(const std::string &name) const {
        return bindings_.count(name) > 0;
    }

    size_t size() const {
        return bindings_.size();
    }

    const std::map<std::string, Value> &bindings() const {
        return bindings_;
    }

    std::vector<std::string> names() const;

private:
    std::map<std::string, Value> bindings_;
};

using EnvironmentPtr = std::shared_ptr<const Environment>;

}  // namespace PCE
