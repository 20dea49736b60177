#include "runtime/FsmInstance.h"
#include <stdexcept>

namespace PCE {

InstanceId InstanceTable::create(ProcessPtr node, EnvironmentPtr env, CapabilitiesPtr caps,
                                 std::optional<InstanceId> parent, ChildRole role) {
    FsmInstance instance;
    instance.id = nextId_++;
    instance.node = std::move(node);
    instance.state = FsmState::initial();
    instance.env = env ? std::move(env) : Environment::empty();
    instance.caps = caps ? std::move(caps) : std::make_shared<CapabilityMap>();
    instance.parent = parent;
    instance.role = role;
    instance.frame.scopeEnv = instance.env;

    InstanceId id = instance.id;
    instances_.emplace(id, std::move(instance));
    return id;
}

FsmInstance *InstanceTable::find(InstanceId id) {
    auto it = instances_.find(id);
    return it == instances_.end() ? nullptr : &it->second;
}

const FsmInstance *InstanceTable::find(InstanceId id) const {
    auto it = instances_.find(id);
    return it == instances_.end() ? nullptr : &it->second;
}

FsmInstance &InstanceTable::get(InstanceId id) {
    auto it = instances_.find(id);
    if (it == instances_.end()) {
        throw std::out_of_range("InstanceTable: unknown instance #" + std::to_string(id));
    }
    return it->second;
}

void InstanceTable::remove(InstanceId id) {
    instances_.erase(id);
}

std::vector<InstanceId> InstanceTable::descendantsOf(InstanceId id) const {
    std::vector<InstanceId> result;
    const FsmInstance *instance = find(id);
    if (!instance) {
        return result;
    }
    for (InstanceId child : instance->pendingChildren) {
        auto nested = descendantsOf(child);
        result.insert(result.end(), nested.begin(), nested.end());
        result.push_back(child);
    }
    return result;
}

void InstanceTable::clear() {
    instances_.clear();
    nextId_ = 1;
}

}  // namespace PCE
