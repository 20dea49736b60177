#pragma once

#include "events/ErrorInfo.h"
#include "model/Environment.h"
#include "model/ProcessNode.h"
#include "runtime/FsmState.h"
#include "types.h"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace PCE {

/**
 * @brief Capability restrictions installed by enclosing bundles, keyed by channel key
 */
using CapabilityMap = std::map<std::string, BundleMode>;
using CapabilitiesPtr = std::shared_ptr<const CapabilityMap>;

/**
 * @brief How a child reports back to its parent
 */
enum class ChildRole {
    OPERAND,  // Reports EXPRESSION_EVALUATED with its value
    BODY      // Reports SIGNAL(CHILD_TERMINATED)
};

/**
 * @brief Per-construct working data of an instance between transitions
 */
struct Frame {
    size_t cursor = 0;                      // Next name / let binding to process
    std::vector<Value> operands;            // Evaluated operand values, in order
    BindingList pendingBindings;            // Bindings of the message being bound
    size_t bindingCursor = 0;
    size_t armIndex = 0;                    // Select arm of the current message
    EnvironmentPtr scopeEnv;                // Environment extended by new/let/receive bindings
    std::optional<ChannelName> ackChannel;  // Acknowledgement owed (receive-send) or awaited (sync send)
    Value result;                           // Value of the last body child
    uint64_t minted = 0;                    // Fresh names minted so far
};

/**
 * @brief One running process
 *
 * Owned by the InstanceTable; removed only after TERMINATED and after the
 * parent has observed the termination.
 */
struct FsmInstance {
    InstanceId id = 0;
    ProcessPtr node;
    FsmState state;
    EnvironmentPtr env;
    CapabilitiesPtr caps;
    std::optional<InstanceId> parent;
    ChildRole role = ChildRole::BODY;
    std::set<InstanceId> pendingChildren;
    Frame frame;
    std::optional<Value> value;
    std::optional<ErrorInfo> failure;
    uint64_t transitions = 0;

    bool isTerminated() const {
        return state.isTerminal();
    }
};

/**
 * @brief Arena of instances indexed by id
 */
class InstanceTable {
public:
    /**
     * @brief Create an instance in INITIAL state
     * @return The new instance's id
     */
    InstanceId create(ProcessPtr node, EnvironmentPtr env, CapabilitiesPtr caps, std::optional<InstanceId> parent,
                      ChildRole role);

    FsmInstance *find(InstanceId id);
    const FsmInstance *find(InstanceId id) const;

    /**
     * @throws std::out_of_range for unknown ids
     */
    FsmInstance &get(InstanceId id);

    bool contains(InstanceId id) const {
        return instances_.count(id) > 0;
    }

    void remove(InstanceId id);

    /**
     * @brief Every descendant of an instance, deepest first
     */
    std::vector<InstanceId> descendantsOf(InstanceId id) const;

    size_t size() const {
        return instances_.size();
    }

    const std::map<InstanceId, FsmInstance> &all() const {
        return instances_;
    }

    void clear();

private:
    std::map<InstanceId, FsmInstance> instances_;
    InstanceId nextId_ = 1;
};

}  // namespace PCE
