#pragma once

#include "events/Event.h"
#include "model/Environment.h"
#include "model/ProcessNode.h"
#include "runtime/FsmInstance.h"
#include "store/ChannelEntry.h"
#include <variant>
#include <vector>

namespace PCE {

/**
 * @brief Start a child instance and add it to the pending-children set
 */
struct SpawnChild {
    ProcessPtr node;
    EnvironmentPtr env;
    CapabilitiesPtr caps;
    ChildRole role = ChildRole::BODY;
};

/**
 * @brief Queue an event (target already set)
 */
struct EnqueueEvent {
    Event event;
};

struct Publish {
    ChannelName channel;
    Payload payload;
    Persistence persistence = Persistence::ONCE;
};

struct Request {
    ChannelName channel;
    std::vector<PatternPtr> patterns;
    ReceiveMode mode = ReceiveMode::ONE_SHOT;
    EnvironmentPtr env;
};

struct SelectRequest {
    std::vector<SelectArm> arms;
    EnvironmentPtr env;
};

/**
 * @brief Try the instance's surviving receive entries against pending sends
 */
struct RetryReceives {};

/**
 * @brief Withdraw the instance's receive entries
 */
struct RetractReceives {};

/**
 * @brief Withdraw every entry the instance owns, persistent sends included
 */
struct RetractOwned {};

/**
 * @brief The parent observed a child's termination; drop it from the table
 */
struct ReapChild {
    InstanceId child = 0;
};

using Effect = std::variant<SpawnChild, EnqueueEvent, Publish, Request, SelectRequest, RetryReceives,
                            RetractReceives, RetractOwned, ReapChild>;

using EffectList = std::vector<Effect>;

}  // namespace PCE
