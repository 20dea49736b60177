#pragma once

#include "model/Environment.h"
#include "model/Pattern.h"
#include "model/Value.h"
#include "types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace PCE {

/**
 * @brief Pending send waiting for a receiver
 */
struct SendEntry {
    EntryId id = 0;
    ChannelName channel;
    Payload payload;
    Persistence persistence = Persistence::ONCE;
    InstanceId owner = EXTERNAL_ORIGIN;
};

/**
 * @brief Pending receive request waiting for a message
 *
 * RACE entries registered by one select share a non-zero race group; the
 * first arm to match retracts its siblings.
 */
struct ReceiveEntry {
    EntryId id = 0;
    ChannelName channel;
    std::vector<PatternPtr> patterns;
    ReceiveMode mode = ReceiveMode::ONE_SHOT;
    InstanceId continuation = 0;
    EnvironmentPtr env;
    uint64_t raceGroup = 0;
    size_t armIndex = 0;
};

/**
 * @brief One arm of a select: a channel and the patterns for its message
 */
struct SelectArm {
    ChannelName channel;
    std::vector<PatternPtr> patterns;
};

/**
 * @brief Outcome of a successful match, also the match journal record
 */
struct MatchRecord {
    uint64_t sequence = 0;
    ChannelName channel;
    EntryId sendEntry = 0;
    EntryId receiveEntry = 0;
    InstanceId sender = EXTERNAL_ORIGIN;
    InstanceId continuation = 0;
    size_t armIndex = 0;
    Payload payload;
    BindingList bindings;
    Persistence sendPersistence = Persistence::ONCE;
    ReceiveMode receiveMode = ReceiveMode::ONE_SHOT;
    bool sendKept = false;
    bool receiveKept = false;
};

/**
 * @brief Read-only view of one channel's pending entries
 */
struct ChannelSnapshot {
    ChannelName channel;
    std::vector<SendEntry> sends;
    std::vector<ReceiveEntry> receives;
};

}  // namespace PCE
