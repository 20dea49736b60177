#pragma once

#include "core/EventQueueManager.h"
#include "events/Event.h"
#include "runtime/Effect.h"
#include "runtime/FsmInstance.h"
#include "store/ChannelStore.h"
#include <deque>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace PCE {

enum class RunStatus {
    RUNNING,             // Events are still queued
    COMPLETED,           // Root terminated with a value
    FAILED,              // Root terminated with an error
    QUIESCENT,           // Only persistent listeners (and their ancestors) remain
    DEADLOCKED,          // Nothing runnable, instances still alive
    STEP_LIMIT_EXCEEDED  // Step budget used up
};

const char *toString(RunStatus status);

/**
 * @brief Diagnostic for an instance that is alive when the run stops
 */
struct BlockedInstance {
    InstanceId id = 0;
    std::string state;
    std::string construct;
    std::string reason;
};

/**
 * @brief Cooperative single-threaded scheduler
 *
 * Picks instances round-robin and their events FIFO, runs the transition
 * function and applies the resulting effects before the next step. Events
 * an instance cannot consume yet are deferred and requeued ahead of newer
 * events once the instance changes state.
 */
class Scheduler {
public:
    Scheduler(InstanceTable &instances, ChannelStore &store);

    Scheduler(const Scheduler &) = delete;
    Scheduler &operator=(const Scheduler &) = delete;

    /**
     * @brief Create the root instance and queue its START signal
     * @throws std::runtime_error if a root already exists
     */
    InstanceId spawnRoot(ProcessPtr process, EnvironmentPtr env = nullptr);

    /**
     * @brief Queue an event for its target; events for gone or terminated instances are dropped
     * @return true if queued
     */
    bool enqueue(Event event);

    /**
     * @brief Fire exactly one (instance, event) pair
     * @return false if nothing was runnable
     */
    bool step();

    /**
     * @brief Cancel an instance and its whole subtree
     *
     * Descendants are removed immediately with all their channel entries; the
     * instance itself receives CANCEL ahead of its queued events.
     *
     * @return false if the instance is unknown or already terminated
     */
    bool cancel(InstanceId id);

    /**
     * @brief Publish on behalf of the outside world
     */
    std::optional<MatchRecord> publishExternal(const ChannelName &channel, const Payload &payload,
                                               Persistence persistence);

    bool hasRunnable() const;

    /**
     * @brief Status as of now; RUNNING while events are queued
     * @param quiescentListeners Report QUIESCENT instead of DEADLOCKED for idle persistent listeners
     */
    RunStatus status(bool quiescentListeners) const;

    std::vector<BlockedInstance> blockedInstances() const;

    std::optional<InstanceId> root() const {
        return root_;
    }

    uint64_t stepCount() const {
        return stepCount_;
    }

    /**
     * @brief Every instance failure in the order it happened
     */
    const std::vector<ErrorInfo> &errors() const {
        return errors_;
    }

private:
    void dispatch(FsmInstance &instance, const Event &event);
    void applyEffects(InstanceId owner, EffectList &effects);
    void onMatch(const MatchRecord &match);
    void onTerminated(InstanceId id);
    void forget(InstanceId id);
    void discard(InstanceId id);
    void discardSubtree(InstanceId id);
    void markReady(InstanceId id);
    void drainSendRetries();
    bool isListenerOnly(const FsmInstance &instance) const;

    InstanceTable &instances_;
    ChannelStore &store_;
    std::map<InstanceId, Core::EventQueueManager<Event>> queues_;
    std::map<InstanceId, std::vector<Event>> deferred_;
    std::map<InstanceId, std::string> deferReasons_;
    std::deque<InstanceId> ready_;
    std::set<InstanceId> inReady_;
    std::deque<EntryId> sendRetries_;
    std::vector<ErrorInfo> errors_;
    std::optional<InstanceId> root_;
    uint64_t nextSequence_ = 1;
    uint64_t stepCount_ = 0;
};

}  // namespace PCE
