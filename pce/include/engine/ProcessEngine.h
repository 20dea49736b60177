#pragma once

#include "core/EventQueueManager.h"
#include "engine/EngineConfig.h"
#include "engine/RunReport.h"
#include "runtime/Scheduler.h"
#include "store/ChannelStore.h"
#include <mutex>
#include <optional>
#include <string>

namespace PCE {

/**
 * @brief Result of an external injection
 */
struct InjectResult {
    bool isSuccess = false;
    std::string errorMessage;
    ErrorKind errorKind = ErrorKind::MALFORMED_EVENT;

    static InjectResult success() {
        InjectResult result;
        result.isSuccess = true;
        return result;
    }

    static InjectResult error(const std::string &message) {
        InjectResult result;
        result.errorMessage = message;
        return result;
    }
};

/**
 * @brief Owns one run: channel store, instance table and scheduler
 *
 * Independent engines never share state. inject() and injectJson() may be
 * called from any thread; accepted messages are published by the loop at the
 * start of the next step. All other members belong to the loop thread.
 *
 * @code
 * PCE::ProcessEngine engine;
 * engine.load(program);
 * engine.inject("greet", {PCE::ValueUtils::fromString("world")});
 * PCE::RunReport report = engine.run();
 * @endcode
 */
class ProcessEngine {
public:
    explicit ProcessEngine(EngineConfig config = EngineConfig());

    ProcessEngine(const ProcessEngine &) = delete;
    ProcessEngine &operator=(const ProcessEngine &) = delete;

    /**
     * @brief Install the root process
     * @throws std::runtime_error if a process is already loaded
     */
    InstanceId load(ProcessPtr root, EnvironmentPtr env = nullptr);

    /**
     * @brief Publish on the public channel `@"channel"` from outside
     *
     * Rejected as MALFORMED_EVENT for an empty channel name or a payload
     * carrying unforgeable names; the store is untouched in that case.
     */
    InjectResult inject(const std::string &channel, Payload payload, Persistence persistence = Persistence::ONCE);

    /**
     * @brief inject() with a JSON array payload (a single non-array value is a one-element payload)
     */
    InjectResult injectJson(const std::string &channel, const std::string &payloadJson);
    InjectResult injectJson(const std::string &channel, const json &payload);

    /**
     * @brief Deliver TIMEOUT to an instance (meaningful for a waiting synchronous sender)
     * @return false if the instance is gone or terminated
     */
    bool timeout(InstanceId id);

    bool cancel(InstanceId id);

    /**
     * @brief Fire one (instance, event) pair
     * @throws std::runtime_error if nothing is loaded
     */
    bool step();

    /**
     * @brief Step until nothing is runnable, the root terminates or the step budget is used up
     * @throws std::runtime_error if nothing is loaded
     */
    RunReport run();

    RunReport report() const;

    const EngineConfig &config() const {
        return config_;
    }

    const ChannelStore &store() const {
        return store_;
    }

    const InstanceTable &instances() const {
        return instances_;
    }

    std::optional<InstanceId> root() const {
        return scheduler_.root();
    }

private:
    struct Injection {
        ChannelName channel;
        Payload payload;
        Persistence persistence = Persistence::ONCE;
    };

    void requireLoaded(const char *operation) const;
    void drainInbox();

    EngineConfig config_;
    ChannelStore store_;
    InstanceTable instances_;
    Scheduler scheduler_;
    std::mutex inboxMutex_;
    Core::EventQueueManager<Injection> inbox_;
    bool stepLimitExceeded_ = false;
};

}  // namespace PCE
