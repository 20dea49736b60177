#include "engine/ProcessEngine.h"
#include "common/Logger.h"
#include <stdexcept>

namespace PCE {

namespace {

bool carriesUnforgeable(const Value &value) {
    if (const auto *name = ValueUtils::asChannel(value)) {
        return name->unforgeable;
    }
    if (const auto *elements = ValueUtils::sequenceElements(value)) {
        for (const auto &element : *elements) {
            if (carriesUnforgeable(element)) {
                return true;
            }
        }
    }
    if (const auto *map = ValueUtils::asMap(value)) {
        for (const auto &[key, item] : map->entries) {
            if (carriesUnforgeable(key) || carriesUnforgeable(item)) {
                return true;
            }
        }
    }
    return false;
}

}  // namespace

ProcessEngine::ProcessEngine(EngineConfig config)
    : config_(std::move(config)), store_(config_.recordMatchJournal), scheduler_(instances_, store_) {}

InstanceId ProcessEngine::load(ProcessPtr root, EnvironmentPtr env) {
    if (scheduler_.root()) {
        throw std::runtime_error("ProcessEngine: a process is already loaded");
    }
    return scheduler_.spawnRoot(std::move(root), std::move(env));
}

void ProcessEngine::requireLoaded(const char *operation) const {
    if (!scheduler_.root()) {
        throw std::runtime_error(std::string("ProcessEngine: ") + operation + " without a loaded process");
    }
}

InjectResult ProcessEngine::inject(const std::string &channel, Payload payload, Persistence persistence) {
    if (channel.empty()) {
        LOG_WARN("ProcessEngine: rejected injection with empty channel name");
        return InjectResult::error("channel name must not be empty");
    }
    for (const auto &value : payload) {
        if (carriesUnforgeable(value)) {
            LOG_WARN("ProcessEngine: rejected injection on '{}' carrying an unforgeable name", channel);
            return InjectResult::error("external payload cannot carry unforgeable names");
        }
    }

    ChannelName name = ValueUtils::quote(ValueUtils::fromString(channel));
    LOG_DEBUG("ProcessEngine: accepted {} for {}", ValueUtils::payloadToString(payload), name.key());

    std::lock_guard<std::mutex> lock(inboxMutex_);
    inbox_.raise(Injection{std::move(name), std::move(payload), persistence});
    return InjectResult::success();
}

InjectResult ProcessEngine::injectJson(const std::string &channel, const std::string &payloadJson) {
    std::string error;
    auto document = JsonUtils::parseJson(payloadJson, &error);
    if (!document) {
        LOG_WARN("ProcessEngine: rejected injection on '{}': {}", channel, error);
        return InjectResult::error("malformed JSON payload: " + error);
    }
    return injectJson(channel, *document);
}

InjectResult ProcessEngine::injectJson(const std::string &channel, const json &payload) {
    Payload values;
    std::string error;

    if (payload.is_array()) {
        for (const auto &item : payload) {
            auto value = JsonUtils::valueFromJson(item, &error);
            if (!value) {
                LOG_WARN("ProcessEngine: rejected injection on '{}': {}", channel, error);
                return InjectResult::error(error);
            }
            values.push_back(std::move(*value));
        }
    } else {
        auto value = JsonUtils::valueFromJson(payload, &error);
        if (!value) {
            LOG_WARN("ProcessEngine: rejected injection on '{}': {}", channel, error);
            return InjectResult::error(error);
        }
        values.push_back(std::move(*value));
    }
    return inject(channel, std::move(values));
}

void ProcessEngine::drainInbox() {
    Core::EventQueueManager<Injection> pending;
    {
        std::lock_guard<std::mutex> lock(inboxMutex_);
        std::swap(pending, inbox_);
    }
    pending.processAll([this](const Injection &injection) {
        scheduler_.publishExternal(injection.channel, injection.payload, injection.persistence);
    });
}

bool ProcessEngine::timeout(InstanceId id) {
    const FsmInstance *instance = instances_.find(id);
    if (!instance || instance->isTerminated()) {
        return false;
    }
    LOG_DEBUG("ProcessEngine: timeout for #{} in {}", id, instance->state.describe());
    return scheduler_.enqueue(Event::timeout(id));
}

bool ProcessEngine::cancel(InstanceId id) {
    return scheduler_.cancel(id);
}

bool ProcessEngine::step() {
    requireLoaded("step");
    drainInbox();
    return scheduler_.step();
}

RunReport ProcessEngine::run() {
    requireLoaded("run");
    LOG_INFO("ProcessEngine: run started (maxSteps={})", config_.maxSteps);

    stepLimitExceeded_ = false;
    uint64_t budgetStart = scheduler_.stepCount();
    while (true) {
        drainInbox();
        if (scheduler_.stepCount() - budgetStart >= config_.maxSteps && scheduler_.hasRunnable()) {
            stepLimitExceeded_ = true;
            break;
        }
        if (!scheduler_.step()) {
            break;
        }
    }

    RunReport result = report();
    switch (result.status) {
    case RunStatus::COMPLETED:
        LOG_INFO("ProcessEngine: {}", result.summary());
        break;
    case RunStatus::FAILED:
        LOG_ERROR("ProcessEngine: {}", result.summary());
        break;
    default:
        LOG_WARN("ProcessEngine: {}", result.summary());
        for (const auto &blocked : result.blocked) {
            LOG_WARN("ProcessEngine: #{} {} in {}: {}", blocked.id, blocked.construct, blocked.state, blocked.reason);
        }
    }
    return result;
}

RunReport ProcessEngine::report() const {
    RunReport result;
    result.status = stepLimitExceeded_ ? RunStatus::STEP_LIMIT_EXCEEDED : scheduler_.status(config_.quiescentListeners);
    result.steps = scheduler_.stepCount();
    result.errors = scheduler_.errors();
    result.journal = store_.journal();
    result.channels = store_.snapshot();

    if (auto rootId = scheduler_.root()) {
        if (const FsmInstance *root = instances_.find(*rootId)) {
            result.rootValue = root->value;
            const EnvironmentPtr &env = root->frame.scopeEnv ? root->frame.scopeEnv : root->env;
            result.rootEnvironment = env->bindings();
        }
    }
    if (result.status != RunStatus::COMPLETED && result.status != RunStatus::FAILED) {
        result.blocked = scheduler_.blockedInstances();
    }
    return result;
}

}  // namespace PCE
