#include "runtime/Scheduler.h"
#include "common/Logger.h"
#include "common/TypeNames.h"
#include "runtime/TransitionFunction.h"
#include <stdexcept>

namespace PCE {

const char *toString(RunStatus status) {
    switch (status) {
    case RunStatus::RUNNING:
        return "RUNNING";
    case RunStatus::COMPLETED:
        return "COMPLETED";
    case RunStatus::FAILED:
        return "FAILED";
    case RunStatus::QUIESCENT:
        return "QUIESCENT";
    case RunStatus::DEADLOCKED:
        return "DEADLOCKED";
    case RunStatus::STEP_LIMIT_EXCEEDED:
        return "STEP_LIMIT_EXCEEDED";
    }
    return "UNKNOWN";
}

Scheduler::Scheduler(InstanceTable &instances, ChannelStore &store) : instances_(instances), store_(store) {
    store_.setMatchCallback([this](const MatchRecord &match) { onMatch(match); });
}

InstanceId Scheduler::spawnRoot(ProcessPtr process, EnvironmentPtr env) {
    if (root_) {
        throw std::runtime_error("Scheduler: root instance already spawned");
    }
    if (!process) {
        throw std::invalid_argument("Scheduler: root process is null");
    }
    root_ = instances_.create(std::move(process), std::move(env), nullptr, std::nullopt, ChildRole::BODY);
    LOG_INFO("Scheduler: root instance #{} created ({})", *root_, instances_.get(*root_).node->constructName());
    enqueue(Event::start(*root_));
    return *root_;
}

void Scheduler::markReady(InstanceId id) {
    if (inReady_.insert(id).second) {
        ready_.push_back(id);
    }
}

bool Scheduler::enqueue(Event event) {
    const FsmInstance *target = instances_.find(event.target);
    if (!target || target->isTerminated()) {
        LOG_TRACE("Scheduler: dropping {} for gone instance #{}", event.describe(), event.target);
        return false;
    }
    event.sequence = nextSequence_++;
    queues_[event.target].raise(event);
    markReady(event.target);
    return true;
}

bool Scheduler::step() {
    while (!ready_.empty()) {
        InstanceId id = ready_.front();
        ready_.pop_front();
        inReady_.erase(id);

        auto queue = queues_.find(id);
        if (queue == queues_.end() || !queue->second.hasEvents()) {
            continue;
        }
        Event event = queue->second.pop();
        if (queue->second.hasEvents()) {
            markReady(id);
        }

        FsmInstance *instance = instances_.find(id);
        if (!instance || instance->isTerminated()) {
            continue;
        }

        ++stepCount_;
        dispatch(*instance, event);
        drainSendRetries();
        return true;
    }
    return false;
}

void Scheduler::dispatch(FsmInstance &instance, const Event &event) {
    InstanceId id = instance.id;
    StepResult result = TransitionFunction::step(instance, event);

    if (const auto *notReady = std::get_if<NotReady>(&result)) {
        LOG_TRACE("Scheduler: #{} defers {} ({})", id, event.describe(), notReady->reason);
        deferred_[id].push_back(event);
        deferReasons_[id] = notReady->reason;
        return;
    }

    auto &progressed = std::get<Progressed>(result);
    FsmState before = instance.state;
    instance.state = std::move(progressed.state);
    instance.env = std::move(progressed.env);
    instance.caps = std::move(progressed.caps);
    instance.frame = std::move(progressed.frame);
    instance.value = std::move(progressed.value);
    instance.failure = std::move(progressed.failure);
    instance.transitions++;

    LOG_DEBUG("Scheduler: #{} {} --{}--> {}", id, before.describe(), event.describe(), instance.state.describe());

    bool changed = instance.state != before;
    bool terminated = instance.isTerminated();

    applyEffects(id, progressed.effects);

    if (changed && !terminated) {
        auto deferred = deferred_.find(id);
        if (deferred != deferred_.end()) {
            queues_[id].requeueFront(deferred->second);
            deferred_.erase(deferred);
            deferReasons_.erase(id);
            markReady(id);
        }
    }
    if (terminated) {
        onTerminated(id);
    }
}

void Scheduler::applyEffects(InstanceId owner, EffectList &effects) {
    for (auto &effect : effects) {
        if (auto *spawn = std::get_if<SpawnChild>(&effect)) {
            InstanceId child =
                instances_.create(std::move(spawn->node), std::move(spawn->env), std::move(spawn->caps), owner, spawn->role);
            instances_.get(owner).pendingChildren.insert(child);
            LOG_TRACE("Scheduler: #{} spawned #{}", owner, child);
            enqueue(Event::start(child));
        } else if (auto *enqueueEvent = std::get_if<EnqueueEvent>(&effect)) {
            enqueue(std::move(enqueueEvent->event));
        } else if (auto *publish = std::get_if<Publish>(&effect)) {
            store_.publish(publish->channel, publish->payload, publish->persistence, owner);
        } else if (auto *request = std::get_if<Request>(&effect)) {
            store_.request(request->channel, request->patterns, request->mode, owner, request->env);
        } else if (auto *select = std::get_if<SelectRequest>(&effect)) {
            store_.select(select->arms, owner, select->env);
        } else if (std::holds_alternative<RetryReceives>(effect)) {
            store_.retryReceives(owner);
        } else if (std::holds_alternative<RetractReceives>(effect)) {
            store_.retractReceivesOwnedBy(owner);
        } else if (std::holds_alternative<RetractOwned>(effect)) {
            store_.retractOwnedBy(owner);
        } else if (auto *reap = std::get_if<ReapChild>(&effect)) {
            if (FsmInstance *instance = instances_.find(owner)) {
                instance->pendingChildren.erase(reap->child);
            }
            forget(reap->child);
        }
    }
}

void Scheduler::onMatch(const MatchRecord &match) {
    LOG_DEBUG("Scheduler: match #{} on {} delivers {} to #{}", match.sequence, match.channel.key(),
              ValueUtils::payloadToString(match.payload), match.continuation);
    if (!enqueue(Event::messageAvailable(match.continuation, match.channel, match.payload, match.bindings,
                                         match.armIndex, match.sequence))) {
        LOG_WARN("Scheduler: message on {} matched terminated instance #{}", match.channel.key(), match.continuation);
    }

    // A kept send whose receiver was consumed may still satisfy other receivers
    if (match.sendKept && !match.receiveKept) {
        sendRetries_.push_back(match.sendEntry);
    }
}

void Scheduler::drainSendRetries() {
    while (!sendRetries_.empty()) {
        EntryId entry = sendRetries_.front();
        sendRetries_.pop_front();
        store_.retrySend(entry);
    }
}

void Scheduler::onTerminated(InstanceId id) {
    FsmInstance &instance = instances_.get(id);
    store_.retractReceivesOwnedBy(id);
    queues_.erase(id);
    deferred_.erase(id);
    deferReasons_.erase(id);

    // Children still running under a failed instance go with it
    for (InstanceId child : instance.pendingChildren) {
        discardSubtree(child);
    }
    instance.pendingChildren.clear();

    if (instance.failure) {
        LOG_ERROR("Scheduler: instance #{} failed: {}", id, instance.failure->toString());
        errors_.push_back(*instance.failure);
    }

    if (!instance.parent) {
        LOG_INFO("Scheduler: root instance #{} terminated after {} steps", id, stepCount_);
        return;
    }

    InstanceId parent = *instance.parent;
    Event report;
    if (instance.failure) {
        report = Event::childError(parent, id, *instance.failure);
    } else if (instance.role == ChildRole::OPERAND) {
        report = Event::expressionEvaluated(parent, id, instance.value.value_or(ValueUtils::nil()));
    } else {
        report = Event::childTerminated(parent, id, instance.value.value_or(ValueUtils::nil()));
    }
    if (!enqueue(std::move(report))) {
        forget(id);
    }
}

void Scheduler::forget(InstanceId id) {
    queues_.erase(id);
    deferred_.erase(id);
    deferReasons_.erase(id);
    instances_.remove(id);
}

void Scheduler::discard(InstanceId id) {
    // Sends of an instance that already terminated stay published
    const FsmInstance *instance = instances_.find(id);
    if (instance && !instance->isTerminated()) {
        store_.retractOwnedBy(id);
    }
    forget(id);
}

void Scheduler::discardSubtree(InstanceId id) {
    for (InstanceId descendant : instances_.descendantsOf(id)) {
        discard(descendant);
    }
    discard(id);
}

bool Scheduler::cancel(InstanceId id) {
    FsmInstance *instance = instances_.find(id);
    if (!instance || instance->isTerminated()) {
        return false;
    }

    for (InstanceId descendant : instances_.descendantsOf(id)) {
        LOG_DEBUG("Scheduler: cancelling descendant #{} of #{}", descendant, id);
        discard(descendant);
    }
    instance->pendingChildren.clear();

    Event event = Event::cancel(id);
    event.sequence = nextSequence_++;
    queues_[id].raiseFront(event);
    markReady(id);
    LOG_INFO("Scheduler: cancel requested for #{}", id);
    return true;
}

std::optional<MatchRecord> Scheduler::publishExternal(const ChannelName &channel, const Payload &payload,
                                                      Persistence persistence) {
    auto match = store_.publish(channel, payload, persistence, EXTERNAL_ORIGIN);
    drainSendRetries();
    return match;
}

bool Scheduler::hasRunnable() const {
    for (const auto &[id, queue] : queues_) {
        if (queue.hasEvents()) {
            return true;
        }
    }
    return false;
}

bool Scheduler::isListenerOnly(const FsmInstance &instance) const {
    if (instance.state.is(StateKind::RECEIVING) && instance.state.receiveMode() == ReceiveMode::PERSISTENT) {
        return true;
    }
    return instance.state.is(StateKind::JOINING) && !instance.pendingChildren.empty();
}

RunStatus Scheduler::status(bool quiescentListeners) const {
    if (root_) {
        const FsmInstance *root = instances_.find(*root_);
        if (root && root->isTerminated()) {
            return root->failure ? RunStatus::FAILED : RunStatus::COMPLETED;
        }
    }
    if (hasRunnable()) {
        return RunStatus::RUNNING;
    }

    if (quiescentListeners) {
        bool anyListener = false;
        bool allListeners = true;
        for (const auto &[id, instance] : instances_.all()) {
            if (instance.isTerminated()) {
                continue;
            }
            if (!isListenerOnly(instance)) {
                allListeners = false;
                break;
            }
            anyListener = anyListener || instance.state.is(StateKind::RECEIVING);
        }
        if (allListeners && anyListener) {
            return RunStatus::QUIESCENT;
        }
    }
    return RunStatus::DEADLOCKED;
}

std::vector<BlockedInstance> Scheduler::blockedInstances() const {
    std::map<InstanceId, std::vector<std::string>> listening;
    for (const auto &channel : store_.snapshot()) {
        for (const auto &receive : channel.receives) {
            listening[receive.continuation].push_back(channel.channel.key());
        }
    }

    auto join = [](const std::vector<std::string> &parts) {
        std::string out;
        for (const auto &part : parts) {
            out += (out.empty() ? "" : ", ") + part;
        }
        return out;
    };

    std::vector<BlockedInstance> result;
    for (const auto &[id, instance] : instances_.all()) {
        if (instance.isTerminated()) {
            continue;
        }

        BlockedInstance blocked;
        blocked.id = id;
        blocked.state = instance.state.describe();
        blocked.construct = instance.node->constructName();

        std::vector<std::string> children;
        for (InstanceId child : instance.pendingChildren) {
            children.push_back("#" + std::to_string(child));
        }

        switch (instance.state.kind()) {
        case StateKind::RECEIVING:
            blocked.reason = "waiting for a message on " + join(listening[id]);
            break;
        case StateKind::WAITING:
            blocked.reason = "waiting for acknowledgement on " +
                             (instance.frame.ackChannel ? instance.frame.ackChannel->key() : std::string("?"));
            break;
        case StateKind::JOINING:
            blocked.reason = "waiting for children " + join(children);
            break;
        case StateKind::EVALUATING:
            blocked.reason = "waiting for operand " + join(children);
            break;
        default: {
            auto reason = deferReasons_.find(id);
            blocked.reason = reason != deferReasons_.end() ? reason->second : "idle";
        }
        }
        result.push_back(std::move(blocked));
    }
    return result;
}

}  // namespace PCE
