#pragma once

#include "events/ErrorInfo.h"
#include "model/Value.h"
#include "types.h"
#include <cstdint>
#include <optional>
#include <string>

namespace PCE {

enum class EventKind {
    MESSAGE_AVAILABLE,     // A channel match delivered a message to a receiver
    CONDITION_MET,         // Self-enqueued by transient states to continue
    EXPRESSION_EVALUATED,  // An operand child terminated with a value
    PATTERN_MATCHED,       // A match case accepted the value
    TIMEOUT,               // Synchronous send gave up waiting
    ERROR,                 // A child failed
    SIGNAL                 // Lifecycle signal, see SignalKind
};

enum class SignalKind {
    START,             // First event of every instance
    CHILD_TERMINATED,  // A body child terminated successfully
    CANCEL             // External cancellation
};

const char *toString(EventKind kind);
const char *toString(SignalKind kind);

/**
 * @brief Immutable event record addressed to one instance
 *
 * Only the fields relevant to the kind are populated.
 */
struct Event {
    EventKind kind = EventKind::SIGNAL;
    SignalKind signal = SignalKind::START;
    InstanceId target = 0;
    uint64_t sequence = 0;  // Assigned by the scheduler when enqueued

    // MESSAGE_AVAILABLE
    std::optional<ChannelName> channel;
    Payload payload;
    size_t armIndex = 0;
    uint64_t matchSequence = 0;

    // MESSAGE_AVAILABLE and PATTERN_MATCHED
    BindingList bindings;

    // EXPRESSION_EVALUATED and CHILD_TERMINATED
    std::optional<Value> value;

    // EXPRESSION_EVALUATED, CHILD_TERMINATED and ERROR from a child
    std::optional<InstanceId> sourceChild;

    // ERROR
    std::optional<ErrorInfo> error;

    static Event start(InstanceId target) {
        return signalOf(target, SignalKind::START);
    }

    static Event cancel(InstanceId target) {
        return signalOf(target, SignalKind::CANCEL);
    }

    static Event conditionMet(InstanceId target) {
        Event event;
        event.kind = EventKind::CONDITION_MET;
        event.target = target;
        return event;
    }

    static Event timeout(InstanceId target) {
        Event event;
        event.kind = EventKind::TIMEOUT;
        event.target = target;
        return event;
    }

    static Event messageAvailable(InstanceId target, const ChannelName &channel, Payload payload,
                                  BindingList bindings, size_t armIndex, uint64_t matchSequence) {
        Event event;
        event.kind = EventKind::MESSAGE_AVAILABLE;
        event.target = target;
        event.channel = channel;
        event.payload = std::move(payload);
        event.bindings = std::move(bindings);
        event.armIndex = armIndex;
        event.matchSequence = matchSequence;
        return event;
    }

    static Event patternMatched(InstanceId target, BindingList bindings) {
        Event event;
        event.kind = EventKind::PATTERN_MATCHED;
        event.target = target;
        event.bindings = std::move(bindings);
        return event;
    }

    static Event expressionEvaluated(InstanceId target, InstanceId child, Value value) {
        Event event;
        event.kind = EventKind::EXPRESSION_EVALUATED;
        event.target = target;
        event.sourceChild = child;
        event.value = std::move(value);
        return event;
    }

    static Event childTerminated(InstanceId target, InstanceId child, Value value) {
        Event event = signalOf(target, SignalKind::CHILD_TERMINATED);
        event.sourceChild = child;
        event.value = std::move(value);
        return event;
    }

    static Event childError(InstanceId target, InstanceId child, ErrorInfo error) {
        Event event;
        event.kind = EventKind::ERROR;
        event.target = target;
        event.sourceChild = child;
        event.error = std::move(error);
        return event;
    }

    bool isSignal(SignalKind kind) const {
        return this->kind == EventKind::SIGNAL && signal == kind;
    }

    /**
     * @brief Compact description for logs ("MESSAGE_AVAILABLE(@"ch", (1))")
     */
    std::string describe() const;

private:
    static Event signalOf(InstanceId target, SignalKind kind) {
        Event event;
        event.kind = EventKind::SIGNAL;
        event.signal = kind;
        event.target = target;
        return event;
    }
};

}  // namespace PCE
