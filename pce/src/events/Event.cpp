#include "events/Event.h"

namespace PCE {

const char *toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::PATTERN_EXHAUSTED:
        return "PATTERN_EXHAUSTED";
    case ErrorKind::CAPABILITY_VIOLATION:
        return "CAPABILITY_VIOLATION";
    case ErrorKind::EVALUATION_FAILURE:
        return "EVALUATION_FAILURE";
    case ErrorKind::CHILD_FAILED:
        return "CHILD_FAILED";
    case ErrorKind::TIMEOUT:
        return "TIMEOUT";
    case ErrorKind::CANCELLED:
        return "CANCELLED";
    case ErrorKind::MALFORMED_EVENT:
        return "MALFORMED_EVENT";
    }
    return "UNKNOWN";
}

std::string ErrorInfo::toString() const {
    std::string text = std::string(PCE::toString(kind)) + " in #" + std::to_string(instance) + ": " + message;
    if (!detail.empty()) {
        text += " [" + detail + "]";
    }
    if (cause) {
        text += " <- " + cause->toString();
    }
    return text;
}

const char *toString(EventKind kind) {
    switch (kind) {
    case EventKind::MESSAGE_AVAILABLE:
        return "MESSAGE_AVAILABLE";
    case EventKind::CONDITION_MET:
        return "CONDITION_MET";
    case EventKind::EXPRESSION_EVALUATED:
        return "EXPRESSION_EVALUATED";
    case EventKind::PATTERN_MATCHED:
        return "PATTERN_MATCHED";
    case EventKind::TIMEOUT:
        return "TIMEOUT";
    case EventKind::ERROR:
        return "ERROR";
    case EventKind::SIGNAL:
        return "SIGNAL";
    }
    return "UNKNOWN";
}

const char *toString(SignalKind kind) {
    switch (kind) {
    case SignalKind::START:
        return "START";
    case SignalKind::CHILD_TERMINATED:
        return "CHILD_TERMINATED";
    case SignalKind::CANCEL:
        return "CANCEL";
    }
    return "UNKNOWN";
}

std::string Event::describe() const {
    switch (kind) {
    case EventKind::MESSAGE_AVAILABLE:
        return std::string("MESSAGE_AVAILABLE(") + (channel ? channel->key() : "?") + ", " +
               ValueUtils::payloadToString(payload) + ")";
    case EventKind::EXPRESSION_EVALUATED:
        return "EXPRESSION_EVALUATED(" + (value ? ValueUtils::toString(*value) : std::string("?")) + ")";
    case EventKind::ERROR:
        return "ERROR(" + (error ? std::string(toString(error->kind)) : std::string("?")) + ")";
    case EventKind::SIGNAL:
        return std::string("SIGNAL(") + toString(signal) + ")";
    default:
        return toString(kind);
    }
}

}  // namespace PCE
