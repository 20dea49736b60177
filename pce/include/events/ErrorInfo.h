#pragma once

#include "types.h"
#include <memory>
#include <string>

namespace PCE {

enum class ErrorKind {
    PATTERN_EXHAUSTED,     // No match case / let pattern accepted the value
    CAPABILITY_VIOLATION,  // Send or receive forbidden by an enclosing bundle
    EVALUATION_FAILURE,    // Unbound variable, type mismatch, division by zero, ...
    CHILD_FAILED,          // A child instance failed; `cause` carries its error
    TIMEOUT,               // Synchronous send timed out waiting for its acknowledgement
    CANCELLED,             // Instance was cancelled
    MALFORMED_EVENT        // External injection rejected
};

const char *toString(ErrorKind kind);

/**
 * @brief Instance-level failure record carried by ERROR events and run reports
 */
struct ErrorInfo {
    ErrorKind kind = ErrorKind::EVALUATION_FAILURE;
    InstanceId instance = 0;
    std::string message;                // One-line description
    std::string detail;                 // Offending value, attempted patterns, bundle mode, ...
    std::shared_ptr<const ErrorInfo> cause;  // Child error for CHILD_FAILED

    static ErrorInfo make(ErrorKind kind, InstanceId instance, std::string message, std::string detail = "") {
        ErrorInfo info;
        info.kind = kind;
        info.instance = instance;
        info.message = std::move(message);
        info.detail = std::move(detail);
        return info;
    }

    /**
     * @brief The innermost error of a CHILD_FAILED chain
     */
    const ErrorInfo &rootCause() const {
        const ErrorInfo *current = this;
        while (current->cause) {
            current = current->cause.get();
        }
        return *current;
    }

    std::string toString() const;
};

}  // namespace PCE
