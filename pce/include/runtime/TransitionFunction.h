#pragma once

#include "events/Event.h"
#include "runtime/Effect.h"
#include "runtime/FsmInstance.h"
#include <optional>
#include <string>
#include <variant>

namespace PCE {

/**
 * @brief The instance consumed the event
 *
 * Carries the complete next instance data plus the ordered effects the
 * scheduler applies atomically.
 */
struct Progressed {
    FsmState state;
    EnvironmentPtr env;
    CapabilitiesPtr caps;
    Frame frame;
    EffectList effects;
    std::optional<Value> value;
    std::optional<ErrorInfo> failure;
};

/**
 * @brief The event cannot be consumed in the current state; it stays queued
 */
struct NotReady {
    std::string reason;
};

using StepResult = std::variant<Progressed, NotReady>;

/**
 * @brief Deterministic transition function over all process constructs
 *
 * step() never blocks and never touches the channel store or instance table;
 * all interaction happens through the returned effects. For a fixed instance
 * and event the result is identical on every invocation.
 */
class TransitionFunction {
public:
    static StepResult step(const FsmInstance &instance, const Event &event);

    /**
     * @brief Combine an existing restriction with a nested one
     *
     * A direction stays allowed only when both modes allow it.
     */
    static BundleMode intersect(BundleMode outer, BundleMode inner);

    static bool allowsSend(BundleMode mode) {
        return mode == BundleMode::WRITE || mode == BundleMode::RW;
    }

    static bool allowsReceive(BundleMode mode) {
        return mode == BundleMode::READ || mode == BundleMode::RW;
    }
};

}  // namespace PCE
