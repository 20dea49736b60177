#pragma once

#include "types.h"
#include <cstddef>
#include <string>
#include <variant>

namespace PCE {

/**
 * @brief Tagged machine state: a StateKind plus its parameter
 *
 * EVALUATING carries the operand index, MATCHING the case index, BINDING the
 * name being bound, CONSTRUCTING/OPERATING the construct or operator, and the
 * mode-carrying states their mode.
 */
class FsmState {
public:
    FsmState() = default;

    static FsmState initial() {
        return FsmState(StateKind::INITIAL);
    }
    static FsmState evaluating(size_t exprRef) {
        return FsmState(StateKind::EVALUATING, exprRef);
    }
    static FsmState sending() {
        return FsmState(StateKind::SENDING);
    }
    static FsmState receiving(ReceiveMode mode) {
        return FsmState(StateKind::RECEIVING, mode);
    }
    static FsmState waiting() {
        return FsmState(StateKind::WAITING);
    }
    static FsmState branching() {
        return FsmState(StateKind::BRANCHING);
    }
    static FsmState forking() {
        return FsmState(StateKind::FORKING);
    }
    static FsmState joining() {
        return FsmState(StateKind::JOINING);
    }
    static FsmState binding(const std::string &name) {
        return FsmState(StateKind::BINDING, name);
    }
    static FsmState matching(size_t patternRef) {
        return FsmState(StateKind::MATCHING, patternRef);
    }
    static FsmState constructing(const std::string &kind) {
        return FsmState(StateKind::CONSTRUCTING, kind);
    }
    static FsmState operating(const std::string &op) {
        return FsmState(StateKind::OPERATING, op);
    }
    static FsmState bundling(BundleMode mode) {
        return FsmState(StateKind::BUNDLING, mode);
    }
    static FsmState referencing(ReferenceMode mode) {
        return FsmState(StateKind::REFERENCING, mode);
    }
    static FsmState interpolating() {
        return FsmState(StateKind::INTERPOLATING);
    }
    static FsmState conjoining() {
        return FsmState(StateKind::CONJOINING);
    }
    static FsmState disjoining() {
        return FsmState(StateKind::DISJOINING);
    }
    static FsmState negating() {
        return FsmState(StateKind::NEGATING);
    }
    static FsmState collecting(CollectionKind kind) {
        return FsmState(StateKind::COLLECTING, kind);
    }
    static FsmState terminated() {
        return FsmState(StateKind::TERMINATED);
    }

    StateKind kind() const {
        return kind_;
    }

    bool is(StateKind kind) const {
        return kind_ == kind;
    }

    bool isTerminal() const {
        return kind_ == StateKind::TERMINATED;
    }

    // Parameter accessors; each is valid only for the kinds documented above
    size_t index() const;
    const std::string &label() const;
    ReceiveMode receiveMode() const;
    BundleMode bundleMode() const;
    ReferenceMode referenceMode() const;
    CollectionKind collectionKind() const;

    /**
     * @brief "RECEIVING(PERSISTENT)", "EVALUATING(1)", "TERMINATED", ...
     */
    std::string describe() const;

    bool operator==(const FsmState &other) const {
        return kind_ == other.kind_ && detail_ == other.detail_;
    }

    bool operator!=(const FsmState &other) const {
        return !(*this == other);
    }

    using Detail =
        std::variant<std::monostate, size_t, std::string, ReceiveMode, BundleMode, ReferenceMode, CollectionKind>;

private:
    explicit FsmState(StateKind kind, Detail detail = std::monostate{}) : kind_(kind), detail_(std::move(detail)) {}

    StateKind kind_ = StateKind::INITIAL;
    Detail detail_;
};

}  // namespace PCE
