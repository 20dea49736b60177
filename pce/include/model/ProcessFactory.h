#pragma once

#include "model/ProcessNode.h"
#include <string>
#include <vector>

namespace PCE {

/**
 * @brief Builders for immutable process trees
 *
 * Used by ProcessJsonParser and by tests that assemble programs directly.
 */
class ProcessFactory {
public:
    static ProcessPtr nil();
    static ProcessPtr literal(const Value &value);
    static ProcessPtr integer(int64_t value);
    static ProcessPtr boolean(bool value);
    static ProcessPtr string(const std::string &value);
    static ProcessPtr var(const std::string &name, ReferenceMode mode = ReferenceMode::COPY);

    /**
     * @brief Quote a process into a channel name: `@P`
     */
    static ProcessPtr quote(ProcessPtr process);

    /**
     * @brief Public channel `@"name"`
     */
    static ProcessPtr channel(const std::string &name);

    static ProcessPtr par(std::vector<ProcessPtr> processes);
    static ProcessPtr newNames(std::vector<std::string> names, ProcessPtr body);
    static ProcessPtr send(ProcessPtr channel, std::vector<ProcessPtr> args, bool persistent = false);
    static ProcessPtr sendSync(ProcessPtr channel, std::vector<ProcessPtr> args, ProcessPtr continuation = nullptr);

    static ReceiveBind bind(std::vector<PatternPtr> patterns, ProcessPtr channel,
                            ReceiveSource source = ReceiveSource::SIMPLE, std::vector<ProcessPtr> inputs = {});

    static ProcessPtr receive(ReceiveBind bind, ProcessPtr body, ReceiveMode mode = ReceiveMode::ONE_SHOT);

    /**
     * @brief `for (b1; b2; ...) body` as nested sequential receives
     */
    static ProcessPtr receiveAll(std::vector<ReceiveBind> binds, ProcessPtr body,
                                 ReceiveMode mode = ReceiveMode::ONE_SHOT);

    /**
     * @brief `contract ch(patterns) = body`, a persistent receive
     */
    static ProcessPtr contract(ProcessPtr channel, std::vector<PatternPtr> patterns, ProcessPtr body);

    static ProcessPtr ifThenElse(ProcessPtr condition, ProcessPtr thenBranch, ProcessPtr elseBranch = nullptr);
    static ProcessPtr match(ProcessPtr expression, std::vector<MatchCase> cases);
    static ProcessPtr select(std::vector<SelectBranch> branches);
    static ProcessPtr bundle(BundleMode mode, ProcessPtr body);
    static ProcessPtr let(std::vector<LetBinding> bindings, ProcessPtr body);
    static ProcessPtr matches(ProcessPtr expression, PatternPtr pattern);
    static ProcessPtr binary(BinaryOp op, ProcessPtr left, ProcessPtr right);
    static ProcessPtr unary(UnaryOp op, ProcessPtr operand);
    static ProcessPtr method(ProcessPtr receiver, const std::string &name, std::vector<ProcessPtr> args = {});
    static ProcessPtr collection(CollectionKind kind, std::vector<ProcessPtr> elements,
                                 std::optional<std::string> remainder = std::nullopt);

private:
    static ProcessPtr make(ProcessNode::Variant node);
};

}  // namespace PCE
