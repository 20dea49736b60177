#include "model/ProcessFactory.h"
#include <stdexcept>

namespace PCE {

ProcessPtr ProcessFactory::make(ProcessNode::Variant node) {
    auto process = std::make_shared<ProcessNode>();
    process->node = std::move(node);
    return process;
}

ProcessPtr ProcessFactory::nil() {
    static const ProcessPtr instance = make(NilNode{});
    return instance;
}

ProcessPtr ProcessFactory::literal(const Value &value) {
    return make(LiteralNode{value});
}

ProcessPtr ProcessFactory::integer(int64_t value) {
    return literal(ValueUtils::fromInt(value));
}

ProcessPtr ProcessFactory::boolean(bool value) {
    return literal(ValueUtils::fromBool(value));
}

ProcessPtr ProcessFactory::string(const std::string &value) {
    return literal(ValueUtils::fromString(value));
}

ProcessPtr ProcessFactory::var(const std::string &name, ReferenceMode mode) {
    return make(VarNode{name, mode});
}

ProcessPtr ProcessFactory::quote(ProcessPtr process) {
    return make(QuoteNode{std::move(process)});
}

ProcessPtr ProcessFactory::channel(const std::string &name) {
    return quote(string(name));
}

ProcessPtr ProcessFactory::par(std::vector<ProcessPtr> processes) {
    return make(ParNode{std::move(processes)});
}

ProcessPtr ProcessFactory::newNames(std::vector<std::string> names, ProcessPtr body) {
    return make(NewNode{std::move(names), std::move(body)});
}

ProcessPtr ProcessFactory::send(ProcessPtr channel, std::vector<ProcessPtr> args, bool persistent) {
    return make(SendNode{std::move(channel), std::move(args), persistent});
}

ProcessPtr ProcessFactory::sendSync(ProcessPtr channel, std::vector<ProcessPtr> args, ProcessPtr continuation) {
    return make(SendSyncNode{std::move(channel), std::move(args), std::move(continuation)});
}

ReceiveBind ProcessFactory::bind(std::vector<PatternPtr> patterns, ProcessPtr channel, ReceiveSource source,
                                 std::vector<ProcessPtr> inputs) {
    return ReceiveBind{std::move(patterns), std::move(channel), source, std::move(inputs)};
}

ProcessPtr ProcessFactory::receive(ReceiveBind bind, ProcessPtr body, ReceiveMode mode) {
    if (mode == ReceiveMode::RACE) {
        throw std::invalid_argument("ProcessFactory: race receives are built with select()");
    }
    return make(ReceiveNode{std::move(bind), mode, std::move(body)});
}

ProcessPtr ProcessFactory::receiveAll(std::vector<ReceiveBind> binds, ProcessPtr body, ReceiveMode mode) {
    if (binds.empty()) {
        throw std::invalid_argument("ProcessFactory: receive needs at least one bind");
    }
    // Innermost receipt first; only the outermost keeps the requested mode
    ProcessPtr current = std::move(body);
    for (size_t i = binds.size(); i-- > 1;) {
        current = receive(std::move(binds[i]), current, mode == ReceiveMode::PEEK ? mode : ReceiveMode::ONE_SHOT);
    }
    return receive(std::move(binds[0]), current, mode);
}

ProcessPtr ProcessFactory::contract(ProcessPtr channel, std::vector<PatternPtr> patterns, ProcessPtr body) {
    return receive(bind(std::move(patterns), std::move(channel)), std::move(body), ReceiveMode::PERSISTENT);
}

ProcessPtr ProcessFactory::ifThenElse(ProcessPtr condition, ProcessPtr thenBranch, ProcessPtr elseBranch) {
    return make(IfNode{std::move(condition), std::move(thenBranch), std::move(elseBranch)});
}

ProcessPtr ProcessFactory::match(ProcessPtr expression, std::vector<MatchCase> cases) {
    return make(MatchNode{std::move(expression), std::move(cases)});
}

ProcessPtr ProcessFactory::select(std::vector<SelectBranch> branches) {
    return make(SelectNode{std::move(branches)});
}

ProcessPtr ProcessFactory::bundle(BundleMode mode, ProcessPtr body) {
    return make(BundleNode{mode, std::move(body)});
}

ProcessPtr ProcessFactory::let(std::vector<LetBinding> bindings, ProcessPtr body) {
    return make(LetNode{std::move(bindings), std::move(body)});
}

ProcessPtr ProcessFactory::matches(ProcessPtr expression, PatternPtr pattern) {
    return make(MatchesNode{std::move(expression), std::move(pattern)});
}

ProcessPtr ProcessFactory::binary(BinaryOp op, ProcessPtr left, ProcessPtr right) {
    return make(BinaryNode{op, std::move(left), std::move(right)});
}

ProcessPtr ProcessFactory::unary(UnaryOp op, ProcessPtr operand) {
    return make(UnaryNode{op, std::move(operand)});
}

ProcessPtr ProcessFactory::method(ProcessPtr receiver, const std::string &name, std::vector<ProcessPtr> args) {
    return make(MethodNode{std::move(receiver), name, std::move(args)});
}

ProcessPtr ProcessFactory::collection(CollectionKind kind, std::vector<ProcessPtr> elements,
                                      std::optional<std::string> remainder) {
    if (kind == CollectionKind::MAP && elements.size() % 2 != 0) {
        throw std::invalid_argument("ProcessFactory: map literal needs key/value pairs");
    }
    return make(CollectionNode{kind, std::move(elements), std::move(remainder)});
}

}  // namespace PCE
