#include "runtime/TransitionFunction.h"
#include "common/TypeNames.h"
#include "runtime/Operators.h"
#include "store/PatternMatcher.h"
#include <algorithm>
#include <stdexcept>

namespace PCE {

namespace {

// Hidden binding that carries the acknowledgement channel of a receive-send
constexpr const char *ACK_BINDING = "$ack";

void collectValueChannels(const Value &value, std::vector<ChannelName> &out) {
    if (const auto *name = ValueUtils::asChannel(value)) {
        out.push_back(*name);
    } else if (const auto *elements = ValueUtils::sequenceElements(value)) {
        for (const auto &element : *elements) {
            collectValueChannels(element, out);
        }
    } else if (const auto *map = ValueUtils::asMap(value)) {
        for (const auto &[key, item] : map->entries) {
            collectValueChannels(key, out);
            collectValueChannels(item, out);
        }
    }
}

void collectBodyChannels(const ProcessPtr &process, std::vector<ChannelName> &out);

void collectAll(const std::vector<ProcessPtr> &processes, std::vector<ChannelName> &out) {
    for (const auto &process : processes) {
        collectBodyChannels(process, out);
    }
}

void collectBind(const ReceiveBind &bind, std::vector<ChannelName> &out) {
    collectBodyChannels(bind.channel, out);
    collectAll(bind.inputs, out);
}

// Channel literals written in a process body: `@"name"` and ground name values
void collectBodyChannels(const ProcessPtr &process, std::vector<ChannelName> &out) {
    if (!process) {
        return;
    }
    const ProcessNode &node = *process;

    if (const auto *n = node.as<LiteralNode>()) {
        collectValueChannels(n->value, out);
    } else if (const auto *n = node.as<QuoteNode>()) {
        if (const auto *literal = n->process ? n->process->as<LiteralNode>() : nullptr) {
            out.push_back(ValueUtils::quote(literal->value));
        } else {
            collectBodyChannels(n->process, out);
        }
    } else if (const auto *n = node.as<ParNode>()) {
        collectAll(n->processes, out);
    } else if (const auto *n = node.as<NewNode>()) {
        collectBodyChannels(n->body, out);
    } else if (const auto *n = node.as<SendNode>()) {
        collectBodyChannels(n->channel, out);
        collectAll(n->args, out);
    } else if (const auto *n = node.as<SendSyncNode>()) {
        collectBodyChannels(n->channel, out);
        collectAll(n->args, out);
        collectBodyChannels(n->continuation, out);
    } else if (const auto *n = node.as<ReceiveNode>()) {
        collectBind(n->bind, out);
        collectBodyChannels(n->body, out);
    } else if (const auto *n = node.as<IfNode>()) {
        collectBodyChannels(n->condition, out);
        collectBodyChannels(n->thenBranch, out);
        collectBodyChannels(n->elseBranch, out);
    } else if (const auto *n = node.as<MatchNode>()) {
        collectBodyChannels(n->expression, out);
        for (const auto &matchCase : n->cases) {
            collectBodyChannels(matchCase.body, out);
        }
    } else if (const auto *n = node.as<SelectNode>()) {
        for (const auto &branch : n->branches) {
            collectBind(branch.bind, out);
            collectBodyChannels(branch.body, out);
        }
    } else if (const auto *n = node.as<BundleNode>()) {
        collectBodyChannels(n->body, out);
    } else if (const auto *n = node.as<LetNode>()) {
        for (const auto &binding : n->bindings) {
            collectBodyChannels(binding.value, out);
        }
        collectBodyChannels(n->body, out);
    } else if (const auto *n = node.as<MatchesNode>()) {
        collectBodyChannels(n->expression, out);
    } else if (const auto *n = node.as<BinaryNode>()) {
        collectBodyChannels(n->left, out);
        collectBodyChannels(n->right, out);
    } else if (const auto *n = node.as<UnaryNode>()) {
        collectBodyChannels(n->operand, out);
    } else if (const auto *n = node.as<MethodNode>()) {
        collectBodyChannels(n->receiver, out);
        collectAll(n->args, out);
    } else if (const auto *n = node.as<CollectionNode>()) {
        collectAll(n->elements, out);
    }
}

/**
 * @brief One invocation of the transition function
 *
 * Starts from a copy of the instance data and accumulates the next state and
 * effects; the instance itself is never modified.
 */
class Transition {
public:
    Transition(const FsmInstance &instance, const Event &event) : instance_(instance), event_(event) {
        out_.state = instance.state;
        out_.env = instance.env;
        out_.caps = instance.caps;
        out_.frame = instance.frame;
        out_.value = instance.value;
        out_.failure = instance.failure;
    }

    StepResult run();

private:
    const ProcessNode &node() const {
        return *instance_.node;
    }

    StepResult progressed() {
        return std::move(out_);
    }

    static StepResult notReady(std::string reason) {
        return NotReady{std::move(reason)};
    }

    void moveTo(FsmState state) {
        out_.state = std::move(state);
    }

    // Transient state: continue on the self-addressed CONDITION_MET
    void continueIn(FsmState state) {
        moveTo(std::move(state));
        emit(EnqueueEvent{Event::conditionMet(instance_.id)});
    }

    void emit(Effect effect) {
        out_.effects.push_back(std::move(effect));
    }

    void finish(Value value) {
        moveTo(FsmState::terminated());
        out_.value = std::move(value);
        out_.failure.reset();
    }

    void fail(ErrorInfo info) {
        moveTo(FsmState::terminated());
        out_.value.reset();
        out_.failure = std::move(info);
    }

    void failWith(ErrorKind kind, const std::string &message, const std::string &detail = "") {
        fail(ErrorInfo::make(kind, instance_.id, message, detail));
    }

    EnvironmentPtr scope() const {
        return out_.frame.scopeEnv ? out_.frame.scopeEnv : out_.env;
    }

    ChannelName mintName() {
        return ChannelName(std::to_string(instance_.id) + ":" + std::to_string(out_.frame.minted++), true);
    }

    void spawn(ProcessPtr process, EnvironmentPtr env, ChildRole role, CapabilitiesPtr caps = nullptr) {
        emit(SpawnChild{std::move(process), std::move(env), caps ? std::move(caps) : out_.caps, role});
    }

    void spawnBodyAndJoin(const ProcessPtr &body, EnvironmentPtr env, CapabilitiesPtr caps = nullptr) {
        if (!body) {
            finish(ValueUtils::nil());
            return;
        }
        spawn(body, std::move(env), ChildRole::BODY, std::move(caps));
        moveTo(FsmState::joining());
    }

    bool fromPendingChild() const {
        return event_.sourceChild && instance_.pendingChildren.count(*event_.sourceChild) > 0;
    }

    size_t remainingChildren() const {
        return instance_.pendingChildren.size() - (fromPendingChild() ? 1 : 0);
    }

    StepResult onStart();
    StepResult onOperand();
    StepResult onCondition();
    StepResult onMessage();
    StepResult onPatternMatched();
    StepResult onChildTerminated();
    StepResult onChildError();
    StepResult onCancel();
    StepResult onTimeout();

    size_t operandCount() const;
    ProcessPtr operandAt(size_t index) const;
    void evaluateOperand(size_t index);
    void operandsReady();

    void forkChildren();
    void bindNext();
    void send();
    void branch();
    void matchCase();
    void compute();
    void collect();
    void reference();
    void installBundle();
    void startReceive();
    void startSelect();
    void afterBindings();
    void failFromChild(const ErrorInfo &error);

    bool checkCapability(const ChannelName &channel, bool forSend);
    const ReceiveBind *currentBind() const;

    const FsmInstance &instance_;
    const Event &event_;
    Progressed out_;
};

StepResult Transition::run() {
    if (instance_.state.isTerminal()) {
        return notReady("instance already terminated");
    }
    if (instance_.state.is(StateKind::INITIAL) && !event_.isSignal(SignalKind::START) &&
        !event_.isSignal(SignalKind::CANCEL)) {
        return notReady("instance not started");
    }

    switch (event_.kind) {
    case EventKind::SIGNAL:
        switch (event_.signal) {
        case SignalKind::START:
            if (!instance_.state.is(StateKind::INITIAL)) {
                return notReady("instance already started");
            }
            return onStart();
        case SignalKind::CHILD_TERMINATED:
            return onChildTerminated();
        case SignalKind::CANCEL:
            return onCancel();
        }
        break;
    case EventKind::ERROR:
        return onChildError();
    case EventKind::TIMEOUT:
        return onTimeout();
    case EventKind::EXPRESSION_EVALUATED:
        return onOperand();
    case EventKind::CONDITION_MET:
        return onCondition();
    case EventKind::MESSAGE_AVAILABLE:
        return onMessage();
    case EventKind::PATTERN_MATCHED:
        return onPatternMatched();
    }
    return notReady("unhandled event");
}

StepResult Transition::onStart() {
    if (node().is<NilNode>()) {
        finish(ValueUtils::nil());
    } else if (const auto *n = node().as<LiteralNode>()) {
        finish(n->value);
    } else if (const auto *n = node().as<VarNode>()) {
        continueIn(FsmState::referencing(n->mode));
    } else if (node().is<ParNode>()) {
        continueIn(FsmState::forking());
    } else if (const auto *n = node().as<NewNode>()) {
        if (n->names.empty()) {
            spawnBodyAndJoin(n->body, scope());
        } else {
            continueIn(FsmState::binding(n->names.front()));
        }
    } else if (const auto *n = node().as<BundleNode>()) {
        continueIn(FsmState::bundling(n->mode));
    } else if (const auto *n = node().as<LetNode>(); n && n->bindings.empty()) {
        spawnBodyAndJoin(n->body, scope());
    } else if (operandCount() > 0) {
        evaluateOperand(0);
    } else {
        operandsReady();
    }
    return progressed();
}

size_t Transition::operandCount() const {
    if (const auto *n = node().as<SendNode>()) {
        return 1 + n->args.size();
    }
    if (const auto *n = node().as<SendSyncNode>()) {
        return 1 + n->args.size();
    }
    if (const auto *n = node().as<ReceiveNode>()) {
        return 1 + n->bind.inputs.size();
    }
    if (const auto *n = node().as<SelectNode>()) {
        size_t count = 0;
        for (const auto &branch : n->branches) {
            count += 1 + branch.bind.inputs.size();
        }
        return count;
    }
    if (const auto *n = node().as<LetNode>()) {
        return n->bindings.size();
    }
    if (node().is<BinaryNode>()) {
        return 2;
    }
    if (const auto *n = node().as<MethodNode>()) {
        return 1 + n->args.size();
    }
    if (const auto *n = node().as<CollectionNode>()) {
        return n->elements.size();
    }
    if (node().is<IfNode>() || node().is<MatchNode>() || node().is<MatchesNode>() || node().is<UnaryNode>() ||
        node().is<QuoteNode>()) {
        return 1;
    }
    return 0;
}

ProcessPtr Transition::operandAt(size_t index) const {
    auto pick = [index](const ProcessPtr &head, const std::vector<ProcessPtr> &rest) {
        return index == 0 ? head : rest.at(index - 1);
    };

    if (const auto *n = node().as<SendNode>()) {
        return pick(n->channel, n->args);
    }
    if (const auto *n = node().as<SendSyncNode>()) {
        return pick(n->channel, n->args);
    }
    if (const auto *n = node().as<ReceiveNode>()) {
        return pick(n->bind.channel, n->bind.inputs);
    }
    if (const auto *n = node().as<SelectNode>()) {
        size_t offset = 0;
        for (const auto &branch : n->branches) {
            size_t width = 1 + branch.bind.inputs.size();
            if (index < offset + width) {
                return index == offset ? branch.bind.channel : branch.bind.inputs.at(index - offset - 1);
            }
            offset += width;
        }
    }
    if (const auto *n = node().as<LetNode>()) {
        return n->bindings.at(index).value;
    }
    if (const auto *n = node().as<BinaryNode>()) {
        return index == 0 ? n->left : n->right;
    }
    if (const auto *n = node().as<MethodNode>()) {
        return pick(n->receiver, n->args);
    }
    if (const auto *n = node().as<CollectionNode>()) {
        return n->elements.at(index);
    }
    if (const auto *n = node().as<IfNode>()) {
        return n->condition;
    }
    if (const auto *n = node().as<MatchNode>()) {
        return n->expression;
    }
    if (const auto *n = node().as<MatchesNode>()) {
        return n->expression;
    }
    if (const auto *n = node().as<UnaryNode>()) {
        return n->operand;
    }
    if (const auto *n = node().as<QuoteNode>()) {
        return n->process;
    }
    return nullptr;
}

void Transition::evaluateOperand(size_t index) {
    ProcessPtr operand = operandAt(index);
    if (!operand) {
        failWith(ErrorKind::EVALUATION_FAILURE, "missing operand " + std::to_string(index) + " of " +
                                                    node().constructName());
        return;
    }
    spawn(std::move(operand), scope(), ChildRole::OPERAND);
    moveTo(FsmState::evaluating(index));
}

StepResult Transition::onOperand() {
    if (!fromPendingChild() || !event_.value) {
        return notReady("unexpected operand result");
    }
    emit(ReapChild{*event_.sourceChild});

    size_t index = instance_.state.index();
    out_.frame.operands.push_back(*event_.value);

    // A moved variable leaves the scope that consumed it
    ProcessPtr operand = operandAt(index);
    if (const auto *var = operand ? operand->as<VarNode>() : nullptr; var && var->mode == ReferenceMode::MOVE) {
        if (out_.frame.scopeEnv) {
            out_.frame.scopeEnv = out_.frame.scopeEnv->without(var->name);
        } else {
            out_.env = out_.env->without(var->name);
        }
    }

    if (const auto *n = node().as<LetNode>()) {
        continueIn(FsmState::binding(n->bindings.at(index).pattern->describe()));
        return progressed();
    }

    if (const auto *n = node().as<BinaryNode>(); n && index == 0) {
        auto left = ValueUtils::asBool(*event_.value);
        bool shortCircuit = left && ((n->op == BinaryOp::AND && !*left) || (n->op == BinaryOp::OR && *left));
        if (shortCircuit) {
            continueIn(FsmState::operating(toString(n->op)));
            return progressed();
        }
    }

    if (index + 1 < operandCount()) {
        evaluateOperand(index + 1);
    } else {
        operandsReady();
    }
    return progressed();
}

void Transition::operandsReady() {
    if (node().is<SendNode>() || node().is<SendSyncNode>()) {
        continueIn(FsmState::sending());
    } else if (node().is<ReceiveNode>()) {
        startReceive();
    } else if (node().is<SelectNode>()) {
        startSelect();
    } else if (node().is<IfNode>()) {
        continueIn(FsmState::branching());
    } else if (node().is<MatchNode>() || node().is<MatchesNode>()) {
        continueIn(FsmState::matching(0));
    } else if (const auto *n = node().as<BinaryNode>()) {
        switch (n->op) {
        case BinaryOp::INTERPOLATION:
            continueIn(FsmState::interpolating());
            break;
        case BinaryOp::CONJUNCTION:
            continueIn(FsmState::conjoining());
            break;
        case BinaryOp::DISJUNCTION:
            continueIn(FsmState::disjoining());
            break;
        default:
            continueIn(FsmState::operating(toString(n->op)));
        }
    } else if (const auto *n = node().as<UnaryNode>()) {
        continueIn(n->op == UnaryOp::NEGATION ? FsmState::negating() : FsmState::operating(toString(n->op)));
    } else if (const auto *n = node().as<MethodNode>()) {
        continueIn(FsmState::operating(n->name));
    } else if (const auto *n = node().as<CollectionNode>()) {
        continueIn(FsmState::collecting(n->kind));
    } else if (node().is<QuoteNode>()) {
        continueIn(FsmState::constructing("name"));
    } else {
        finish(ValueUtils::nil());
    }
}

StepResult Transition::onCondition() {
    switch (instance_.state.kind()) {
    case StateKind::FORKING:
        forkChildren();
        break;
    case StateKind::BINDING:
        bindNext();
        break;
    case StateKind::SENDING:
        send();
        break;
    case StateKind::BRANCHING:
        branch();
        break;
    case StateKind::MATCHING:
        matchCase();
        break;
    case StateKind::OPERATING:
    case StateKind::INTERPOLATING:
    case StateKind::CONJOINING:
    case StateKind::DISJOINING:
    case StateKind::NEGATING:
        compute();
        break;
    case StateKind::COLLECTING:
        collect();
        break;
    case StateKind::CONSTRUCTING:
        finish(ValueUtils::fromChannel(ValueUtils::quote(out_.frame.operands.at(0))));
        break;
    case StateKind::REFERENCING:
        reference();
        break;
    case StateKind::BUNDLING:
        installBundle();
        break;
    default:
        return notReady("no pending condition in " + instance_.state.describe());
    }
    return progressed();
}

void Transition::forkChildren() {
    const auto &processes = node().as<ParNode>()->processes;
    if (processes.empty()) {
        finish(ValueUtils::nil());
        return;
    }
    for (const auto &process : processes) {
        spawn(process, scope(), ChildRole::BODY);
    }
    moveTo(FsmState::joining());
}

void Transition::bindNext() {
    Frame &frame = out_.frame;

    if (const auto *n = node().as<NewNode>()) {
        frame.scopeEnv = scope()->with(n->names.at(frame.cursor), ValueUtils::fromChannel(mintName()));
        frame.cursor++;
        if (frame.cursor < n->names.size()) {
            continueIn(FsmState::binding(n->names[frame.cursor]));
        } else {
            spawnBodyAndJoin(n->body, scope());
        }
        return;
    }

    if (const auto *n = node().as<LetNode>()) {
        const LetBinding &binding = n->bindings.at(frame.cursor);
        const Value &value = frame.operands.at(frame.cursor);
        auto bindings = PatternMatcher::match(*binding.pattern, value, *scope());
        if (!bindings) {
            failWith(ErrorKind::PATTERN_EXHAUSTED, "let pattern did not match",
                     "value=" + ValueUtils::toString(value) + " pattern=" + binding.pattern->describe());
            return;
        }
        frame.scopeEnv = scope()->withAll(*bindings);
        frame.cursor++;
        if (frame.cursor < n->bindings.size()) {
            evaluateOperand(frame.cursor);
        } else {
            spawnBodyAndJoin(n->body, scope());
        }
        return;
    }

    // Message bindings of a receive or select arm, one name per step
    const auto &[name, value] = frame.pendingBindings.at(frame.bindingCursor);
    frame.scopeEnv = scope()->with(name, value);
    frame.bindingCursor++;
    if (frame.bindingCursor < frame.pendingBindings.size()) {
        continueIn(FsmState::binding(frame.pendingBindings[frame.bindingCursor].first));
    } else {
        afterBindings();
    }
}

bool Transition::checkCapability(const ChannelName &channel, bool forSend) {
    auto it = out_.caps->find(channel.key());
    if (it == out_.caps->end()) {
        return true;
    }
    bool allowed = forSend ? TransitionFunction::allowsSend(it->second) : TransitionFunction::allowsReceive(it->second);
    if (!allowed) {
        failWith(ErrorKind::CAPABILITY_VIOLATION,
                 std::string(forSend ? "send on " : "receive on ") + channel.key() + " forbidden by bundle",
                 std::string("mode=") + toString(it->second) + " operation=" + (forSend ? "publish" : "request"));
    }
    return allowed;
}

void Transition::send() {
    const auto &operands = out_.frame.operands;
    const ChannelName *channel = ValueUtils::asChannel(operands.at(0));
    if (!channel) {
        failWith(ErrorKind::EVALUATION_FAILURE, "cannot send on a non-name value", ValueUtils::toString(operands[0]));
        return;
    }
    if (!checkCapability(*channel, true)) {
        return;
    }

    Payload payload(operands.begin() + 1, operands.end());
    if (const auto *n = node().as<SendNode>()) {
        emit(Publish{*channel, std::move(payload), n->persistent ? Persistence::PERSISTENT : Persistence::ONCE});
        finish(ValueUtils::nil());
        return;
    }

    // Synchronous send: the receiver acknowledges on a fresh channel
    ChannelName ack = mintName();
    payload.push_back(ValueUtils::fromChannel(ack));
    emit(Publish{*channel, std::move(payload), Persistence::ONCE});
    emit(Request{ack, {Pattern::wildcard()}, ReceiveMode::ONE_SHOT, scope()});
    out_.frame.ackChannel = ack;
    moveTo(FsmState::waiting());
}

void Transition::branch() {
    const auto *n = node().as<IfNode>();
    const Value &condition = out_.frame.operands.at(0);
    auto chosen = ValueUtils::asBool(condition);
    if (!chosen) {
        failWith(ErrorKind::EVALUATION_FAILURE, "if condition is not a Bool", ValueUtils::toString(condition));
        return;
    }
    spawnBodyAndJoin(*chosen ? n->thenBranch : n->elseBranch, scope());
}

void Transition::matchCase() {
    const Value &value = out_.frame.operands.at(0);

    if (const auto *n = node().as<MatchesNode>()) {
        bool matched = PatternMatcher::match(*n->pattern, value, *scope()).has_value();
        finish(ValueUtils::fromBool(matched));
        return;
    }

    const auto *n = node().as<MatchNode>();
    size_t index = instance_.state.index();
    if (index >= n->cases.size()) {
        std::vector<PatternPtr> attempted;
        for (const auto &matchCase : n->cases) {
            attempted.push_back(matchCase.pattern);
        }
        failWith(ErrorKind::PATTERN_EXHAUSTED, "no match case accepted the value",
                 "value=" + ValueUtils::toString(value) + " patterns=" + describePatterns(attempted));
        return;
    }

    auto bindings = PatternMatcher::match(*n->cases[index].pattern, value, *scope());
    if (bindings) {
        emit(EnqueueEvent{Event::patternMatched(instance_.id, std::move(*bindings))});
    } else {
        continueIn(FsmState::matching(index + 1));
    }
}

StepResult Transition::onPatternMatched() {
    const auto *n = node().as<MatchNode>();
    if (!n || !instance_.state.is(StateKind::MATCHING)) {
        return notReady("no match case pending");
    }
    spawnBodyAndJoin(n->cases.at(instance_.state.index()).body, scope()->withAll(event_.bindings));
    return progressed();
}

void Transition::compute() {
    const auto &operands = out_.frame.operands;
    OperationResult result;

    if (const auto *n = node().as<BinaryNode>()) {
        if (operands.size() == 1) {
            // Short-circuited and/or: the left operand decided
            finish(operands[0]);
            return;
        }
        result = Operators::applyBinary(n->op, operands.at(0), operands.at(1));
    } else if (const auto *n = node().as<UnaryNode>()) {
        result = Operators::applyUnary(n->op, operands.at(0));
    } else if (const auto *n = node().as<MethodNode>()) {
        result = Operators::applyMethod(n->name, operands.at(0), std::vector<Value>(operands.begin() + 1, operands.end()));
    } else {
        result = OperationResult::error("no operation for " + node().constructName());
    }

    if (result.isSuccess) {
        finish(std::move(result.value));
    } else {
        failWith(ErrorKind::EVALUATION_FAILURE, result.errorMessage, instance_.state.describe());
    }
}

void Transition::collect() {
    const auto *n = node().as<CollectionNode>();
    std::vector<Value> elements = out_.frame.operands;

    std::optional<Value> rest;
    if (n->remainder) {
        rest = scope()->lookup(*n->remainder);
        if (!rest) {
            failWith(ErrorKind::EVALUATION_FAILURE, "unbound variable " + *n->remainder);
            return;
        }
    }

    auto wrongRemainder = [this, &rest](const char *expected) {
        failWith(ErrorKind::EVALUATION_FAILURE,
                 std::string("collection remainder must be a ") + expected + ", got " + ValueUtils::typeName(*rest));
    };

    switch (n->kind) {
    case CollectionKind::LIST:
        if (rest) {
            if (!std::holds_alternative<std::shared_ptr<const ValueList>>(*rest)) {
                wrongRemainder("List");
                return;
            }
            const auto &tail = *ValueUtils::sequenceElements(*rest);
            elements.insert(elements.end(), tail.begin(), tail.end());
        }
        finish(ValueUtils::makeList(std::move(elements)));
        break;
    case CollectionKind::TUPLE:
        if (rest) {
            wrongRemainder("nothing (tuples take no remainder)");
            return;
        }
        finish(ValueUtils::makeTuple(std::move(elements)));
        break;
    case CollectionKind::SET:
        if (rest) {
            if (!std::holds_alternative<std::shared_ptr<const ValueSet>>(*rest)) {
                wrongRemainder("Set");
                return;
            }
            const auto &more = *ValueUtils::sequenceElements(*rest);
            elements.insert(elements.end(), more.begin(), more.end());
        }
        finish(ValueUtils::makeSet(std::move(elements)));
        break;
    case CollectionKind::MAP: {
        std::vector<std::pair<Value, Value>> entries;
        if (rest) {
            const ValueMap *map = ValueUtils::asMap(*rest);
            if (!map) {
                wrongRemainder("Map");
                return;
            }
            entries = map->entries;
        }
        // Literal entries follow the remainder so they win on duplicate keys
        for (size_t i = 0; i + 1 < elements.size(); i += 2) {
            entries.emplace_back(elements[i], elements[i + 1]);
        }
        finish(ValueUtils::makeMap(std::move(entries)));
        break;
    }
    }
}

void Transition::reference() {
    const auto *n = node().as<VarNode>();
    auto value = scope()->lookup(n->name);
    if (!value) {
        failWith(ErrorKind::EVALUATION_FAILURE, "unbound variable " + n->name);
        return;
    }
    if (n->mode == ReferenceMode::MOVE) {
        out_.env = out_.env->without(n->name);
        out_.frame.scopeEnv = out_.env;
    }
    finish(std::move(*value));
}

void Transition::installBundle() {
    const auto *n = node().as<BundleNode>();

    std::vector<ChannelName> channels;
    for (const auto &[name, value] : scope()->bindings()) {
        collectValueChannels(value, channels);
    }
    collectBodyChannels(n->body, channels);

    auto caps = std::make_shared<CapabilityMap>(*out_.caps);
    for (const auto &channel : channels) {
        auto [it, inserted] = caps->try_emplace(channel.key(), n->mode);
        if (!inserted) {
            it->second = TransitionFunction::intersect(it->second, n->mode);
        }
    }
    spawnBodyAndJoin(n->body, scope(), std::move(caps));
}

const ReceiveBind *Transition::currentBind() const {
    if (const auto *n = node().as<ReceiveNode>()) {
        return &n->bind;
    }
    if (const auto *n = node().as<SelectNode>()) {
        return &n->branches.at(out_.frame.armIndex).bind;
    }
    return nullptr;
}

void Transition::startReceive() {
    const auto *n = node().as<ReceiveNode>();
    const auto &operands = out_.frame.operands;
    const ChannelName *channel = ValueUtils::asChannel(operands.at(0));
    if (!channel) {
        failWith(ErrorKind::EVALUATION_FAILURE, "cannot receive on a non-name value", ValueUtils::toString(operands[0]));
        return;
    }

    std::vector<PatternPtr> patterns = n->bind.patterns;
    switch (n->bind.source) {
    case ReceiveSource::SIMPLE:
        if (!checkCapability(*channel, false)) {
            return;
        }
        emit(Request{*channel, std::move(patterns), n->mode, scope()});
        break;
    case ReceiveSource::RECEIVE_SEND:
        if (!checkCapability(*channel, false)) {
            return;
        }
        patterns.push_back(Pattern::bind(ACK_BINDING));
        emit(Request{*channel, std::move(patterns), n->mode, scope()});
        break;
    case ReceiveSource::SEND_RECEIVE: {
        if (!checkCapability(*channel, true)) {
            return;
        }
        ChannelName reply = mintName();
        Payload payload(operands.begin() + 1, operands.end());
        payload.push_back(ValueUtils::fromChannel(reply));
        emit(Publish{*channel, std::move(payload), Persistence::ONCE});
        emit(Request{reply, std::move(patterns), n->mode, scope()});
        break;
    }
    }
    moveTo(FsmState::receiving(n->mode));
}

void Transition::startSelect() {
    const auto *n = node().as<SelectNode>();
    const auto &operands = out_.frame.operands;

    // Validate every arm before registering any of them
    size_t offset = 0;
    for (const auto &branch : n->branches) {
        const ChannelName *channel = ValueUtils::asChannel(operands.at(offset));
        if (!channel) {
            failWith(ErrorKind::EVALUATION_FAILURE, "cannot select on a non-name value",
                     ValueUtils::toString(operands[offset]));
            return;
        }
        if (!checkCapability(*channel, branch.bind.source == ReceiveSource::SEND_RECEIVE)) {
            return;
        }
        offset += 1 + branch.bind.inputs.size();
    }

    std::vector<SelectArm> arms;
    offset = 0;
    for (const auto &branch : n->branches) {
        ChannelName channel = *ValueUtils::asChannel(operands[offset]);
        std::vector<PatternPtr> patterns = branch.bind.patterns;

        if (branch.bind.source == ReceiveSource::RECEIVE_SEND) {
            patterns.push_back(Pattern::bind(ACK_BINDING));
        } else if (branch.bind.source == ReceiveSource::SEND_RECEIVE) {
            ChannelName reply = mintName();
            auto first = operands.begin() + static_cast<std::ptrdiff_t>(offset + 1);
            Payload payload(first, first + static_cast<std::ptrdiff_t>(branch.bind.inputs.size()));
            payload.push_back(ValueUtils::fromChannel(reply));
            emit(Publish{channel, std::move(payload), Persistence::ONCE});
            channel = reply;
        }
        arms.push_back(SelectArm{std::move(channel), std::move(patterns)});
        offset += 1 + branch.bind.inputs.size();
    }

    if (arms.empty()) {
        finish(ValueUtils::nil());
        return;
    }
    emit(SelectRequest{std::move(arms), scope()});
    moveTo(FsmState::receiving(ReceiveMode::RACE));
}

StepResult Transition::onMessage() {
    if (instance_.state.is(StateKind::WAITING)) {
        const auto *n = node().as<SendSyncNode>();
        out_.frame.ackChannel.reset();
        spawnBodyAndJoin(n->continuation, scope());
        return progressed();
    }
    if (!instance_.state.is(StateKind::RECEIVING)) {
        return notReady("not receiving (" + instance_.state.describe() + ")");
    }

    Frame &frame = out_.frame;
    frame.armIndex = event_.armIndex;
    const ReceiveBind *bind = currentBind();
    if (!bind) {
        return notReady("no receive pending");
    }

    // Requests published by losing send-receive arms are withdrawn with the race
    if (const auto *select = node().as<SelectNode>()) {
        bool publishedRequests = std::any_of(select->branches.begin(), select->branches.end(), [](const auto &branch) {
            return branch.bind.source == ReceiveSource::SEND_RECEIVE;
        });
        if (publishedRequests) {
            emit(RetractOwned{});
        }
    }

    BindingList bindings = event_.bindings;
    if (bind->source == ReceiveSource::RECEIVE_SEND) {
        auto ack = std::find_if(bindings.begin(), bindings.end(),
                                [](const auto &binding) { return binding.first == ACK_BINDING; });
        const ChannelName *ackChannel = ack != bindings.end() ? ValueUtils::asChannel(ack->second) : nullptr;
        if (!ackChannel) {
            failWith(ErrorKind::EVALUATION_FAILURE, "receive-send message carries no acknowledgement channel",
                     ValueUtils::payloadToString(event_.payload));
            return progressed();
        }
        frame.ackChannel = *ackChannel;
        bindings.erase(ack);
    }

    // A replicated receiver binds every message into a fresh copy of its own scope
    if (instance_.state.receiveMode() == ReceiveMode::PERSISTENT) {
        frame.scopeEnv = out_.env;
    }
    frame.pendingBindings = std::move(bindings);
    frame.bindingCursor = 0;

    if (frame.pendingBindings.empty()) {
        afterBindings();
    } else {
        continueIn(FsmState::binding(frame.pendingBindings.front().first));
    }
    return progressed();
}

void Transition::afterBindings() {
    Frame &frame = out_.frame;
    if (frame.ackChannel) {
        emit(Publish{*frame.ackChannel, {ValueUtils::nil()}, Persistence::ONCE});
        frame.ackChannel.reset();
    }
    frame.pendingBindings.clear();
    frame.bindingCursor = 0;

    if (const auto *n = node().as<ReceiveNode>(); n && n->mode == ReceiveMode::PERSISTENT) {
        if (n->body) {
            spawn(n->body, scope(), ChildRole::BODY);
        }
        moveTo(FsmState::receiving(ReceiveMode::PERSISTENT));
        emit(RetryReceives{});
        return;
    }

    const ProcessPtr &body = node().is<ReceiveNode>() ? node().as<ReceiveNode>()->body
                                                      : node().as<SelectNode>()->branches.at(frame.armIndex).body;
    spawnBodyAndJoin(body, scope());
}

StepResult Transition::onChildTerminated() {
    if (!fromPendingChild()) {
        return notReady("termination of an unknown child");
    }
    emit(ReapChild{*event_.sourceChild});

    if (instance_.state.is(StateKind::JOINING)) {
        if (!node().is<ParNode>() && event_.value) {
            out_.frame.result = *event_.value;
        }
        if (remainingChildren() == 0) {
            finish(out_.frame.result);
        }
    }
    return progressed();
}

StepResult Transition::onChildError() {
    if (!fromPendingChild() || !event_.error) {
        return notReady("error from an unknown child");
    }
    emit(ReapChild{*event_.sourceChild});

    // A replicated receiver outlives the failure of one body invocation
    const auto *n = node().as<ReceiveNode>();
    bool listening = instance_.state.is(StateKind::RECEIVING) || instance_.state.is(StateKind::BINDING);
    if (n && n->mode == ReceiveMode::PERSISTENT && listening) {
        return progressed();
    }

    // Remaining children are cancelled when this instance terminates
    failFromChild(*event_.error);
    return progressed();
}

void Transition::failFromChild(const ErrorInfo &error) {
    size_t cancelled = remainingChildren();
    ErrorInfo info = ErrorInfo::make(ErrorKind::CHILD_FAILED, instance_.id,
                                     "child #" + std::to_string(error.instance) + " failed",
                                     cancelled ? std::to_string(cancelled) + " sibling(s) cancelled" : "");
    info.cause = std::make_shared<ErrorInfo>(error);
    fail(std::move(info));
}

StepResult Transition::onCancel() {
    emit(RetractOwned{});
    failWith(ErrorKind::CANCELLED, "cancelled", instance_.state.describe());
    return progressed();
}

StepResult Transition::onTimeout() {
    if (instance_.state.is(StateKind::WAITING)) {
        emit(RetractReceives{});
        failWith(ErrorKind::TIMEOUT, "synchronous send timed out waiting for acknowledgement",
                 out_.frame.ackChannel ? out_.frame.ackChannel->key() : std::string());
    }
    // Outside WAITING a timeout has nothing to interrupt and is dropped
    return progressed();
}

}  // namespace

StepResult TransitionFunction::step(const FsmInstance &instance, const Event &event) {
    if (!instance.node) {
        throw std::invalid_argument("TransitionFunction: instance #" + std::to_string(instance.id) + " has no process");
    }
    return Transition(instance, event).run();
}

BundleMode TransitionFunction::intersect(BundleMode outer, BundleMode inner) {
    bool send = allowsSend(outer) && allowsSend(inner);
    bool receive = allowsReceive(outer) && allowsReceive(inner);
    if (send && receive) {
        return BundleMode::RW;
    }
    if (send) {
        return BundleMode::WRITE;
    }
    return receive ? BundleMode::READ : BundleMode::EQUIV;
}

}  // namespace PCE
