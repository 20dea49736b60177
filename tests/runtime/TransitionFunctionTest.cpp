#include "model/ProcessFactory.h"
#include "runtime/TransitionFunction.h"
#include <gtest/gtest.h>

namespace PCE {

/**
 * @brief Drives the transition function directly, without a scheduler
 */
class TransitionFunctionTest : public ::testing::Test {
protected:
    FsmInstance &make(ProcessPtr process, CapabilitiesPtr caps = nullptr) {
        InstanceId id = table_.create(std::move(process), nullptr, std::move(caps), std::nullopt, ChildRole::BODY);
        return table_.get(id);
    }

    static const Progressed &progressed(const StepResult &result) {
        EXPECT_TRUE(std::holds_alternative<Progressed>(result));
        return std::get<Progressed>(result);
    }

    template <typename T> static size_t countEffects(const Progressed &out) {
        size_t count = 0;
        for (const auto &effect : out.effects) {
            count += std::holds_alternative<T>(effect) ? 1 : 0;
        }
        return count;
    }

    static void apply(FsmInstance &instance, const Progressed &out) {
        instance.state = out.state;
        instance.env = out.env;
        instance.caps = out.caps;
        instance.frame = out.frame;
        instance.value = out.value;
        instance.failure = out.failure;
    }

    InstanceTable table_;
};

TEST_F(TransitionFunctionTest, NilTerminatesOnStart) {
    FsmInstance &instance = make(ProcessFactory::nil());
    StepResult result = TransitionFunction::step(instance, Event::start(instance.id));
    const auto &out = progressed(result);

    EXPECT_TRUE(out.state.is(StateKind::TERMINATED));
    ASSERT_TRUE(out.value.has_value());
    EXPECT_EQ(ValueUtils::toString(*out.value), "Nil");
    EXPECT_TRUE(out.effects.empty());
}

TEST_F(TransitionFunctionTest, StepDoesNotModifyInstance) {
    FsmInstance &instance = make(ProcessFactory::integer(3));
    auto result = TransitionFunction::step(instance, Event::start(instance.id));

    EXPECT_TRUE(instance.state.is(StateKind::INITIAL));
    EXPECT_FALSE(instance.value.has_value());
    EXPECT_EQ(ValueUtils::toString(*progressed(result).value), "3");
}

TEST_F(TransitionFunctionTest, SendStartsByEvaluatingChannelOperand) {
    FsmInstance &instance = make(ProcessFactory::send(ProcessFactory::channel("out"), {ProcessFactory::integer(1)}));
    StepResult result = TransitionFunction::step(instance, Event::start(instance.id));
    const auto &out = progressed(result);

    EXPECT_TRUE(out.state.is(StateKind::EVALUATING));
    EXPECT_EQ(out.state.index(), 0u);
    ASSERT_EQ(countEffects<SpawnChild>(out), 1u);
    EXPECT_EQ(std::get<SpawnChild>(out.effects.front()).role, ChildRole::OPERAND);
}

TEST_F(TransitionFunctionTest, EventsBeforeStartAreNotReady) {
    FsmInstance &instance = make(ProcessFactory::nil());
    auto result = TransitionFunction::step(instance, Event::conditionMet(instance.id));
    ASSERT_TRUE(std::holds_alternative<NotReady>(result));
    EXPECT_EQ(std::get<NotReady>(result).reason, "instance not started");
}

TEST_F(TransitionFunctionTest, TerminatedIsAbsorbing) {
    FsmInstance &instance = make(ProcessFactory::nil());
    apply(instance, progressed(TransitionFunction::step(instance, Event::start(instance.id))));

    for (const Event &event : {Event::start(instance.id), Event::cancel(instance.id), Event::timeout(instance.id),
                               Event::conditionMet(instance.id)}) {
        EXPECT_TRUE(std::holds_alternative<NotReady>(TransitionFunction::step(instance, event))) << event.describe();
    }
}

TEST_F(TransitionFunctionTest, OperandFromUnknownChildIsNotReady) {
    FsmInstance &instance = make(ProcessFactory::unary(UnaryOp::NEG, ProcessFactory::integer(1)));
    apply(instance, progressed(TransitionFunction::step(instance, Event::start(instance.id))));

    auto result = TransitionFunction::step(instance, Event::expressionEvaluated(instance.id, 999, ValueUtils::fromInt(1)));
    EXPECT_TRUE(std::holds_alternative<NotReady>(result));
}

TEST_F(TransitionFunctionTest, AndShortCircuitsOnFalseLeftOperand) {
    FsmInstance &instance = make(
        ProcessFactory::binary(BinaryOp::AND, ProcessFactory::boolean(false), ProcessFactory::var("unbound")));
    apply(instance, progressed(TransitionFunction::step(instance, Event::start(instance.id))));
    instance.pendingChildren.insert(42);

    StepResult leftResult =
        TransitionFunction::step(instance, Event::expressionEvaluated(instance.id, 42, ValueUtils::fromBool(false)));
    const auto &afterLeft = progressed(leftResult);
    EXPECT_TRUE(afterLeft.state.is(StateKind::OPERATING));
    EXPECT_EQ(countEffects<SpawnChild>(afterLeft), 0u);
    EXPECT_EQ(countEffects<ReapChild>(afterLeft), 1u);

    apply(instance, afterLeft);
    instance.pendingChildren.clear();
    StepResult doneResult = TransitionFunction::step(instance, Event::conditionMet(instance.id));
    const auto &done = progressed(doneResult);
    ASSERT_TRUE(done.value.has_value());
    EXPECT_EQ(ValueUtils::toString(*done.value), "false");
}

TEST_F(TransitionFunctionTest, SendForbiddenByBundleFails) {
    auto caps = std::make_shared<CapabilityMap>();
    (*caps)[ChannelName("\"out\"").key()] = BundleMode::READ;
    FsmInstance &instance =
        make(ProcessFactory::send(ProcessFactory::channel("out"), {}), std::shared_ptr<const CapabilityMap>(caps));

    instance.state = FsmState::sending();
    instance.frame.operands = {ValueUtils::fromChannel(ValueUtils::quote(ValueUtils::fromString("out")))};

    StepResult result = TransitionFunction::step(instance, Event::conditionMet(instance.id));
    const auto &out = progressed(result);
    ASSERT_TRUE(out.failure.has_value());
    EXPECT_EQ(out.failure->kind, ErrorKind::CAPABILITY_VIOLATION);
    EXPECT_EQ(out.failure->detail, "mode=READ operation=publish");
    EXPECT_EQ(countEffects<Publish>(out), 0u);
}

TEST_F(TransitionFunctionTest, CancelRetractsAndFails) {
    FsmInstance &instance = make(ProcessFactory::nil());
    StepResult result = TransitionFunction::step(instance, Event::cancel(instance.id));
    const auto &out = progressed(result);
    ASSERT_TRUE(out.failure.has_value());
    EXPECT_EQ(out.failure->kind, ErrorKind::CANCELLED);
    EXPECT_EQ(countEffects<RetractOwned>(out), 1u);
}

TEST_F(TransitionFunctionTest, IdenticalInputsGiveIdenticalOutputs) {
    FsmInstance &instance = make(ProcessFactory::newNames({"a", "b"}, ProcessFactory::nil()));
    apply(instance, progressed(TransitionFunction::step(instance, Event::start(instance.id))));

    auto first = progressed(TransitionFunction::step(instance, Event::conditionMet(instance.id)));
    auto second = progressed(TransitionFunction::step(instance, Event::conditionMet(instance.id)));

    EXPECT_EQ(first.state, second.state);
    EXPECT_EQ(first.frame.minted, second.frame.minted);
    ASSERT_TRUE(first.frame.scopeEnv && second.frame.scopeEnv);
    EXPECT_TRUE(ValueUtils::equals(*first.frame.scopeEnv->lookup("a"), *second.frame.scopeEnv->lookup("a")));
}

TEST_F(TransitionFunctionTest, NullNodeIsRejected) {
    FsmInstance instance;
    EXPECT_THROW(TransitionFunction::step(instance, Event::start(0)), std::invalid_argument);
}

TEST_F(TransitionFunctionTest, BundleIntersection) {
    EXPECT_EQ(TransitionFunction::intersect(BundleMode::RW, BundleMode::READ), BundleMode::READ);
    EXPECT_EQ(TransitionFunction::intersect(BundleMode::WRITE, BundleMode::READ), BundleMode::EQUIV);
    EXPECT_EQ(TransitionFunction::intersect(BundleMode::WRITE, BundleMode::RW), BundleMode::WRITE);
    EXPECT_EQ(TransitionFunction::intersect(BundleMode::RW, BundleMode::RW), BundleMode::RW);
}

}  // namespace PCE
