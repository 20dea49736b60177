#include "common/TestUtils.h"
#include "runtime/Scheduler.h"
#include <gtest/gtest.h>

namespace PCE {

using namespace Test::Utils;

class SchedulerTest : public ::testing::Test {
protected:
    size_t runToIdle(size_t limit = 10000) {
        size_t steps = 0;
        while (steps < limit && scheduler_.step()) {
            ++steps;
        }
        return steps;
    }

    InstanceTable instances_;
    ChannelStore store_;
    Scheduler scheduler_{instances_, store_};
};

TEST_F(SchedulerTest, ParallelSendsCompleteTheRoot) {
    scheduler_.spawnRoot(ProcessFactory::par({sendOn("out", {ProcessFactory::integer(1)}),
                                              sendOn("out", {ProcessFactory::integer(2)})}));
    runToIdle();

    EXPECT_EQ(scheduler_.status(true), RunStatus::COMPLETED);
    EXPECT_EQ(store_.pendingSendCount(ValueUtils::quote(str("out"))), 2u);
    EXPECT_TRUE(scheduler_.errors().empty());
    EXPECT_GT(scheduler_.stepCount(), 0u);
}

TEST_F(SchedulerTest, SecondRootIsRejected) {
    scheduler_.spawnRoot(ProcessFactory::nil());
    EXPECT_THROW(scheduler_.spawnRoot(ProcessFactory::nil()), std::runtime_error);
}

TEST_F(SchedulerTest, NullRootIsRejected) {
    EXPECT_THROW(scheduler_.spawnRoot(nullptr), std::invalid_argument);
}

TEST_F(SchedulerTest, JoinWaitsForEveryChild) {
    // One branch blocks on a receive, so the parallel parent must stay joined
    InstanceId root = scheduler_.spawnRoot(ProcessFactory::par(
        {sendOn("out", {ProcessFactory::integer(1)}), receiveOn("in", {Pattern::bind("x")}, ProcessFactory::nil())}));
    runToIdle();

    const FsmInstance *parent = instances_.find(root);
    ASSERT_NE(parent, nullptr);
    EXPECT_TRUE(parent->state.is(StateKind::JOINING));
    EXPECT_EQ(parent->pendingChildren.size(), 1u);
    EXPECT_EQ(scheduler_.status(true), RunStatus::DEADLOCKED);

    scheduler_.publishExternal(ValueUtils::quote(str("in")), {num(5)}, Persistence::ONCE);
    runToIdle();
    EXPECT_EQ(scheduler_.status(true), RunStatus::COMPLETED);
}

TEST_F(SchedulerTest, BlockedInstancesExplainWhatTheyWaitFor) {
    scheduler_.spawnRoot(receiveOn("in", {Pattern::bind("x")}, ProcessFactory::nil()));
    runToIdle();

    auto blocked = scheduler_.blockedInstances();
    ASSERT_EQ(blocked.size(), 1u);
    EXPECT_EQ(blocked[0].reason, "waiting for a message on " + publicKey("in"));
}

TEST_F(SchedulerTest, PersistentListenerIsQuiescent) {
    scheduler_.spawnRoot(
        ProcessFactory::contract(ProcessFactory::channel("svc"), {Pattern::bind("x")}, ProcessFactory::nil()));
    runToIdle();

    EXPECT_EQ(scheduler_.status(true), RunStatus::QUIESCENT);
    EXPECT_EQ(scheduler_.status(false), RunStatus::DEADLOCKED);
}

TEST_F(SchedulerTest, CancelDiscardsDescendantsAndFailsTarget) {
    InstanceId root = scheduler_.spawnRoot(ProcessFactory::par(
        {receiveOn("a", {Pattern::bind("x")}, ProcessFactory::nil()),
         receiveOn("b", {Pattern::bind("y")}, ProcessFactory::nil())}));
    runToIdle();
    ASSERT_EQ(store_.totalPendingReceives(), 2u);

    EXPECT_TRUE(scheduler_.cancel(root));
    runToIdle();

    EXPECT_EQ(scheduler_.status(true), RunStatus::FAILED);
    EXPECT_EQ(store_.totalPendingReceives(), 0u);
    EXPECT_EQ(instances_.size(), 1u);
    ASSERT_FALSE(scheduler_.errors().empty());
    EXPECT_EQ(scheduler_.errors().back().kind, ErrorKind::CANCELLED);
    EXPECT_FALSE(scheduler_.cancel(root));
}

TEST_F(SchedulerTest, EventsForMissingInstancesAreDropped) {
    EXPECT_FALSE(scheduler_.enqueue(Event::start(77)));
    EXPECT_FALSE(scheduler_.hasRunnable());
    EXPECT_FALSE(scheduler_.step());
}

TEST_F(SchedulerTest, KeptSendIsRetriedForLaterReceivers) {
    // A persistent send is handed to each one-shot receiver in turn
    scheduler_.spawnRoot(ProcessFactory::par({receiveOn("cfg", {Pattern::bind("a")}, sendOn("seen", {ProcessFactory::var("a")})),
                                              receiveOn("cfg", {Pattern::bind("b")}, sendOn("seen", {ProcessFactory::var("b")})),
                                              sendOn("cfg", {ProcessFactory::integer(9)}, true)}));
    runToIdle();

    EXPECT_EQ(scheduler_.status(true), RunStatus::COMPLETED);
    EXPECT_EQ(store_.pendingSendCount(ValueUtils::quote(str("seen"))), 2u);
    EXPECT_EQ(store_.pendingSendCount(ValueUtils::quote(str("cfg"))), 1u);
}

}  // namespace PCE
