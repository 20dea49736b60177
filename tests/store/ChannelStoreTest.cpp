#include "store/ChannelStore.h"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>

namespace PCE {

class ChannelStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_.setMatchCallback([this](const MatchRecord &match) { delivered_.push_back(match); });
    }

    static Value num(int64_t value) {
        return ValueUtils::fromInt(value);
    }

    std::optional<MatchRecord> receiveOne(const ChannelName &channel, InstanceId continuation,
                                          ReceiveMode mode = ReceiveMode::ONE_SHOT) {
        return store_.request(channel, {Pattern::bind("x")}, mode, continuation, Environment::empty());
    }

    ChannelStore store_;
    std::vector<MatchRecord> delivered_;
    ChannelName alpha_{"alpha"};
    ChannelName beta_{"beta"};
};

TEST_F(ChannelStoreTest, SendsAreDeliveredInPublishOrder) {
    store_.publish(alpha_, {num(1)}, Persistence::ONCE, 10);
    store_.publish(alpha_, {num(2)}, Persistence::ONCE, 11);
    EXPECT_EQ(store_.pendingSendCount(alpha_), 2u);

    auto first = receiveOne(alpha_, 20);
    auto second = receiveOne(alpha_, 21);
    ASSERT_TRUE(first && second);
    EXPECT_EQ(ValueUtils::toString(first->payload[0]), "1");
    EXPECT_EQ(ValueUtils::toString(second->payload[0]), "2");
    EXPECT_EQ(first->sender, 10u);
    EXPECT_EQ(store_.pendingSendCount(alpha_), 0u);
    EXPECT_EQ(delivered_.size(), 2u);
}

TEST_F(ChannelStoreTest, ReceiversAreServedInRegistrationOrder) {
    EXPECT_FALSE(receiveOne(alpha_, 20).has_value());
    EXPECT_FALSE(receiveOne(alpha_, 21).has_value());

    auto match = store_.publish(alpha_, {num(5)}, Persistence::ONCE, 10);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->continuation, 20u);
    EXPECT_EQ(store_.pendingReceiveCount(alpha_), 1u);
}

TEST_F(ChannelStoreTest, NonMatchingSendIsSkippedNotBlocking) {
    store_.publish(alpha_, {ValueUtils::fromString("text")}, Persistence::ONCE, 10);
    store_.publish(alpha_, {num(3)}, Persistence::ONCE, 11);

    auto match =
        store_.request(alpha_, {Pattern::typed(SimpleType::INT)}, ReceiveMode::ONE_SHOT, 20, Environment::empty());
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->sender, 11u);
    EXPECT_EQ(store_.pendingSendCount(alpha_), 1u);
}

TEST_F(ChannelStoreTest, PersistenceTable) {
    struct Case {
        Persistence send;
        ReceiveMode receive;
        bool sendKept;
        bool receiveKept;
    };
    const std::vector<Case> cases = {
        {Persistence::ONCE, ReceiveMode::ONE_SHOT, false, false},
        {Persistence::PERSISTENT, ReceiveMode::ONE_SHOT, true, false},
        {Persistence::ONCE, ReceiveMode::PERSISTENT, false, true},
        {Persistence::ONCE, ReceiveMode::PEEK, true, false},
    };

    InstanceId next = 100;
    for (const auto &c : cases) {
        ChannelName channel("case" + std::to_string(next));
        store_.publish(channel, {num(1)}, c.send, 1);
        auto match = receiveOne(channel, next++, c.receive);
        ASSERT_TRUE(match.has_value());
        EXPECT_EQ(match->sendKept, c.sendKept);
        EXPECT_EQ(match->receiveKept, c.receiveKept);
        EXPECT_EQ(store_.pendingSendCount(channel), c.sendKept ? 1u : 0u);
        EXPECT_EQ(store_.pendingReceiveCount(channel), c.receiveKept ? 1u : 0u);
    }
}

TEST_F(ChannelStoreTest, PeekLeavesMessageForNextReceiver) {
    store_.publish(alpha_, {num(9)}, Persistence::ONCE, 1);
    ASSERT_TRUE(receiveOne(alpha_, 20, ReceiveMode::PEEK).has_value());
    ASSERT_TRUE(receiveOne(alpha_, 21).has_value());
    EXPECT_EQ(store_.totalPendingSends(), 0u);
}

TEST_F(ChannelStoreTest, SelectPrefersEarliestArmWhenSeveralCanFire) {
    store_.publish(beta_, {num(2)}, Persistence::ONCE, 1);
    store_.publish(alpha_, {num(1)}, Persistence::ONCE, 1);

    std::vector<SelectArm> arms = {{alpha_, {Pattern::bind("a")}}, {beta_, {Pattern::bind("b")}}};
    auto match = store_.select(arms, 30, Environment::empty());
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->armIndex, 0u);
    EXPECT_EQ(store_.pendingSendCount(beta_), 1u);
    EXPECT_EQ(store_.totalPendingReceives(), 0u);
}

TEST_F(ChannelStoreTest, SelectFiresAtMostOneArm) {
    std::vector<SelectArm> arms = {{alpha_, {Pattern::bind("a")}}, {beta_, {Pattern::bind("b")}}};
    EXPECT_FALSE(store_.select(arms, 30, Environment::empty()).has_value());
    EXPECT_EQ(store_.receivesOwnedBy(30), 2u);

    auto match = store_.publish(beta_, {num(2)}, Persistence::ONCE, 1);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->armIndex, 1u);
    EXPECT_EQ(store_.receivesOwnedBy(30), 0u);

    EXPECT_FALSE(store_.publish(alpha_, {num(1)}, Persistence::ONCE, 1).has_value());
    EXPECT_EQ(store_.pendingSendCount(alpha_), 1u);
}

TEST_F(ChannelStoreTest, PersistentReceiveCatchesUpOnRetry) {
    store_.publish(alpha_, {num(1)}, Persistence::ONCE, 1);
    store_.publish(alpha_, {num(2)}, Persistence::ONCE, 1);

    ASSERT_TRUE(receiveOne(alpha_, 40, ReceiveMode::PERSISTENT).has_value());
    EXPECT_EQ(store_.pendingSendCount(alpha_), 1u);

    auto retry = store_.retryReceives(40);
    ASSERT_TRUE(retry.has_value());
    EXPECT_EQ(ValueUtils::toString(retry->payload[0]), "2");
    EXPECT_FALSE(store_.retryReceives(40).has_value());
    EXPECT_EQ(store_.receivesOwnedBy(40), 1u);
}

TEST_F(ChannelStoreTest, RetractRemovesOwnedEntries) {
    store_.publish(alpha_, {num(1)}, Persistence::PERSISTENT, 50);
    receiveOne(beta_, 50);
    receiveOne(beta_, 51);

    EXPECT_EQ(store_.retractReceivesOwnedBy(50), 1u);
    EXPECT_EQ(store_.pendingSendCount(alpha_), 1u);
    EXPECT_EQ(store_.retractOwnedBy(50), 1u);
    EXPECT_EQ(store_.totalPendingSends(), 0u);
    EXPECT_EQ(store_.receivesOwnedBy(51), 1u);
}

TEST_F(ChannelStoreTest, PatternsSeeReceiverEnvironment) {
    auto env = Environment::empty()->with("wanted", num(4));
    store_.request(alpha_, {Pattern::varRef("wanted")}, ReceiveMode::ONE_SHOT, 60, env);

    EXPECT_FALSE(store_.publish(alpha_, {num(3)}, Persistence::ONCE, 1).has_value());
    EXPECT_TRUE(store_.publish(alpha_, {num(4)}, Persistence::ONCE, 1).has_value());
}

TEST_F(ChannelStoreTest, JournalRecordsEveryMatchInOrder) {
    receiveOne(alpha_, 20);
    store_.publish(alpha_, {num(1)}, Persistence::ONCE, 1);
    store_.publish(beta_, {num(2)}, Persistence::ONCE, 1);
    receiveOne(beta_, 21);

    auto journal = store_.journal();
    ASSERT_EQ(journal.size(), 2u);
    EXPECT_EQ(journal[0].sequence, 1u);
    EXPECT_EQ(journal[0].channel, alpha_);
    EXPECT_EQ(journal[1].sequence, 2u);
    EXPECT_EQ(journal[1].continuation, 21u);
    EXPECT_EQ(store_.matchCount(), 2u);
}

TEST_F(ChannelStoreTest, JournalCanBeDisabled) {
    ChannelStore store(false);
    store.publish(alpha_, {num(1)}, Persistence::ONCE, 1);
    store.request(alpha_, {Pattern::wildcard()}, ReceiveMode::ONE_SHOT, 2, nullptr);
    EXPECT_TRUE(store.journal().empty());
    EXPECT_EQ(store.matchCount(), 1u);
}

TEST_F(ChannelStoreTest, ConcurrentPublishersMatchEachSendOnce) {
    constexpr int kPerThread = 200;
    ChannelStore store;
    std::atomic<int> matched{0};
    store.setMatchCallback([&matched](const MatchRecord &) { matched++; });

    std::thread producer([&]() {
        for (int i = 0; i < kPerThread; ++i) {
            store.publish(alpha_, {num(i)}, Persistence::ONCE, 1);
        }
    });
    std::thread consumer([&]() {
        for (int i = 0; i < kPerThread; ++i) {
            store.request(alpha_, {Pattern::wildcard()}, ReceiveMode::ONE_SHOT, static_cast<InstanceId>(100 + i),
                          nullptr);
        }
    });
    producer.join();
    consumer.join();

    EXPECT_EQ(matched.load(), kPerThread);
    EXPECT_EQ(store.totalPendingSends(), 0u);
    EXPECT_EQ(store.totalPendingReceives(), 0u);
}

}  // namespace PCE
