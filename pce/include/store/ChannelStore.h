#pragma once

#include "store/ChannelEntry.h"
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace PCE {

/**
 * @brief Per-channel FIFO queues of pending sends and pending receives
 *
 * Each public operation is indivisible (guarded by a mutex) and performs at
 * most one match. The removal policy on a match:
 *
 * | send       | receive    | send entry | receive entry |
 * |------------|------------|------------|---------------|
 * | ONCE       | ONE_SHOT   | removed    | removed       |
 * | ONCE       | PERSISTENT | removed    | kept          |
 * | PERSISTENT | ONE_SHOT   | kept       | removed       |
 * | PERSISTENT | PERSISTENT | kept       | kept          |
 * | any        | PEEK       | kept       | removed       |
 *
 * A RACE receive behaves like ONE_SHOT and retracts every other arm of its
 * select in the same operation.
 *
 * The match callback runs after the lock is released, in match order.
 */
class ChannelStore {
public:
    using MatchCallback = std::function<void(const MatchRecord &)>;

    explicit ChannelStore(bool recordJournal = true);

    void setMatchCallback(MatchCallback callback);

    /**
     * @brief Offer a message on a channel
     *
     * Pending receives are tried in FIFO order; the first whose patterns match
     * takes the message. Without a match the send is appended.
     *
     * @return The match, if one happened
     */
    std::optional<MatchRecord> publish(const ChannelName &channel, const Payload &payload, Persistence persistence,
                                       InstanceId owner);

    /**
     * @brief Register interest in a channel
     *
     * Pending sends are tried in FIFO order. Without a match (or for a
     * PERSISTENT receive in any case) the request is appended.
     *
     * @param env Scope for value-reference patterns
     */
    std::optional<MatchRecord> request(const ChannelName &channel, const std::vector<PatternPtr> &patterns,
                                       ReceiveMode mode, InstanceId continuation, const EnvironmentPtr &env);

    /**
     * @brief Race one receive across several channels
     *
     * Arms are tried in order against pending sends; the first match wins.
     * Without a match one RACE entry per arm is registered.
     */
    std::optional<MatchRecord> select(const std::vector<SelectArm> &arms, InstanceId continuation,
                                      const EnvironmentPtr &env);

    /**
     * @brief Try the receives owned by an instance against pending sends again
     *
     * Registers nothing; yields at most one match.
     */
    std::optional<MatchRecord> retryReceives(InstanceId owner);

    /**
     * @brief Try an existing send entry against pending receives again
     */
    std::optional<MatchRecord> retrySend(EntryId sendEntry);

    /**
     * @brief Remove the receive entries of a terminated instance
     * @return Number of entries removed
     */
    size_t retractReceivesOwnedBy(InstanceId owner);

    /**
     * @brief Remove every entry, sends included, of a cancelled instance
     * @return Number of entries removed
     */
    size_t retractOwnedBy(InstanceId owner);

    size_t pendingSendCount(const ChannelName &channel) const;
    size_t pendingReceiveCount(const ChannelName &channel) const;
    size_t totalPendingSends() const;
    size_t totalPendingReceives() const;
    size_t receivesOwnedBy(InstanceId owner) const;

    /**
     * @brief Pending entries of every non-empty channel, ordered by channel key
     */
    std::vector<ChannelSnapshot> snapshot() const;

    /**
     * @brief Matches in the order they happened (empty when journaling is off)
     */
    std::vector<MatchRecord> journal() const;

    uint64_t matchCount() const;

private:
    struct ChannelQueues {
        ChannelName channel;
        std::deque<SendEntry> sends;
        std::deque<ReceiveEntry> receives;
    };

    ChannelQueues &queuesFor(const ChannelName &channel);

    /**
     * @brief Offer a send to the channel's receives
     * @param registered The send is already queued (retry) rather than new
     */
    std::optional<MatchRecord> offerSend(ChannelQueues &queues, const SendEntry &send, bool registered);

    /**
     * @brief Offer a receive to the channel's sends
     * @param registered The receive is already queued (retry) rather than new
     * @param appendOnMiss Queue a new receive when nothing matches
     */
    std::optional<MatchRecord> offerReceive(ChannelQueues &queues, const ReceiveEntry &receive, bool registered,
                                            bool appendOnMiss);
    void removeReceive(const ReceiveEntry &receive);
    size_t retractReceivesLocked(InstanceId owner);
    void pruneEmptyChannels();
    MatchRecord record(const SendEntry &send, const ReceiveEntry &receive, BindingList bindings, bool sendKept,
                       bool receiveKept);
    void notify(const std::optional<MatchRecord> &match);

    mutable std::mutex mutex_;
    std::map<std::string, ChannelQueues> channels_;
    MatchCallback callback_;
    std::vector<MatchRecord> journal_;
    bool recordJournal_;
    EntryId nextEntryId_ = 1;
    uint64_t nextRaceGroup_ = 1;
    uint64_t matchCount_ = 0;
};

}  // namespace PCE
