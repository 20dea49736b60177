#include "store/ChannelStore.h"
#include "common/Logger.h"
#include "store/PatternMatcher.h"
#include <algorithm>

namespace PCE {

ChannelStore::ChannelStore(bool recordJournal) : recordJournal_(recordJournal) {}

void ChannelStore::setMatchCallback(MatchCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

ChannelStore::ChannelQueues &ChannelStore::queuesFor(const ChannelName &channel) {
    auto [it, inserted] = channels_.try_emplace(channel.key());
    if (inserted) {
        it->second.channel = channel;
    }
    return it->second;
}

void ChannelStore::pruneEmptyChannels() {
    for (auto it = channels_.begin(); it != channels_.end();) {
        if (it->second.sends.empty() && it->second.receives.empty()) {
            it = channels_.erase(it);
        } else {
            ++it;
        }
    }
}

MatchRecord ChannelStore::record(const SendEntry &send, const ReceiveEntry &receive, BindingList bindings,
                                 bool sendKept, bool receiveKept) {
    MatchRecord match;
    match.sequence = ++matchCount_;
    match.channel = send.channel;
    match.sendEntry = send.id;
    match.receiveEntry = receive.id;
    match.sender = send.owner;
    match.continuation = receive.continuation;
    match.armIndex = receive.armIndex;
    match.payload = send.payload;
    match.bindings = std::move(bindings);
    match.sendPersistence = send.persistence;
    match.receiveMode = receive.mode;
    match.sendKept = sendKept;
    match.receiveKept = receiveKept;

    if (recordJournal_) {
        journal_.push_back(match);
    }
    return match;
}

void ChannelStore::removeReceive(const ReceiveEntry &receive) {
    if (receive.mode == ReceiveMode::RACE) {
        // The winning arm takes every sibling registration with it
        for (auto &[key, queues] : channels_) {
            auto &receives = queues.receives;
            receives.erase(std::remove_if(receives.begin(), receives.end(),
                                          [&receive](const ReceiveEntry &entry) {
                                              return entry.raceGroup == receive.raceGroup;
                                          }),
                           receives.end());
        }
        return;
    }

    auto &receives = queuesFor(receive.channel).receives;
    receives.erase(std::remove_if(receives.begin(), receives.end(),
                                  [&receive](const ReceiveEntry &entry) { return entry.id == receive.id; }),
                   receives.end());
}

std::optional<MatchRecord> ChannelStore::offerSend(ChannelQueues &queues, const SendEntry &send, bool registered) {
    for (const auto &candidate : queues.receives) {
        auto bindings = PatternMatcher::matchPayload(candidate.patterns, send.payload, *candidate.env);
        if (!bindings) {
            continue;
        }

        ReceiveEntry receive = candidate;
        bool receiveKept = receive.mode == ReceiveMode::PERSISTENT;
        bool sendKept = send.persistence == Persistence::PERSISTENT || receive.mode == ReceiveMode::PEEK;

        if (!receiveKept) {
            removeReceive(receive);
        }
        if (sendKept && !registered) {
            queues.sends.push_back(send);
        } else if (!sendKept && registered) {
            queues.sends.erase(std::remove_if(queues.sends.begin(), queues.sends.end(),
                                              [&send](const SendEntry &entry) { return entry.id == send.id; }),
                               queues.sends.end());
        }
        return record(send, receive, std::move(*bindings), sendKept, receiveKept);
    }

    if (!registered) {
        queues.sends.push_back(send);
    }
    return std::nullopt;
}

std::optional<MatchRecord> ChannelStore::offerReceive(ChannelQueues &queues, const ReceiveEntry &receive,
                                                      bool registered, bool appendOnMiss) {
    for (auto it = queues.sends.begin(); it != queues.sends.end(); ++it) {
        auto bindings = PatternMatcher::matchPayload(receive.patterns, it->payload, *receive.env);
        if (!bindings) {
            continue;
        }

        SendEntry send = *it;
        bool receiveKept = receive.mode == ReceiveMode::PERSISTENT;
        bool sendKept = send.persistence == Persistence::PERSISTENT || receive.mode == ReceiveMode::PEEK;

        if (!sendKept) {
            queues.sends.erase(it);
        }
        if (receiveKept && !registered) {
            queues.receives.push_back(receive);
        } else if (!receiveKept && registered) {
            removeReceive(receive);
        }
        return record(send, receive, std::move(*bindings), sendKept, receiveKept);
    }

    if (!registered && appendOnMiss) {
        queues.receives.push_back(receive);
    }
    return std::nullopt;
}

void ChannelStore::notify(const std::optional<MatchRecord> &match) {
    if (!match) {
        return;
    }
    MatchCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = callback_;
    }
    if (callback) {
        callback(*match);
    }
}

std::optional<MatchRecord> ChannelStore::publish(const ChannelName &channel, const Payload &payload,
                                                 Persistence persistence, InstanceId owner) {
    std::optional<MatchRecord> match;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        SendEntry send{nextEntryId_++, channel, payload, persistence, owner};
        match = offerSend(queuesFor(channel), send, false);
        pruneEmptyChannels();
    }

    LOG_DEBUG("ChannelStore: publish {}{} on {} by {} -> {}", ValueUtils::payloadToString(payload),
              persistence == Persistence::PERSISTENT ? " (persistent)" : "", channel.key(), owner,
              match ? "matched #" + std::to_string(match->continuation) : std::string("queued"));
    notify(match);
    return match;
}

std::optional<MatchRecord> ChannelStore::request(const ChannelName &channel, const std::vector<PatternPtr> &patterns,
                                                 ReceiveMode mode, InstanceId continuation,
                                                 const EnvironmentPtr &env) {
    std::optional<MatchRecord> match;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ReceiveEntry receive;
        receive.id = nextEntryId_++;
        receive.channel = channel;
        receive.patterns = patterns;
        receive.mode = mode;
        receive.continuation = continuation;
        receive.env = env ? env : Environment::empty();
        match = offerReceive(queuesFor(channel), receive, false, true);
        pruneEmptyChannels();
    }

    LOG_DEBUG("ChannelStore: request {} on {} by #{} -> {}", describePatterns(patterns), channel.key(), continuation,
              match ? "matched" : "registered");
    notify(match);
    return match;
}

std::optional<MatchRecord> ChannelStore::select(const std::vector<SelectArm> &arms, InstanceId continuation,
                                                const EnvironmentPtr &env) {
    std::optional<MatchRecord> match;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        uint64_t raceGroup = nextRaceGroup_++;

        std::vector<ReceiveEntry> entries;
        for (size_t i = 0; i < arms.size(); ++i) {
            ReceiveEntry receive;
            receive.id = nextEntryId_++;
            receive.channel = arms[i].channel;
            receive.patterns = arms[i].patterns;
            receive.mode = ReceiveMode::RACE;
            receive.continuation = continuation;
            receive.env = env ? env : Environment::empty();
            receive.raceGroup = raceGroup;
            receive.armIndex = i;
            entries.push_back(std::move(receive));
        }

        // Arm order breaks ties between channels that could all match now
        for (const auto &receive : entries) {
            match = offerReceive(queuesFor(receive.channel), receive, false, false);
            if (match) {
                break;
            }
        }
        if (!match) {
            for (const auto &receive : entries) {
                queuesFor(receive.channel).receives.push_back(receive);
            }
        }
        pruneEmptyChannels();
    }

    LOG_DEBUG("ChannelStore: select over {} arms by #{} -> {}", arms.size(), continuation,
              match ? "arm " + std::to_string(match->armIndex) : std::string("registered"));
    notify(match);
    return match;
}

std::optional<MatchRecord> ChannelStore::retryReceives(InstanceId owner) {
    std::optional<MatchRecord> match;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ReceiveEntry> owned;
        for (const auto &[key, queues] : channels_) {
            for (const auto &receive : queues.receives) {
                if (receive.continuation == owner) {
                    owned.push_back(receive);
                }
            }
        }
        std::sort(owned.begin(), owned.end(),
                  [](const ReceiveEntry &a, const ReceiveEntry &b) { return a.id < b.id; });

        for (const auto &receive : owned) {
            match = offerReceive(queuesFor(receive.channel), receive, true, false);
            if (match) {
                break;
            }
        }
        pruneEmptyChannels();
    }
    notify(match);
    return match;
}

std::optional<MatchRecord> ChannelStore::retrySend(EntryId sendEntry) {
    std::optional<MatchRecord> match;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &[key, queues] : channels_) {
            auto it = std::find_if(queues.sends.begin(), queues.sends.end(),
                                   [sendEntry](const SendEntry &entry) { return entry.id == sendEntry; });
            if (it != queues.sends.end()) {
                SendEntry send = *it;
                match = offerSend(queues, send, true);
                break;
            }
        }
        pruneEmptyChannels();
    }
    notify(match);
    return match;
}

size_t ChannelStore::retractReceivesLocked(InstanceId owner) {
    size_t removed = 0;
    for (auto &[key, queues] : channels_) {
        auto &receives = queues.receives;
        auto last = std::remove_if(receives.begin(), receives.end(),
                                   [owner](const ReceiveEntry &entry) { return entry.continuation == owner; });
        removed += static_cast<size_t>(std::distance(last, receives.end()));
        receives.erase(last, receives.end());
    }
    return removed;
}

size_t ChannelStore::retractReceivesOwnedBy(InstanceId owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = retractReceivesLocked(owner);
    pruneEmptyChannels();
    return removed;
}

size_t ChannelStore::retractOwnedBy(InstanceId owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = retractReceivesLocked(owner);
    for (auto &[key, queues] : channels_) {
        auto &sends = queues.sends;
        auto last =
            std::remove_if(sends.begin(), sends.end(), [owner](const SendEntry &entry) { return entry.owner == owner; });
        removed += static_cast<size_t>(std::distance(last, sends.end()));
        sends.erase(last, sends.end());
    }
    pruneEmptyChannels();
    return removed;
}

size_t ChannelStore::pendingSendCount(const ChannelName &channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(channel.key());
    return it == channels_.end() ? 0 : it->second.sends.size();
}

size_t ChannelStore::pendingReceiveCount(const ChannelName &channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(channel.key());
    return it == channels_.end() ? 0 : it->second.receives.size();
}

size_t ChannelStore::totalPendingSends() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto &[key, queues] : channels_) {
        total += queues.sends.size();
    }
    return total;
}

size_t ChannelStore::totalPendingReceives() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto &[key, queues] : channels_) {
        total += queues.receives.size();
    }
    return total;
}

size_t ChannelStore::receivesOwnedBy(InstanceId owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto &[key, queues] : channels_) {
        total += static_cast<size_t>(std::count_if(queues.receives.begin(), queues.receives.end(),
                                                   [owner](const ReceiveEntry &e) { return e.continuation == owner; }));
    }
    return total;
}

std::vector<ChannelSnapshot> ChannelStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ChannelSnapshot> result;
    for (const auto &[key, queues] : channels_) {
        ChannelSnapshot channel;
        channel.channel = queues.channel;
        channel.sends.assign(queues.sends.begin(), queues.sends.end());
        channel.receives.assign(queues.receives.begin(), queues.receives.end());
        result.push_back(std::move(channel));
    }
    return result;
}

std::vector<MatchRecord> ChannelStore::journal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return journal_;
}

uint64_t ChannelStore::matchCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return matchCount_;
}

}  // namespace PCE
