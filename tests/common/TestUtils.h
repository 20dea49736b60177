#pragma once

#include "engine/ProcessEngine.h"
#include "model/ProcessFactory.h"
#include <string>
#include <vector>

namespace PCE {
namespace Test {
namespace Utils {

// Generous budget for the small programs used in tests
constexpr uint64_t TEST_MAX_STEPS = 100000;

inline EngineConfig testConfig() {
    EngineConfig config;
    config.maxSteps = TEST_MAX_STEPS;
    return config;
}

inline Value str(const std::string &text) {
    return ValueUtils::fromString(text);
}

inline Value num(int64_t value) {
    return ValueUtils::fromInt(value);
}

/**
 * @brief Public channel value `@"name"`, as programs and injections see it
 */
inline Value publicName(const std::string &name) {
    return ValueUtils::fromChannel(ValueUtils::quote(ValueUtils::fromString(name)));
}

inline std::string publicKey(const std::string &name) {
    return ValueUtils::quote(ValueUtils::fromString(name)).key();
}

/**
 * @brief `@"channel"!(args)`
 */
inline ProcessPtr sendOn(const std::string &channel, std::vector<ProcessPtr> args, bool persistent = false) {
    return ProcessFactory::send(ProcessFactory::channel(channel), std::move(args), persistent);
}

/**
 * @brief `for (patterns <- @"channel") body`
 */
inline ProcessPtr receiveOn(const std::string &channel, std::vector<PatternPtr> patterns, ProcessPtr body,
                            ReceiveMode mode = ReceiveMode::ONE_SHOT) {
    return ProcessFactory::receive(ProcessFactory::bind(std::move(patterns), ProcessFactory::channel(channel)),
                                   std::move(body), mode);
}

inline RunReport runProgram(const ProcessPtr &program, EngineConfig config = testConfig()) {
    ProcessEngine engine(config);
    engine.load(program);
    return engine.run();
}

/**
 * @brief Payloads left pending on a channel, oldest first
 */
inline std::vector<Payload> pendingPayloads(const RunReport &report, const std::string &channel) {
    std::vector<Payload> result;
    std::string key = publicKey(channel);
    for (const auto &snapshot : report.channels) {
        if (snapshot.channel.key() != key) {
            continue;
        }
        for (const auto &send : snapshot.sends) {
            result.push_back(send.payload);
        }
    }
    return result;
}

inline std::string payloadsToString(const std::vector<Payload> &payloads) {
    std::string out;
    for (const auto &payload : payloads) {
        out += ValueUtils::payloadToString(payload);
    }
    return out;
}

}  // namespace Utils
}  // namespace Test
}  // namespace PCE
