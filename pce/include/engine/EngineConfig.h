#pragma once

#include "common/ILoggerBackend.h"
#include "common/JsonUtils.h"
#include <cstdint>
#include <string>

namespace PCE {

/**
 * @brief Run settings of a ProcessEngine
 *
 * JSON form (every key optional):
 * @code
 * {"maxSteps": 100000, "quiescentListeners": true, "recordMatchJournal": true,
 *  "logLevel": "debug", "logDir": "logs", "logToFile": false}
 * @endcode
 */
struct EngineConfig {
    uint64_t maxSteps = 1000000;    // Step budget of one run()
    bool quiescentListeners = true;  // Idle persistent listeners end a run as QUIESCENT, not DEADLOCKED
    bool recordMatchJournal = true;
    std::string logLevel = "info";
    std::string logDir = "logs";
    bool logToFile = false;

    /**
     * @throws std::invalid_argument for a non-object document or a non-positive maxSteps
     */
    static EngineConfig fromJson(const json &object);

    /**
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static EngineConfig fromFile(const std::string &path);

    /**
     * @brief Apply the PCE_MAX_STEPS environment override, if set
     */
    void applyEnvironment();

    LogOptions logOptions() const;

    json toJson() const;
};

}  // namespace PCE
