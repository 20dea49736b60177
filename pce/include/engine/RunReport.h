#pragma once

#include "common/JsonUtils.h"
#include "events/ErrorInfo.h"
#include "runtime/Scheduler.h"
#include "store/ChannelEntry.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace PCE {

/**
 * @brief Outcome of a run: status, root result and diagnostics
 */
struct RunReport {
    RunStatus status = RunStatus::RUNNING;
    std::optional<Value> rootValue;
    std::map<std::string, Value> rootEnvironment;
    std::vector<ErrorInfo> errors;
    std::vector<BlockedInstance> blocked;
    std::vector<MatchRecord> journal;
    std::vector<ChannelSnapshot> channels;
    uint64_t steps = 0;

    /**
     * @brief COMPLETED, or QUIESCENT with only persistent listeners left
     */
    bool isSuccess() const {
        return status == RunStatus::COMPLETED || status == RunStatus::QUIESCENT;
    }

    /**
     * @brief The failure that reached the root, if any
     */
    const ErrorInfo *rootError() const;

    /**
     * @brief One-line description for logs and the command line
     */
    std::string summary() const;

    json toJson() const;

    static json errorToJson(const ErrorInfo &error);
};

}  // namespace PCE
