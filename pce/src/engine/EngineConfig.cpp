#include "engine/EngineConfig.h"
#include "common/Logger.h"
#include <cstdlib>
#include <stdexcept>

namespace PCE {

EngineConfig EngineConfig::fromJson(const json &object) {
    if (!object.is_object()) {
        throw std::invalid_argument("EngineConfig: configuration must be a JSON object");
    }

    EngineConfig config;
    int64_t maxSteps = JsonUtils::getInt(object, "maxSteps", static_cast<int64_t>(config.maxSteps));
    if (maxSteps <= 0) {
        throw std::invalid_argument("EngineConfig: maxSteps must be positive, got " + std::to_string(maxSteps));
    }
    config.maxSteps = static_cast<uint64_t>(maxSteps);
    config.quiescentListeners = JsonUtils::getBool(object, "quiescentListeners", config.quiescentListeners);
    config.recordMatchJournal = JsonUtils::getBool(object, "recordMatchJournal", config.recordMatchJournal);
    config.logLevel = JsonUtils::getString(object, "logLevel", config.logLevel);
    config.logDir = JsonUtils::getString(object, "logDir", config.logDir);
    config.logToFile = JsonUtils::getBool(object, "logToFile", config.logToFile);
    return config;
}

EngineConfig EngineConfig::fromFile(const std::string &path) {
    std::string error;
    auto document = JsonUtils::parseFile(path, &error);
    if (!document) {
        throw std::runtime_error("EngineConfig: cannot load " + path + ": " + error);
    }
    try {
        return fromJson(*document);
    } catch (const std::invalid_argument &e) {
        throw std::runtime_error(std::string(e.what()) + " (" + path + ")");
    }
}

void EngineConfig::applyEnvironment() {
    const char *value = std::getenv("PCE_MAX_STEPS");
    if (!value || !*value) {
        return;
    }

    char *end = nullptr;
    unsigned long long parsed = std::strtoull(value, &end, 10);
    if (*end != '\0' || parsed == 0 || value[0] == '-') {
        LOG_WARN("EngineConfig: ignoring invalid PCE_MAX_STEPS '{}'", value);
        return;
    }
    maxSteps = static_cast<uint64_t>(parsed);
    LOG_DEBUG("EngineConfig: maxSteps overridden to {} by PCE_MAX_STEPS", maxSteps);
}

LogOptions EngineConfig::logOptions() const {
    LogOptions options;
    options.level = parseLogLevel(logLevel, LogLevel::Info);
    options.logDir = logDir;
    options.logToFile = logToFile;
    return options;
}

json EngineConfig::toJson() const {
    return json{{"maxSteps", maxSteps},   {"quiescentListeners", quiescentListeners},
                {"recordMatchJournal", recordMatchJournal}, {"logLevel", logLevel},
                {"logDir", logDir},       {"logToFile", logToFile}};
}

}  // namespace PCE
