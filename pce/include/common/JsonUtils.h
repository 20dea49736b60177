#pragma once

#include "model/Value.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace PCE {

using json = nlohmann::json;

/**
 * @brief Centralized JSON processing utilities using nlohmann/json
 *
 * Shared by configuration loading, the process tree parser, external payload
 * injection and run reports.
 */
class JsonUtils {
public:
    /**
     * @brief Parse JSON string into json object with error handling
     * @param jsonString Input JSON string
     * @param errorOut Optional error message output
     * @return Parsed json object or nullopt on failure
     */
    static std::optional<json> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    /**
     * @brief Read and parse a JSON file
     * @param path File path
     * @param errorOut Optional error message output
     * @return Parsed json object or nullopt when the file is unreadable or malformed
     */
    static std::optional<json> parseFile(const std::string &path, std::string *errorOut = nullptr);

    static std::string toCompactString(const json &value);
    static std::string toPrettyString(const json &value);

    static std::string getString(const json &object, const std::string &key, const std::string &defaultValue = "");
    static int64_t getInt(const json &object, const std::string &key, int64_t defaultValue = 0);
    static bool getBool(const json &object, const std::string &key, bool defaultValue = false);

    /**
     * @brief Check if JSON object has key and it's not null
     */
    static bool hasKey(const json &object, const std::string &key);

    /**
     * @brief Encode a runtime value for reports
     *
     * Nil, booleans, integers, strings and lists map to their JSON
     * counterparts; maps with only string keys become objects. Names, tuples,
     * sets and other maps use tagged objects (`@name`, `@tuple`, `@set`, `@map`).
     */
    static json valueToJson(const Value &value);

    /**
     * @brief Decode an externally supplied JSON value
     *
     * Accepts null, booleans, integers, strings, arrays (lists) and objects
     * (maps with string keys). Floating point numbers are rejected.
     *
     * @param errorOut Optional error message output
     */
    static std::optional<Value> valueFromJson(const json &value, std::string *errorOut = nullptr);
};

}  // namespace PCE
