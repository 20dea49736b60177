#pragma once

#include "common/JsonUtils.h"
#include "model/Pattern.h"
#include "model/ProcessNode.h"
#include <string>
#include <vector>

namespace PCE {

/**
 * @brief Builds an immutable process tree from its JSON form
 *
 * A document is either a process object or `{"process": {...}}`. Every
 * process object names its construct in "type":
 *
 * @code
 * {"type": "new", "names": ["ack"], "body":
 *   {"type": "par", "processes": [
 *     {"type": "send", "channel": {"type": "channel", "name": "greet"},
 *      "args": [{"type": "literal", "value": "world"}, {"type": "var", "name": "ack"}]},
 *     {"type": "receive", "binds": [{"patterns": ["reply"], "channel": {"type": "var", "name": "ack"}}],
 *      "body": {"type": "var", "name": "reply"}}]}}
 * @endcode
 *
 * Patterns are objects with a "type" as well; a bare string is a binder and
 * "_" the wildcard. Errors are collected rather than thrown; a document with
 * errors yields nullptr.
 */
class ProcessJsonParser {
public:
    ProcessJsonParser() = default;

    /**
     * @brief Parse a JSON program file
     * @return Root process, nullptr on failure
     */
    ProcessPtr parseFile(const std::string &filename);

    /**
     * @brief Parse a JSON program string
     * @return Root process, nullptr on failure
     */
    ProcessPtr parseContent(const std::string &content);

    /**
     * @brief Parse an already decoded document
     */
    ProcessPtr parseDocument(const json &document);

    bool hasErrors() const {
        return !errorMessages_.empty();
    }

    const std::vector<std::string> &getErrorMessages() const {
        return errorMessages_;
    }

private:
    ProcessPtr parseProcess(const json &node, const std::string &path);
    std::vector<ProcessPtr> parseProcessList(const json &node, const std::string &key, const std::string &path);
    ProcessPtr parseOptionalProcess(const json &node, const std::string &key, const std::string &path);
    ProcessPtr parseRequiredProcess(const json &node, const std::string &key, const std::string &path);
    ReceiveBind parseBind(const json &node, const std::string &path);
    PatternPtr parsePattern(const json &node, const std::string &path);
    std::vector<PatternPtr> parsePatternList(const json &node, const std::string &key, const std::string &path);
    std::optional<std::string> parseRemainder(const json &node);
    ProcessPtr parseCollection(const json &node, CollectionKind kind, const std::string &path);

    void addError(const std::string &message);
    void initParsing();

    std::vector<std::string> errorMessages_;
};

}  // namespace PCE
