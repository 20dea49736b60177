#include "parsing/ProcessJsonParser.h"
#include "common/Logger.h"
#include "model/ProcessFactory.h"
#include <array>
#include <filesystem>

namespace PCE {

namespace {

constexpr std::array<BinaryOp, 18> BINARY_OPS = {
    BinaryOp::OR,  BinaryOp::AND,    BinaryOp::EQ,   BinaryOp::NEQ,           BinaryOp::LT,   BinaryOp::LTE,
    BinaryOp::GT,  BinaryOp::GTE,    BinaryOp::CONCAT, BinaryOp::DIFF,        BinaryOp::ADD,  BinaryOp::SUB,
    BinaryOp::MULT, BinaryOp::DIV,   BinaryOp::MOD,  BinaryOp::INTERPOLATION, BinaryOp::CONJUNCTION,
    BinaryOp::DISJUNCTION,
};

std::optional<BinaryOp> binaryOpFromString(const std::string &text) {
    for (BinaryOp op : BINARY_OPS) {
        if (text == toString(op)) {
            return op;
        }
    }
    return std::nullopt;
}

std::optional<UnaryOp> unaryOpFromString(const std::string &text) {
    if (text == "not") {
        return UnaryOp::NOT;
    }
    if (text == "-") {
        return UnaryOp::NEG;
    }
    if (text == "~") {
        return UnaryOp::NEGATION;
    }
    return std::nullopt;
}

std::optional<ReceiveMode> receiveModeFromString(const std::string &text) {
    if (text == "oneShot") {
        return ReceiveMode::ONE_SHOT;
    }
    if (text == "persistent") {
        return ReceiveMode::PERSISTENT;
    }
    if (text == "peek") {
        return ReceiveMode::PEEK;
    }
    return std::nullopt;
}

std::optional<ReceiveSource> sourceFromString(const std::string &text) {
    if (text == "simple") {
        return ReceiveSource::SIMPLE;
    }
    if (text == "receiveSend") {
        return ReceiveSource::RECEIVE_SEND;
    }
    if (text == "sendReceive") {
        return ReceiveSource::SEND_RECEIVE;
    }
    return std::nullopt;
}

std::optional<BundleMode> bundleModeFromString(const std::string &text) {
    if (text == "read") {
        return BundleMode::READ;
    }
    if (text == "write") {
        return BundleMode::WRITE;
    }
    if (text == "equiv") {
        return BundleMode::EQUIV;
    }
    if (text == "rw") {
        return BundleMode::RW;
    }
    return std::nullopt;
}

std::optional<SimpleType> simpleTypeFromString(const std::string &text) {
    if (text == "Bool") {
        return SimpleType::BOOL;
    }
    if (text == "Int") {
        return SimpleType::INT;
    }
    if (text == "String") {
        return SimpleType::STRING;
    }
    if (text == "Name") {
        return SimpleType::NAME;
    }
    return std::nullopt;
}

std::string child(const std::string &path, const std::string &key) {
    return path + "." + key;
}

std::string indexed(const std::string &path, size_t index) {
    return path + "[" + std::to_string(index) + "]";
}

}  // namespace

void ProcessJsonParser::initParsing() {
    errorMessages_.clear();
}

void ProcessJsonParser::addError(const std::string &message) {
    LOG_ERROR("ProcessJsonParser: {}", message);
    errorMessages_.push_back(message);
}

ProcessPtr ProcessJsonParser::parseFile(const std::string &filename) {
    initParsing();
    if (!std::filesystem::exists(filename)) {
        addError("File not found: " + filename);
        return nullptr;
    }

    LOG_INFO("ProcessJsonParser: parsing program file {}", filename);
    std::string error;
    auto document = JsonUtils::parseFile(filename, &error);
    if (!document) {
        addError("Failed to parse JSON file: " + error);
        return nullptr;
    }
    return parseDocument(*document);
}

ProcessPtr ProcessJsonParser::parseContent(const std::string &content) {
    initParsing();
    std::string error;
    auto document = JsonUtils::parseJson(content, &error);
    if (!document) {
        addError("Failed to parse JSON content: " + error);
        return nullptr;
    }
    return parseDocument(*document);
}

ProcessPtr ProcessJsonParser::parseDocument(const json &document) {
    const json &root = document.is_object() && document.contains("process") ? document["process"] : document;
    ProcessPtr process = parseProcess(root, "process");
    if (hasErrors()) {
        return nullptr;
    }
    LOG_DEBUG("ProcessJsonParser: built {} tree", process->constructName());
    return process;
}

ProcessPtr ProcessJsonParser::parseRequiredProcess(const json &node, const std::string &key, const std::string &path) {
    if (!JsonUtils::hasKey(node, key)) {
        addError("Missing '" + key + "' at " + path);
        return nullptr;
    }
    return parseProcess(node[key], child(path, key));
}

ProcessPtr ProcessJsonParser::parseOptionalProcess(const json &node, const std::string &key, const std::string &path) {
    if (!JsonUtils::hasKey(node, key)) {
        return nullptr;
    }
    return parseProcess(node[key], child(path, key));
}

std::vector<ProcessPtr> ProcessJsonParser::parseProcessList(const json &node, const std::string &key,
                                                            const std::string &path) {
    std::vector<ProcessPtr> result;
    if (!JsonUtils::hasKey(node, key)) {
        return result;
    }
    const json &list = node[key];
    if (!list.is_array()) {
        addError("'" + key + "' must be an array at " + path);
        return result;
    }
    for (size_t i = 0; i < list.size(); ++i) {
        result.push_back(parseProcess(list[i], indexed(child(path, key), i)));
    }
    return result;
}

std::optional<std::string> ProcessJsonParser::parseRemainder(const json &node) {
    if (!JsonUtils::hasKey(node, "remainder")) {
        return std::nullopt;
    }
    return JsonUtils::getString(node, "remainder");
}

ProcessPtr ProcessJsonParser::parseProcess(const json &node, const std::string &path) {
    if (!node.is_object()) {
        addError("Process must be an object at " + path);
        return ProcessFactory::nil();
    }
    std::string type = JsonUtils::getString(node, "type");

    if (type == "nil") {
        return ProcessFactory::nil();
    }
    if (type == "literal") {
        if (!node.contains("value")) {
            addError("Missing 'value' at " + path);
            return ProcessFactory::nil();
        }
        std::string error;
        auto value = JsonUtils::valueFromJson(node["value"], &error);
        if (!value) {
            addError(error + " at " + path);
            return ProcessFactory::nil();
        }
        return ProcessFactory::literal(*value);
    }
    if (type == "var") {
        std::string name = JsonUtils::getString(node, "name");
        if (name.empty()) {
            addError("Variable without name at " + path);
        }
        std::string mode = JsonUtils::getString(node, "mode", "copy");
        if (mode != "copy" && mode != "move") {
            addError("Unknown reference mode '" + mode + "' at " + path);
        }
        return ProcessFactory::var(name, mode == "move" ? ReferenceMode::MOVE : ReferenceMode::COPY);
    }
    if (type == "channel") {
        std::string name = JsonUtils::getString(node, "name");
        if (name.empty()) {
            addError("Channel without name at " + path);
        }
        return ProcessFactory::channel(name);
    }
    if (type == "quote") {
        return ProcessFactory::quote(parseRequiredProcess(node, "process", path));
    }
    if (type == "par") {
        return ProcessFactory::par(parseProcessList(node, "processes", path));
    }
    if (type == "new") {
        std::vector<std::string> names;
        if (JsonUtils::hasKey(node, "names") && node["names"].is_array()) {
            for (const auto &name : node["names"]) {
                if (!name.is_string()) {
                    addError("'names' must hold strings at " + path);
                    continue;
                }
                names.push_back(name.get<std::string>());
            }
        } else {
            addError("Missing 'names' array at " + path);
        }
        return ProcessFactory::newNames(std::move(names), parseRequiredProcess(node, "body", path));
    }
    if (type == "send") {
        return ProcessFactory::send(parseRequiredProcess(node, "channel", path), parseProcessList(node, "args", path),
                                    JsonUtils::getBool(node, "persistent", false));
    }
    if (type == "sendSync") {
        return ProcessFactory::sendSync(parseRequiredProcess(node, "channel", path),
                                        parseProcessList(node, "args", path),
                                        parseOptionalProcess(node, "continuation", path));
    }
    if (type == "receive") {
        std::string modeName = JsonUtils::getString(node, "mode", "oneShot");
        auto mode = receiveModeFromString(modeName);
        if (!mode) {
            addError("Unknown receive mode '" + modeName + "' at " + path);
            mode = ReceiveMode::ONE_SHOT;
        }
        std::vector<ReceiveBind> binds;
        if (JsonUtils::hasKey(node, "binds") && node["binds"].is_array() && !node["binds"].empty()) {
            for (size_t i = 0; i < node["binds"].size(); ++i) {
                binds.push_back(parseBind(node["binds"][i], indexed(child(path, "binds"), i)));
            }
        } else {
            addError("Receive needs a non-empty 'binds' array at " + path);
            return ProcessFactory::nil();
        }
        return ProcessFactory::receiveAll(std::move(binds), parseOptionalProcess(node, "body", path), *mode);
    }
    if (type == "contract") {
        return ProcessFactory::contract(parseRequiredProcess(node, "channel", path),
                                        parsePatternList(node, "patterns", path),
                                        parseOptionalProcess(node, "body", path));
    }
    if (type == "if") {
        return ProcessFactory::ifThenElse(parseRequiredProcess(node, "condition", path),
                                          parseRequiredProcess(node, "then", path),
                                          parseOptionalProcess(node, "else", path));
    }
    if (type == "match") {
        std::vector<MatchCase> cases;
        if (JsonUtils::hasKey(node, "cases") && node["cases"].is_array()) {
            for (size_t i = 0; i < node["cases"].size(); ++i) {
                const json &entry = node["cases"][i];
                std::string casePath = indexed(child(path, "cases"), i);
                if (!JsonUtils::hasKey(entry, "pattern")) {
                    addError("Missing 'pattern' at " + casePath);
                    continue;
                }
                cases.push_back(MatchCase{parsePattern(entry["pattern"], child(casePath, "pattern")),
                                          parseOptionalProcess(entry, "body", casePath)});
            }
        } else {
            addError("Missing 'cases' array at " + path);
        }
        return ProcessFactory::match(parseRequiredProcess(node, "expression", path), std::move(cases));
    }
    if (type == "select") {
        std::vector<SelectBranch> branches;
        if (JsonUtils::hasKey(node, "branches") && node["branches"].is_array()) {
            for (size_t i = 0; i < node["branches"].size(); ++i) {
                const json &entry = node["branches"][i];
                std::string branchPath = indexed(child(path, "branches"), i);
                if (!JsonUtils::hasKey(entry, "bind")) {
                    addError("Missing 'bind' at " + branchPath);
                    continue;
                }
                branches.push_back(SelectBranch{parseBind(entry["bind"], child(branchPath, "bind")),
                                                parseOptionalProcess(entry, "body", branchPath)});
            }
        } else {
            addError("Missing 'branches' array at " + path);
        }
        return ProcessFactory::select(std::move(branches));
    }
    if (type == "bundle") {
        std::string modeName = JsonUtils::getString(node, "mode", "rw");
        auto mode = bundleModeFromString(modeName);
        if (!mode) {
            addError("Unknown bundle mode '" + modeName + "' at " + path);
            mode = BundleMode::RW;
        }
        return ProcessFactory::bundle(*mode, parseRequiredProcess(node, "body", path));
    }
    if (type == "let") {
        std::vector<LetBinding> bindings;
        if (JsonUtils::hasKey(node, "bindings") && node["bindings"].is_array()) {
            for (size_t i = 0; i < node["bindings"].size(); ++i) {
                const json &entry = node["bindings"][i];
                std::string bindingPath = indexed(child(path, "bindings"), i);
                if (!JsonUtils::hasKey(entry, "pattern")) {
                    addError("Missing 'pattern' at " + bindingPath);
                    continue;
                }
                bindings.push_back(LetBinding{parsePattern(entry["pattern"], child(bindingPath, "pattern")),
                                              parseRequiredProcess(entry, "value", bindingPath)});
            }
        } else {
            addError("Missing 'bindings' array at " + path);
        }
        return ProcessFactory::let(std::move(bindings), parseOptionalProcess(node, "body", path));
    }
    if (type == "matches") {
        PatternPtr pattern = Pattern::wildcard();
        if (JsonUtils::hasKey(node, "pattern")) {
            pattern = parsePattern(node["pattern"], child(path, "pattern"));
        } else {
            addError("Missing 'pattern' at " + path);
        }
        return ProcessFactory::matches(parseRequiredProcess(node, "expression", path), pattern);
    }
    if (type == "binary") {
        std::string opName = JsonUtils::getString(node, "op");
        auto op = binaryOpFromString(opName);
        if (!op) {
            addError("Unknown binary operator '" + opName + "' at " + path);
            op = BinaryOp::ADD;
        }
        return ProcessFactory::binary(*op, parseRequiredProcess(node, "left", path),
                                      parseRequiredProcess(node, "right", path));
    }
    if (type == "unary") {
        std::string opName = JsonUtils::getString(node, "op");
        auto op = unaryOpFromString(opName);
        if (!op) {
            addError("Unknown unary operator '" + opName + "' at " + path);
            op = UnaryOp::NOT;
        }
        return ProcessFactory::unary(*op, parseRequiredProcess(node, "operand", path));
    }
    if (type == "method") {
        std::string name = JsonUtils::getString(node, "name");
        if (name.empty()) {
            addError("Method call without name at " + path);
        }
        return ProcessFactory::method(parseRequiredProcess(node, "receiver", path), name,
                                      parseProcessList(node, "args", path));
    }
    if (type == "list") {
        return parseCollection(node, CollectionKind::LIST, path);
    }
    if (type == "tuple") {
        return parseCollection(node, CollectionKind::TUPLE, path);
    }
    if (type == "set") {
        return parseCollection(node, CollectionKind::SET, path);
    }
    if (type == "map") {
        return parseCollection(node, CollectionKind::MAP, path);
    }

    addError("Unknown process type '" + type + "' at " + path);
    return ProcessFactory::nil();
}

ProcessPtr ProcessJsonParser::parseCollection(const json &node, CollectionKind kind, const std::string &path) {
    std::vector<ProcessPtr> elements;
    if (kind == CollectionKind::MAP) {
        // Entries are [key, value] pairs, flattened for the collection node
        if (JsonUtils::hasKey(node, "entries")) {
            const json &entries = node["entries"];
            for (size_t i = 0; entries.is_array() && i < entries.size(); ++i) {
                std::string entryPath = indexed(child(path, "entries"), i);
                if (!entries[i].is_array() || entries[i].size() != 2) {
                    addError("Map entry must be a [key, value] pair at " + entryPath);
                    continue;
                }
                elements.push_back(parseProcess(entries[i][0], indexed(entryPath, 0)));
                elements.push_back(parseProcess(entries[i][1], indexed(entryPath, 1)));
            }
        }
    } else {
        elements = parseProcessList(node, "elements", path);
    }

    auto remainder = parseRemainder(node);
    if (remainder && kind == CollectionKind::TUPLE) {
        addError("Tuples take no remainder at " + path);
        remainder.reset();
    }
    return ProcessFactory::collection(kind, std::move(elements), remainder);
}

ReceiveBind ProcessJsonParser::parseBind(const json &node, const std::string &path) {
    if (!node.is_object()) {
        addError("Bind must be an object at " + path);
        return ProcessFactory::bind({}, ProcessFactory::nil());
    }
    std::string sourceName = JsonUtils::getString(node, "source", "simple");
    auto source = sourceFromString(sourceName);
    if (!source) {
        addError("Unknown receive source '" + sourceName + "' at " + path);
        source = ReceiveSource::SIMPLE;
    }
    return ProcessFactory::bind(parsePatternList(node, "patterns", path), parseRequiredProcess(node, "channel", path),
                                *source, parseProcessList(node, "inputs", path));
}

std::vector<PatternPtr> ProcessJsonParser::parsePatternList(const json &node, const std::string &key,
                                                            const std::string &path) {
    std::vector<PatternPtr> result;
    if (!JsonUtils::hasKey(node, key)) {
        return result;
    }
    const json &list = node[key];
    if (!list.is_array()) {
        addError("'" + key + "' must be an array at " + path);
        return result;
    }
    for (size_t i = 0; i < list.size(); ++i) {
        result.push_back(parsePattern(list[i], indexed(child(path, key), i)));
    }
    return result;
}

PatternPtr ProcessJsonParser::parsePattern(const json &node, const std::string &path) {
    if (node.is_string()) {
        return Pattern::bind(node.get<std::string>());
    }
    if (!node.is_object()) {
        addError("Pattern must be a string or an object at " + path);
        return Pattern::wildcard();
    }

    std::string type = JsonUtils::getString(node, "type");
    if (type == "wildcard") {
        return Pattern::wildcard();
    }
    if (type == "bind") {
        return Pattern::bind(JsonUtils::getString(node, "name", "_"));
    }
    if (type == "literal") {
        std::string error;
        auto value = node.contains("value") ? JsonUtils::valueFromJson(node["value"], &error) : std::nullopt;
        if (!value) {
            addError((error.empty() ? std::string("Missing 'value'") : error) + " at " + path);
            return Pattern::wildcard();
        }
        return Pattern::literalValue(*value);
    }
    if (type == "list" || type == "tuple" || type == "set") {
        auto elements = parsePatternList(node, "elements", path);
        if (type == "list") {
            return Pattern::list(std::move(elements), parseRemainder(node));
        }
        if (type == "set") {
            return Pattern::set(std::move(elements), parseRemainder(node));
        }
        return Pattern::tuple(std::move(elements));
    }
    if (type == "map") {
        std::vector<std::pair<PatternPtr, PatternPtr>> entries;
        if (JsonUtils::hasKey(node, "entries")) {
            const json &list = node["entries"];
            for (size_t i = 0; list.is_array() && i < list.size(); ++i) {
                std::string entryPath = indexed(child(path, "entries"), i);
                if (!list[i].is_array() || list[i].size() != 2) {
                    addError("Map pattern entry must be a [key, value] pair at " + entryPath);
                    continue;
                }
                entries.emplace_back(parsePattern(list[i][0], indexed(entryPath, 0)),
                                     parsePattern(list[i][1], indexed(entryPath, 1)));
            }
        }
        return Pattern::map(std::move(entries), parseRemainder(node));
    }
    if (type == "and" || type == "or") {
        if (!JsonUtils::hasKey(node, "left") || !JsonUtils::hasKey(node, "right")) {
            addError("Pattern '" + type + "' needs 'left' and 'right' at " + path);
            return Pattern::wildcard();
        }
        PatternPtr left = parsePattern(node["left"], child(path, "left"));
        PatternPtr right = parsePattern(node["right"], child(path, "right"));
        return type == "and" ? Pattern::conjunction(left, right) : Pattern::disjunction(left, right);
    }
    if (type == "not") {
        if (!JsonUtils::hasKey(node, "operand")) {
            addError("Pattern 'not' needs 'operand' at " + path);
            return Pattern::wildcard();
        }
        return Pattern::negation(parsePattern(node["operand"], child(path, "operand")));
    }
    if (type == "varRef") {
        std::string name = JsonUtils::getString(node, "name");
        if (name.empty()) {
            addError("Value reference without name at " + path);
        }
        return Pattern::varRef(name);
    }
    if (type == "type") {
        std::string name = JsonUtils::getString(node, "name");
        auto simple = simpleTypeFromString(name);
        if (!simple) {
            addError("Unknown simple type '" + name + "' at " + path);
            return Pattern::wildcard();
        }
        return Pattern::typed(*simple);
    }

    addError("Unknown pattern type '" + type + "' at " + path);
    return Pattern::wildcard();
}

}  // namespace PCE
