#include "common/JsonUtils.h"
#include "common/Logger.h"
#include <fstream>
#include <sstream>

namespace PCE {

std::optional<json> JsonUtils::parseJson(const std::string &jsonString, std::string *errorOut) {
    if (jsonString.empty()) {
        if (errorOut) {
            *errorOut = "Empty JSON string";
        }
        return std::nullopt;
    }

    try {
        return json::parse(jsonString);
    } catch (const json::parse_error &e) {
        if (errorOut) {
            *errorOut = e.what();
        }
        LOG_DEBUG("JsonUtils: Failed to parse JSON: {}", e.what());
        return std::nullopt;
    }
}

std::optional<json> JsonUtils::parseFile(const std::string &path, std::string *errorOut) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        if (errorOut) {
            *errorOut = "Failed to open file: " + path;
        }
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseJson(buffer.str(), errorOut);
}

std::string JsonUtils::toCompactString(const json &value) {
    return value.dump();
}

std::string JsonUtils::toPrettyString(const json &value) {
    return value.dump(2);
}

std::string JsonUtils::getString(const json &object, const std::string &key, const std::string &defaultValue) {
    if (!object.is_object() || !object.contains(key)) {
        return defaultValue;
    }

    const auto &value = object[key];
    if (!value.is_string()) {
        return defaultValue;
    }

    return value.get<std::string>();
}

int64_t JsonUtils::getInt(const json &object, const std::string &key, int64_t defaultValue) {
    if (!object.is_object() || !object.contains(key)) {
        return defaultValue;
    }

    const auto &value = object[key];
    if (!value.is_number_integer()) {
        return defaultValue;
    }

    return value.get<int64_t>();
}

bool JsonUtils::getBool(const json &object, const std::string &key, bool defaultValue) {
    if (!object.is_object() || !object.contains(key)) {
        return defaultValue;
    }

    const auto &value = object[key];
    if (!value.is_boolean()) {
        return defaultValue;
    }

    return value.get<bool>();
}

bool JsonUtils::hasKey(const json &object, const std::string &key) {
    return object.is_object() && object.contains(key) && !object[key].is_null();
}

json JsonUtils::valueToJson(const Value &value) {
    if (std::holds_alternative<NilValue>(value)) {
        return nullptr;
    }
    if (auto b = ValueUtils::asBool(value)) {
        return *b;
    }
    if (auto i = ValueUtils::asInt(value)) {
        return *i;
    }
    if (const auto *s = ValueUtils::asString(value)) {
        return *s;
    }
    if (const auto *name = ValueUtils::asChannel(value)) {
        return json{{"@name", name->id}, {"unforgeable", name->unforgeable}};
    }
    if (const auto *map = ValueUtils::asMap(value)) {
        bool stringKeys = true;
        for (const auto &entry : map->entries) {
            stringKeys = stringKeys && ValueUtils::asString(entry.first) != nullptr;
        }
        if (stringKeys) {
            json object = json::object();
            for (const auto &[key, item] : map->entries) {
                object[*ValueUtils::asString(key)] = valueToJson(item);
            }
            return object;
        }
        json pairs = json::array();
        for (const auto &[key, item] : map->entries) {
            pairs.push_back(json::array({valueToJson(key), valueToJson(item)}));
        }
        return json{{"@map", pairs}};
    }

    json elements = json::array();
    for (const auto &element : *ValueUtils::sequenceElements(value)) {
        elements.push_back(valueToJson(element));
    }
    if (std::holds_alternative<std::shared_ptr<const ValueTuple>>(value)) {
        return json{{"@tuple", elements}};
    }
    if (std::holds_alternative<std::shared_ptr<const ValueSet>>(value)) {
        return json{{"@set", elements}};
    }
    return elements;
}

std::optional<Value> JsonUtils::valueFromJson(const json &value, std::string *errorOut) {
    auto fail = [errorOut](const std::string &message) -> std::optional<Value> {
        if (errorOut) {
            *errorOut = message;
        }
        return std::nullopt;
    };

    switch (value.type()) {
    case json::value_t::null:
        return ValueUtils::nil();
    case json::value_t::boolean:
        return ValueUtils::fromBool(value.get<bool>());
    case json::value_t::number_integer:
        return ValueUtils::fromInt(value.get<int64_t>());
    case json::value_t::number_unsigned: {
        auto raw = value.get<uint64_t>();
        if (raw > static_cast<uint64_t>(INT64_MAX)) {
            return fail("Integer out of range: " + value.dump());
        }
        return ValueUtils::fromInt(static_cast<int64_t>(raw));
    }
    case json::value_t::number_float:
        return fail("Floating point numbers are not supported: " + value.dump());
    case json::value_t::string:
        return ValueUtils::fromString(value.get<std::string>());
    case json::value_t::array: {
        std::vector<Value> elements;
        for (const auto &item : value) {
            auto element = valueFromJson(item, errorOut);
            if (!element) {
                return std::nullopt;
            }
            elements.push_back(std::move(*element));
        }
        return ValueUtils::makeList(std::move(elements));
    }
    case json::value_t::object: {
        std::vector<std::pair<Value, Value>> entries;
        for (auto it = value.begin(); it != value.end(); ++it) {
            auto element = valueFromJson(it.value(), errorOut);
            if (!element) {
                return std::nullopt;
            }
            entries.emplace_back(ValueUtils::fromString(it.key()), std::move(*element));
        }
        return ValueUtils::makeMap(std::move(entries));
    }
    default:
        return fail("Unsupported JSON value: " + value.dump());
    }
}

}  // namespace PCE
