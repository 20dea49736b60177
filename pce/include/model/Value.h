#pragma once

#include "types.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace PCE {

/**
 * @brief Forward declarations for composite value types
 */
struct ValueList;
struct ValueTuple;
struct ValueSet;
struct ValueMap;

/**
 * @brief The Nil process / unit value
 */
struct NilValue {};

/**
 * @brief Channel identifier
 *
 * Unforgeable names are minted by `new` (and for reply channels of synchronous
 * sends); public names come from quoting a ground value, e.g. `@"stdout"`.
 * Two names are equal only when both the id and the forgeability match, so an
 * external caller can never address an unforgeable channel by spelling its id.
 */
struct ChannelName {
    std::string id;
    bool unforgeable = false;

    ChannelName() = default;

    explicit ChannelName(std::string channelId, bool isUnforgeable = false)
        : id(std::move(channelId)), unforgeable(isUnforgeable) {}

    /**
     * @brief Key used by the channel store and capability tables
     */
    std::string key() const {
        return unforgeable ? "unf:" + id : "@" + id;
    }

    bool operator==(const ChannelName &other) const {
        return id == other.id && unforgeable == other.unforgeable;
    }
};

/**
 * @brief Runtime value of the process calculus
 *
 * Composite values are immutable and shared between environments, payloads
 * and the channel store.
 */
using Value = std::variant<NilValue,                               // Nil
                           bool,                                   // Bool
                           int64_t,                                // Int
                           std::string,                            // String
                           ChannelName,                            // Name
                           std::shared_ptr<const ValueList>,       // [a, b]
                           std::shared_ptr<const ValueTuple>,      // (a, b)
                           std::shared_ptr<const ValueSet>,        // Set(a, b)
                           std::shared_ptr<const ValueMap>         // {k: v}
                           >;

struct ValueList {
    std::vector<Value> elements;
};

struct ValueTuple {
    std::vector<Value> elements;
};

/**
 * @brief Set value, elements kept sorted and unique under ValueUtils::compare
 */
struct ValueSet {
    std::vector<Value> elements;
};

/**
 * @brief Map value, entries kept sorted by key and unique under ValueUtils::compare
 */
struct ValueMap {
    std::vector<std::pair<Value, Value>> entries;
};

/**
 * @brief Message payload: the ordered arguments of one send
 */
using Payload = std::vector<Value>;

/**
 * @brief Ordered name/value pairs produced by a pattern match
 */
using BindingList = std::vector<std::pair<std::string, Value>>;

/**
 * @brief Construction, comparison and printing helpers for Value
 */
class ValueUtils {
public:
    static Value nil() {
        return NilValue{};
    }

    static Value fromBool(bool value) {
        return Value(std::in_place_type<bool>, value);
    }

    static Value fromInt(int64_t value) {
        return Value(std::in_place_type<int64_t>, value);
    }

    static Value fromString(std::string value) {
        return Value(std::in_place_type<std::string>, std::move(value));
    }

    static Value fromChannel(ChannelName name) {
        return Value(std::in_place_type<ChannelName>, std::move(name));
    }

    static Value makeList(std::vector<Value> elements);
    static Value makeTuple(std::vector<Value> elements);

    /**
     * @brief Build a set, sorting and removing duplicates
     */
    static Value makeSet(std::vector<Value> elements);

    /**
     * @brief Build a map, sorting by key; for duplicate keys the last entry wins
     */
    static Value makeMap(std::vector<std::pair<Value, Value>> entries);

    /**
     * @brief Total structural order over values
     *
     * Values of different kinds order by kind (Nil < Bool < Int < String <
     * Name < List < Tuple < Set < Map); values of the same kind order
     * lexicographically.
     *
     * @return negative, zero or positive like strcmp
     */
    static int compare(const Value &a, const Value &b);

    static bool equals(const Value &a, const Value &b) {
        return compare(a, b) == 0;
    }

    /**
     * @brief Human readable type name ("Int", "List", ...)
     */
    static std::string typeName(const Value &value);

    /**
     * @brief Render a value in process-calculus surface syntax
     */
    static std::string toString(const Value &value);

    static std::string payloadToString(const Payload &payload);

    /**
     * @brief Quote a ground value into a public channel name (`@value`)
     *
     * Quoting a channel name yields that same channel.
     */
    static ChannelName quote(const Value &value);

    static const ChannelName *asChannel(const Value &value);
    static std::optional<int64_t> asInt(const Value &value);
    static std::optional<bool> asBool(const Value &value);
    static const std::string *asString(const Value &value);

    /**
     * @brief Elements of a list, tuple or set; nullptr for other kinds
     */
    static const std::vector<Value> *sequenceElements(const Value &value);
    static const ValueMap *asMap(const Value &value);

    static bool isCollection(const Value &value);
};

}  // namespace PCE
