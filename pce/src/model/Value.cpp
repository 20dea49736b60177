#include "model/Value.h"
#include <algorithm>
#include <type_traits>

namespace PCE {

namespace {

int compareSequences(const std::vector<Value> &a, const std::vector<Value> &b) {
    size_t common = std::min(a.size(), b.size());
    for (size_t i = 0; i < common; ++i) {
        int cmp = ValueUtils::compare(a[i], b[i]);
        if (cmp != 0) {
            return cmp;
        }
    }
    if (a.size() == b.size()) {
        return 0;
    }
    return a.size() < b.size() ? -1 : 1;
}

template <typename T> int threeWay(const T &a, const T &b) {
    if (a < b) {
        return -1;
    }
    return b < a ? 1 : 0;
}

std::string escapeString(const std::string &text) {
    std::string out;
    out.reserve(text.size() + 2);
    out += '"';
    for (char c : text) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out += c;
        }
    }
    out += '"';
    return out;
}

std::string joinValues(const std::vector<Value> &values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += ValueUtils::toString(values[i]);
    }
    return out;
}

}  // namespace

Value ValueUtils::makeList(std::vector<Value> elements) {
    auto list = std::make_shared<ValueList>();
    list->elements = std::move(elements);
    return std::shared_ptr<const ValueList>(std::move(list));
}

Value ValueUtils::makeTuple(std::vector<Value> elements) {
    auto tuple = std::make_shared<ValueTuple>();
    tuple->elements = std::move(elements);
    return std::shared_ptr<const ValueTuple>(std::move(tuple));
}

Value ValueUtils::makeSet(std::vector<Value> elements) {
    std::stable_sort(elements.begin(), elements.end(),
                     [](const Value &a, const Value &b) { return compare(a, b) < 0; });
    auto last = std::unique(elements.begin(), elements.end(),
                            [](const Value &a, const Value &b) { return compare(a, b) == 0; });
    elements.erase(last, elements.end());

    auto set = std::make_shared<ValueSet>();
    set->elements = std::move(elements);
    return std::shared_ptr<const ValueSet>(std::move(set));
}

Value ValueUtils::makeMap(std::vector<std::pair<Value, Value>> entries) {
    // Stable sort keeps insertion order among equal keys so the last one can win
    std::stable_sort(entries.begin(), entries.end(),
                     [](const auto &a, const auto &b) { return compare(a.first, b.first) < 0; });

    std::vector<std::pair<Value, Value>> unique;
    unique.reserve(entries.size());
    for (auto &entry : entries) {
        if (!unique.empty() && compare(unique.back().first, entry.first) == 0) {
            unique.back().second = std::move(entry.second);
        } else {
            unique.push_back(std::move(entry));
        }
    }

    auto map = std::make_shared<ValueMap>();
    map->entries = std::move(unique);
    return std::shared_ptr<const ValueMap>(std::move(map));
}

int ValueUtils::compare(const Value &a, const Value &b) {
    if (a.index() != b.index()) {
        return a.index() < b.index() ? -1 : 1;
    }

    return std::visit(
        [&b](const auto &lhs) -> int {
            using T = std::decay_t<decltype(lhs)>;
            const auto &rhs = std::get<T>(b);
            if constexpr (std::is_same_v<T, NilValue>) {
                return 0;
            } else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, int64_t> ||
                                 std::is_same_v<T, std::string>) {
                return threeWay(lhs, rhs);
            } else if constexpr (std::is_same_v<T, ChannelName>) {
                if (lhs.unforgeable != rhs.unforgeable) {
                    return lhs.unforgeable ? 1 : -1;
                }
                return threeWay(lhs.id, rhs.id);
            } else if constexpr (std::is_same_v<T, std::shared_ptr<const ValueMap>>) {
                size_t common = std::min(lhs->entries.size(), rhs->entries.size());
                for (size_t i = 0; i < common; ++i) {
                    int cmp = compare(lhs->entries[i].first, rhs->entries[i].first);
                    if (cmp == 0) {
                        cmp = compare(lhs->entries[i].second, rhs->entries[i].second);
                    }
                    if (cmp != 0) {
                        return cmp;
                    }
                }
                return threeWay(lhs->entries.size(), rhs->entries.size());
            } else {
                return compareSequences(lhs->elements, rhs->elements);
            }
        },
        a);
}

std::string ValueUtils::typeName(const Value &value) {
    switch (value.index()) {
    case 0:
        return "Nil";
    case 1:
        return "Bool";
    case 2:
        return "Int";
    case 3:
        return "String";
    case 4:
        return "Name";
    case 5:
        return "List";
    case 6:
        return "Tuple";
    case 7:
        return "Set";
    case 8:
        return "Map";
    default:
        return "Unknown";
    }
}

std::string ValueUtils::toString(const Value &value) {
    return std::visit(
        [](const auto &v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, NilValue>) {
                return "Nil";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return std::to_string(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return escapeString(v);
            } else if constexpr (std::is_same_v<T, ChannelName>) {
                return v.unforgeable ? "Unforgeable(" + v.id + ")" : "@" + v.id;
            } else if constexpr (std::is_same_v<T, std::shared_ptr<const ValueList>>) {
                return "[" + joinValues(v->elements) + "]";
            } else if constexpr (std::is_same_v<T, std::shared_ptr<const ValueTuple>>) {
                // Single element tuples keep the trailing comma
                return v->elements.size() == 1 ? "(" + toString(v->elements[0]) + ",)"
                                               : "(" + joinValues(v->elements) + ")";
            } else if constexpr (std::is_same_v<T, std::shared_ptr<const ValueSet>>) {
                return "Set(" + joinValues(v->elements) + ")";
            } else {
                std::string out = "{";
                for (size_t i = 0; i < v->entries.size(); ++i) {
                    if (i > 0) {
                        out += ", ";
                    }
                    out += toString(v->entries[i].first) + ": " + toString(v->entries[i].second);
                }
                return out + "}";
            }
        },
        value);
}

std::string ValueUtils::payloadToString(const Payload &payload) {
    return "(" + joinValues(payload) + ")";
}

ChannelName ValueUtils::quote(const Value &value) {
    if (const auto *name = asChannel(value)) {
        return *name;
    }
    return ChannelName(toString(value), false);
}

const ChannelName *ValueUtils::asChannel(const Value &value) {
    return std::get_if<ChannelName>(&value);
}

std::optional<int64_t> ValueUtils::asInt(const Value &value) {
    if (const auto *i = std::get_if<int64_t>(&value)) {
        return *i;
    }
    return std::nullopt;
}

std::optional<bool> ValueUtils::asBool(const Value &value) {
    if (const auto *b = std::get_if<bool>(&value)) {
        return *b;
    }
    return std::nullopt;
}

const std::string *ValueUtils::asString(const Value &value) {
    return std::get_if<std::string>(&value);
}

const std::vector<Value> *ValueUtils::sequenceElements(const Value &value) {
    if (const auto *list = std::get_if<std::shared_ptr<const ValueList>>(&value)) {
        return &(*list)->elements;
    }
    if (const auto *tuple = std::get_if<std::shared_ptr<const ValueTuple>>(&value)) {
        return &(*tuple)->elements;
    }
    if (const auto *set = std::get_if<std::shared_ptr<const ValueSet>>(&value)) {
        return &(*set)->elements;
    }
    return nullptr;
}

const ValueMap *ValueUtils::asMap(const Value &value) {
    if (const auto *map = std::get_if<std::shared_ptr<const ValueMap>>(&value)) {
        return map->get();
    }
    return nullptr;
}

bool ValueUtils::isCollection(const Value &value) {
    return value.index() >= 5;
}

}  // namespace PCE
