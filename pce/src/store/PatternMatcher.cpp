#include "store/PatternMatcher.h"

namespace PCE {

std::optional<BindingList> PatternMatcher::match(const Pattern &pattern, const Value &value, const Environment &env) {
    BindingList bindings;
    if (!matchInto(pattern, value, env, bindings)) {
        return std::nullopt;
    }
    return bindings;
}

std::optional<BindingList> PatternMatcher::matchPayload(const std::vector<PatternPtr> &patterns,
                                                        const Payload &payload, const Environment &env) {
    if (patterns.size() != payload.size()) {
        return std::nullopt;
    }

    BindingList bindings;
    for (size_t i = 0; i < patterns.size(); ++i) {
        if (!matchInto(*patterns[i], payload[i], env, bindings)) {
            return std::nullopt;
        }
    }
    return bindings;
}

bool PatternMatcher::addBinding(BindingList &bindings, const std::string &name, const Value &value) {
    if (name == "_") {
        return true;
    }
    for (const auto &[bound, existing] : bindings) {
        if (bound == name) {
            return ValueUtils::equals(existing, value);
        }
    }
    bindings.emplace_back(name, value);
    return true;
}

bool PatternMatcher::matchInto(const Pattern &pattern, const Value &value, const Environment &env,
                               BindingList &bindings) {
    switch (pattern.kind) {
    case PatternKind::WILDCARD:
        return true;

    case PatternKind::BIND:
        return addBinding(bindings, pattern.name, value);

    case PatternKind::LITERAL:
        return ValueUtils::equals(pattern.literal, value);

    case PatternKind::VAR_REF: {
        auto bound = env.lookup(pattern.name);
        return bound && ValueUtils::equals(*bound, value);
    }

    case PatternKind::TYPE:
        switch (pattern.simpleType) {
        case SimpleType::BOOL:
            return std::holds_alternative<bool>(value);
        case SimpleType::INT:
            return std::holds_alternative<int64_t>(value);
        case SimpleType::STRING:
            return std::holds_alternative<std::string>(value);
        case SimpleType::NAME:
            return std::holds_alternative<ChannelName>(value);
        }
        return false;

    case PatternKind::CONJUNCTION: {
        BindingList scratch = bindings;
        for (const auto &operand : pattern.elements) {
            if (!matchInto(*operand, value, env, scratch)) {
                return false;
            }
        }
        bindings = std::move(scratch);
        return true;
    }

    case PatternKind::DISJUNCTION:
        // Bindings made inside a disjunct are discarded
        for (const auto &operand : pattern.elements) {
            BindingList scratch = bindings;
            if (matchInto(*operand, value, env, scratch)) {
                return true;
            }
        }
        return false;

    case PatternKind::NEGATION: {
        BindingList scratch = bindings;
        return !matchInto(*pattern.elements.front(), value, env, scratch);
    }

    case PatternKind::COLLECTION:
        return matchCollection(pattern, value, env, bindings);
    }
    return false;
}

bool PatternMatcher::matchCollection(const Pattern &pattern, const Value &value, const Environment &env,
                                     BindingList &bindings) {
    switch (pattern.collection) {
    case CollectionKind::LIST:
    case CollectionKind::TUPLE: {
        bool isList = pattern.collection == CollectionKind::LIST;
        if (isList ? !std::holds_alternative<std::shared_ptr<const ValueList>>(value)
                   : !std::holds_alternative<std::shared_ptr<const ValueTuple>>(value)) {
            return false;
        }
        const auto &elements = *ValueUtils::sequenceElements(value);
        if (pattern.remainder ? elements.size() < pattern.elements.size()
                              : elements.size() != pattern.elements.size()) {
            return false;
        }

        BindingList scratch = bindings;
        for (size_t i = 0; i < pattern.elements.size(); ++i) {
            if (!matchInto(*pattern.elements[i], elements[i], env, scratch)) {
                return false;
            }
        }
        if (pattern.remainder) {
            std::vector<Value> rest(elements.begin() + static_cast<std::ptrdiff_t>(pattern.elements.size()),
                                    elements.end());
            if (!addBinding(scratch, *pattern.remainder, ValueUtils::makeList(std::move(rest)))) {
                return false;
            }
        }
        bindings = std::move(scratch);
        return true;
    }

    case CollectionKind::SET: {
        if (!std::holds_alternative<std::shared_ptr<const ValueSet>>(value)) {
            return false;
        }
        const auto &elements = *ValueUtils::sequenceElements(value);
        if (pattern.remainder ? elements.size() < pattern.elements.size()
                              : elements.size() != pattern.elements.size()) {
            return false;
        }
        std::vector<bool> used(elements.size(), false);
        return matchSetElements(pattern, elements, 0, used, env, bindings);
    }

    case CollectionKind::MAP: {
        const ValueMap *map = ValueUtils::asMap(value);
        if (!map) {
            return false;
        }
        if (pattern.remainder ? map->entries.size() < pattern.entries.size()
                              : map->entries.size() != pattern.entries.size()) {
            return false;
        }
        std::vector<bool> used(map->entries.size(), false);
        return matchMapEntries(pattern, *map, 0, used, env, bindings);
    }
    }
    return false;
}

// Backtracking assignment of set element patterns to distinct elements
bool PatternMatcher::matchSetElements(const Pattern &pattern, const std::vector<Value> &elements,
                                      size_t patternIndex, std::vector<bool> &used, const Environment &env,
                                      BindingList &bindings) {
    if (patternIndex == pattern.elements.size()) {
        if (!pattern.remainder) {
            return true;
        }
        std::vector<Value> rest;
        for (size_t i = 0; i < elements.size(); ++i) {
            if (!used[i]) {
                rest.push_back(elements[i]);
            }
        }
        return addBinding(bindings, *pattern.remainder, ValueUtils::makeSet(std::move(rest)));
    }

    for (size_t i = 0; i < elements.size(); ++i) {
        if (used[i]) {
            continue;
        }
        BindingList scratch = bindings;
        if (!matchInto(*pattern.elements[patternIndex], elements[i], env, scratch)) {
            continue;
        }
        used[i] = true;
        if (matchSetElements(pattern, elements, patternIndex + 1, used, env, scratch)) {
            bindings = std::move(scratch);
            return true;
        }
        used[i] = false;
    }
    return false;
}

bool PatternMatcher::matchMapEntries(const Pattern &pattern, const ValueMap &map, size_t patternIndex,
                                     std::vector<bool> &used, const Environment &env, BindingList &bindings) {
    if (patternIndex == pattern.entries.size()) {
        if (!pattern.remainder) {
            return true;
        }
        std::vector<std::pair<Value, Value>> rest;
        for (size_t i = 0; i < map.entries.size(); ++i) {
            if (!used[i]) {
                rest.push_back(map.entries[i]);
            }
        }
        return addBinding(bindings, *pattern.remainder, ValueUtils::makeMap(std::move(rest)));
    }

    const auto &[keyPattern, valuePattern] = pattern.entries[patternIndex];
    for (size_t i = 0; i < map.entries.size(); ++i) {
        if (used[i]) {
            continue;
        }
        BindingList scratch = bindings;
        if (!matchInto(*keyPattern, map.entries[i].first, env, scratch) ||
            !matchInto(*valuePattern, map.entries[i].second, env, scratch)) {
            continue;
        }
        used[i] = true;
        if (matchMapEntries(pattern, map, patternIndex + 1, used, env, scratch)) {
            bindings = std::move(scratch);
            return true;
        }
        used[i] = false;
    }
    return false;
}

}  // namespace PCE
