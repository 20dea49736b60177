#pragma once

#include "model/Environment.h"
#include "model/Pattern.h"
#include "model/Value.h"
#include <optional>
#include <vector>

namespace PCE {

/**
 * @brief Structural pattern matching over values and payloads
 *
 * A failed match is not an error; it yields std::nullopt and the caller tries
 * its next candidate. Matching is a pure function of its inputs.
 */
class PatternMatcher {
public:
    /**
     * @brief Match one value against one pattern
     *
     * @param env Scope used to resolve value references (`=x`)
     * @return Bindings in first-occurrence order, or nullopt when the value does not match
     */
    static std::optional<BindingList> match(const Pattern &pattern, const Value &value, const Environment &env);

    /**
     * @brief Match a message payload positionally against a receive's patterns
     *
     * Arity must agree exactly. A name bound in two positions must bind equal
     * values.
     */
    static std::optional<BindingList> matchPayload(const std::vector<PatternPtr> &patterns, const Payload &payload,
                                                   const Environment &env);

private:
    static bool matchInto(const Pattern &pattern, const Value &value, const Environment &env, BindingList &bindings);
    static bool addBinding(BindingList &bindings, const std::string &name, const Value &value);
    static bool matchCollection(const Pattern &pattern, const Value &value, const Environment &env,
                                BindingList &bindings);
    static bool matchSetElements(const Pattern &pattern, const std::vector<Value> &elements, size_t patternIndex,
                                 std::vector<bool> &used, const Environment &env, BindingList &bindings);
    static bool matchMapEntries(const Pattern &pattern, const ValueMap &map, size_t patternIndex,
                                std::vector<bool> &used, const Environment &env, BindingList &bindings);
};

}  // namespace PCE
