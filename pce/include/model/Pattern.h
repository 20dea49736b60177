#pragma once

#include "model/Value.h"
#include "types.h"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace PCE {

enum class PatternKind {
    WILDCARD,     // _
    BIND,         // x
    LITERAL,      // 42, "a", @"ch"
    COLLECTION,   // [p, q ...rest], (p, q), Set(p ...rest), {k: p ...rest}
    CONJUNCTION,  // p /\ q
    DISJUNCTION,  // p \/ q
    NEGATION,     // ~p
    VAR_REF,      // =x
    TYPE          // Bool, Int, String, Name
};

enum class SimpleType { BOOL, INT, STRING, NAME };

struct Pattern;
using PatternPtr = std::shared_ptr<const Pattern>;

/**
 * @brief Structural pattern matched against values and message payloads
 *
 * Patterns are immutable and shared between the process tree, receive
 * registrations in the channel store and match cases.
 */
struct Pattern {
    PatternKind kind = PatternKind::WILDCARD;

    // BIND and VAR_REF: variable name
    std::string name;

    // LITERAL: the ground value to compare against
    Value literal;

    // COLLECTION: kind of collection accepted
    CollectionKind collection = CollectionKind::LIST;

    // COLLECTION (list/tuple/set elements) and CONJUNCTION/DISJUNCTION/NEGATION operands
    std::vector<PatternPtr> elements;

    // COLLECTION (map): key/value pattern pairs
    std::vector<std::pair<PatternPtr, PatternPtr>> entries;

    // COLLECTION: `...rest` remainder, "_" discards it
    std::optional<std::string> remainder;

    // TYPE: accepted simple type
    SimpleType simpleType = SimpleType::BOOL;

    static PatternPtr wildcard();
    static PatternPtr bind(const std::string &name);
    static PatternPtr literalValue(const Value &value);
    static PatternPtr list(std::vector<PatternPtr> elements, std::optional<std::string> remainder = std::nullopt);
    static PatternPtr tuple(std::vector<PatternPtr> elements);
    static PatternPtr set(std::vector<PatternPtr> elements, std::optional<std::string> remainder = std::nullopt);
    static PatternPtr map(std::vector<std::pair<PatternPtr, PatternPtr>> entries,
                          std::optional<std::string> remainder = std::nullopt);
    static PatternPtr conjunction(PatternPtr left, PatternPtr right);
    static PatternPtr disjunction(PatternPtr left, PatternPtr right);
    static PatternPtr negation(PatternPtr operand);
    static PatternPtr varRef(const std::string &name);
    static PatternPtr typed(SimpleType type);

    /**
     * @brief Names bound by a successful match, in first-occurrence order
     *
     * Disjunction and negation operands never contribute bindings.
     */
    std::vector<std::string> boundNames() const;

    /**
     * @brief Surface-syntax rendering used in logs and error reports
     */
    std::string describe() const;
};

std::string describePatterns(const std::vector<PatternPtr> &patterns);

}  // namespace PCE
