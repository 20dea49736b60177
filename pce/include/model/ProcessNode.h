#pragma once

#include "model/Pattern.h"
#include "model/Value.h"
#include "types.h"
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace PCE {

struct ProcessNode;
using ProcessPtr = std::shared_ptr<const ProcessNode>;

enum class BinaryOp {
    OR,
    AND,
    EQ,
    NEQ,
    LT,
    LTE,
    GT,
    GTE,
    CONCAT,         // ++
    DIFF,           // --
    ADD,
    SUB,
    INTERPOLATION,  // %%
    MULT,
    DIV,
    MOD,
    CONJUNCTION,    // p /\ q over booleans
    DISJUNCTION     // p \/ q over booleans
};

enum class UnaryOp { NOT, NEG, NEGATION };

/**
 * @brief Where a receive gets its message from
 */
enum class ReceiveSource {
    SIMPLE,        // x <- ch
    RECEIVE_SEND,  // x <- ch?!  (sender appended an acknowledgement channel)
    SEND_RECEIVE   // x <- ch!?(args)  (publish args plus a reply channel, then read the reply)
};

struct NilNode {};

struct LiteralNode {
    Value value;
};

struct VarNode {
    std::string name;
    ReferenceMode mode = ReferenceMode::COPY;
};

struct QuoteNode {
    ProcessPtr process;
};

struct ParNode {
    std::vector<ProcessPtr> processes;
};

struct NewNode {
    std::vector<std::string> names;
    ProcessPtr body;
};

struct SendNode {
    ProcessPtr channel;
    std::vector<ProcessPtr> args;
    bool persistent = false;
};

struct SendSyncNode {
    ProcessPtr channel;
    std::vector<ProcessPtr> args;
    ProcessPtr continuation;  // may be null
};

/**
 * @brief One `patterns <- channel` receipt of a for/contract/select
 */
struct ReceiveBind {
    std::vector<PatternPtr> patterns;
    ProcessPtr channel;
    ReceiveSource source = ReceiveSource::SIMPLE;
    std::vector<ProcessPtr> inputs;  // SEND_RECEIVE only
};

struct ReceiveNode {
    ReceiveBind bind;
    ReceiveMode mode = ReceiveMode::ONE_SHOT;
    ProcessPtr body;
};

struct IfNode {
    ProcessPtr condition;
    ProcessPtr thenBranch;
    ProcessPtr elseBranch;  // may be null
};

struct MatchCase {
    PatternPtr pattern;
    ProcessPtr body;
};

struct MatchNode {
    ProcessPtr expression;
    std::vector<MatchCase> cases;
};

struct SelectBranch {
    ReceiveBind bind;
    ProcessPtr body;
};

struct SelectNode {
    std::vector<SelectBranch> branches;
};

struct BundleNode {
    BundleMode mode = BundleMode::RW;
    ProcessPtr body;
};

struct LetBinding {
    PatternPtr pattern;
    ProcessPtr value;
};

struct LetNode {
    std::vector<LetBinding> bindings;
    ProcessPtr body;
};

struct MatchesNode {
    ProcessPtr expression;
    PatternPtr pattern;
};

struct BinaryNode {
    BinaryOp op = BinaryOp::ADD;
    ProcessPtr left;
    ProcessPtr right;
};

struct UnaryNode {
    UnaryOp op = UnaryOp::NOT;
    ProcessPtr operand;
};

struct MethodNode {
    ProcessPtr receiver;
    std::string name;
    std::vector<ProcessPtr> args;
};

/**
 * @brief Collection literal
 *
 * Map literals store keys and values alternately in `elements`.
 */
struct CollectionNode {
    CollectionKind kind = CollectionKind::LIST;
    std::vector<ProcessPtr> elements;
    std::optional<std::string> remainder;
};

/**
 * @brief Immutable process term
 *
 * A closed sum over the constructs of the calculus. Expression constructs
 * (literals, operators, collections) are processes that terminate with a
 * value.
 */
struct ProcessNode {
    using Variant = std::variant<NilNode, LiteralNode, VarNode, QuoteNode, ParNode, NewNode, SendNode, SendSyncNode,
                                 ReceiveNode, IfNode, MatchNode, SelectNode, BundleNode, LetNode, MatchesNode,
                                 BinaryNode, UnaryNode, MethodNode, CollectionNode>;

    Variant node;

    template <typename T> const T *as() const {
        return std::get_if<T>(&node);
    }

    template <typename T> bool is() const {
        return std::holds_alternative<T>(node);
    }

    /**
     * @brief Short construct name for logs ("send", "par", ...)
     */
    std::string constructName() const;
};

const char *toString(BinaryOp op);
const char *toString(UnaryOp op);
const char *toString(ReceiveSource source);

}  // namespace PCE
