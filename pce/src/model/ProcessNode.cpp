#include "model/ProcessNode.h"

namespace PCE {

std::string ProcessNode::constructName() const {
    static const char *const names[] = {"nil",    "literal", "var",     "quote", "par",  "new",    "send",
                                        "send-sync", "receive", "if",   "match", "select", "bundle", "let",
                                        "matches", "binary", "unary", "method", "collection"};
    static_assert(sizeof(names) / sizeof(names[0]) == std::variant_size_v<Variant>);
    return names[node.index()];
}

const char *toString(BinaryOp op) {
    switch (op) {
    case BinaryOp::OR:
        return "or";
    case BinaryOp::AND:
        return "and";
    case BinaryOp::EQ:
        return "==";
    case BinaryOp::NEQ:
        return "!=";
    case BinaryOp::LT:
        return "<";
    case BinaryOp::LTE:
        return "<=";
    case BinaryOp::GT:
        return ">";
    case BinaryOp::GTE:
        return ">=";
    case BinaryOp::CONCAT:
        return "++";
    case BinaryOp::DIFF:
        return "--";
    case BinaryOp::ADD:
        return "+";
    case BinaryOp::SUB:
        return "-";
    case BinaryOp::INTERPOLATION:
        return "%%";
    case BinaryOp::MULT:
        return "*";
    case BinaryOp::DIV:
        return "/";
    case BinaryOp::MOD:
        return "%";
    case BinaryOp::CONJUNCTION:
        return "/\\";
    case BinaryOp::DISJUNCTION:
        return "\\/";
    }
    return "?";
}

const char *toString(UnaryOp op) {
    switch (op) {
    case UnaryOp::NOT:
        return "not";
    case UnaryOp::NEG:
        return "-";
    case UnaryOp::NEGATION:
        return "~";
    }
    return "?";
}

const char *toString(ReceiveSource source) {
    switch (source) {
    case ReceiveSource::SIMPLE:
        return "simple";
    case ReceiveSource::RECEIVE_SEND:
        return "receive-send";
    case ReceiveSource::SEND_RECEIVE:
        return "send-receive";
    }
    return "?";
}

}  // namespace PCE
