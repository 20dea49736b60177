#include "runtime/Operators.h"
#include <algorithm>

namespace PCE {

namespace {

std::string typeError(const char *op, const Value &left, const Value &right) {
    return std::string("operator ") + op + " not defined for " + ValueUtils::typeName(left) + " and " +
           ValueUtils::typeName(right);
}

std::string plainText(const Value &value) {
    if (const auto *s = ValueUtils::asString(value)) {
        return *s;
    }
    return ValueUtils::toString(value);
}

bool isList(const Value &value) {
    return std::holds_alternative<std::shared_ptr<const ValueList>>(value);
}

bool isSet(const Value &value) {
    return std::holds_alternative<std::shared_ptr<const ValueSet>>(value);
}

bool isTuple(const Value &value) {
    return std::holds_alternative<std::shared_ptr<const ValueTuple>>(value);
}

bool containsValue(const std::vector<Value> &elements, const Value &value) {
    return std::any_of(elements.begin(), elements.end(),
                       [&value](const Value &element) { return ValueUtils::equals(element, value); });
}

std::optional<int64_t> intArg(const std::vector<Value> &args, size_t index) {
    return index < args.size() ? ValueUtils::asInt(args[index]) : std::nullopt;
}

OperationResult arityError(const std::string &name, size_t expected, size_t actual) {
    return OperationResult::error("method " + name + " expects " + std::to_string(expected) + " argument(s), got " +
                                  std::to_string(actual));
}

}  // namespace

OperationResult Operators::arithmetic(BinaryOp op, int64_t left, int64_t right) {
    int64_t result = 0;
    switch (op) {
    case BinaryOp::ADD:
        if (__builtin_add_overflow(left, right, &result)) {
            return OperationResult::error("integer overflow in +");
        }
        break;
    case BinaryOp::SUB:
        if (__builtin_sub_overflow(left, right, &result)) {
            return OperationResult::error("integer overflow in -");
        }
        break;
    case BinaryOp::MULT:
        if (__builtin_mul_overflow(left, right, &result)) {
            return OperationResult::error("integer overflow in *");
        }
        break;
    case BinaryOp::DIV:
        if (right == 0) {
            return OperationResult::error("division by zero");
        }
        if (left == INT64_MIN && right == -1) {
            return OperationResult::error("integer overflow in /");
        }
        result = left / right;
        break;
    case BinaryOp::MOD:
        if (right == 0) {
            return OperationResult::error("modulo by zero");
        }
        result = (left == INT64_MIN && right == -1) ? 0 : left % right;
        break;
    default:
        return OperationResult::error(std::string("operator ") + toString(op) + " is not arithmetic");
    }
    return OperationResult::success(ValueUtils::fromInt(result));
}

OperationResult Operators::applyBinary(BinaryOp op, const Value &left, const Value &right) {
    switch (op) {
    case BinaryOp::AND:
    case BinaryOp::OR:
    case BinaryOp::CONJUNCTION:
    case BinaryOp::DISJUNCTION: {
        auto l = ValueUtils::asBool(left);
        auto r = ValueUtils::asBool(right);
        if (!l || !r) {
            return OperationResult::error(typeError(toString(op), left, right));
        }
        bool conjunctive = op == BinaryOp::AND || op == BinaryOp::CONJUNCTION;
        return OperationResult::success(ValueUtils::fromBool(conjunctive ? (*l && *r) : (*l || *r)));
    }

    case BinaryOp::EQ:
        return OperationResult::success(ValueUtils::fromBool(ValueUtils::equals(left, right)));
    case BinaryOp::NEQ:
        return OperationResult::success(ValueUtils::fromBool(!ValueUtils::equals(left, right)));
    case BinaryOp::LT:
        return OperationResult::success(ValueUtils::fromBool(ValueUtils::compare(left, right) < 0));
    case BinaryOp::LTE:
        return OperationResult::success(ValueUtils::fromBool(ValueUtils::compare(left, right) <= 0));
    case BinaryOp::GT:
        return OperationResult::success(ValueUtils::fromBool(ValueUtils::compare(left, right) > 0));
    case BinaryOp::GTE:
        return OperationResult::success(ValueUtils::fromBool(ValueUtils::compare(left, right) >= 0));

    case BinaryOp::ADD:
    case BinaryOp::SUB:
    case BinaryOp::MULT:
    case BinaryOp::DIV:
    case BinaryOp::MOD: {
        auto l = ValueUtils::asInt(left);
        auto r = ValueUtils::asInt(right);
        if (!l || !r) {
            return OperationResult::error(typeError(toString(op), left, right));
        }
        return arithmetic(op, *l, *r);
    }

    case BinaryOp::CONCAT: {
        const auto *ls = ValueUtils::asString(left);
        const auto *rs = ValueUtils::asString(right);
        if (ls && rs) {
            return OperationResult::success(ValueUtils::fromString(*ls + *rs));
        }
        if (isList(left) && isList(right)) {
            std::vector<Value> elements = *ValueUtils::sequenceElements(left);
            const auto &tail = *ValueUtils::sequenceElements(right);
            elements.insert(elements.end(), tail.begin(), tail.end());
            return OperationResult::success(ValueUtils::makeList(std::move(elements)));
        }
        return OperationResult::error(typeError("++", left, right));
    }

    case BinaryOp::DIFF:
        return difference(left, right);

    case BinaryOp::INTERPOLATION:
        return interpolate(left, right);
    }
    return OperationResult::error("unknown operator");
}

OperationResult Operators::applyUnary(UnaryOp op, const Value &operand) {
    switch (op) {
    case UnaryOp::NOT:
    case UnaryOp::NEGATION: {
        auto b = ValueUtils::asBool(operand);
        if (!b) {
            return OperationResult::error(std::string("operator ") + toString(op) + " not defined for " +
                                          ValueUtils::typeName(operand));
        }
        return OperationResult::success(ValueUtils::fromBool(!*b));
    }
    case UnaryOp::NEG: {
        auto i = ValueUtils::asInt(operand);
        if (!i) {
            return OperationResult::error("operator - not defined for " + ValueUtils::typeName(operand));
        }
        if (*i == INT64_MIN) {
            return OperationResult::error("integer overflow in unary -");
        }
        return OperationResult::success(ValueUtils::fromInt(-*i));
    }
    }
    return OperationResult::error("unknown operator");
}

OperationResult Operators::difference(const Value &left, const Value &right) {
    if (isList(left) && isList(right)) {
        // Each right element removes the first equal occurrence
        std::vector<Value> elements = *ValueUtils::sequenceElements(left);
        for (const auto &removed : *ValueUtils::sequenceElements(right)) {
            auto it = std::find_if(elements.begin(), elements.end(),
                                   [&removed](const Value &element) { return ValueUtils::equals(element, removed); });
            if (it != elements.end()) {
                elements.erase(it);
            }
        }
        return OperationResult::success(ValueUtils::makeList(std::move(elements)));
    }

    if (isSet(left) && isSet(right)) {
        const auto &removed = *ValueUtils::sequenceElements(right);
        std::vector<Value> elements;
        for (const auto &element : *ValueUtils::sequenceElements(left)) {
            if (!containsValue(removed, element)) {
                elements.push_back(element);
            }
        }
        return OperationResult::success(ValueUtils::makeSet(std::move(elements)));
    }

    if (const ValueMap *map = ValueUtils::asMap(left)) {
        std::vector<Value> keys;
        if (const ValueMap *other = ValueUtils::asMap(right)) {
            for (const auto &entry : other->entries) {
                keys.push_back(entry.first);
            }
        } else if (isSet(right) || isList(right)) {
            keys = *ValueUtils::sequenceElements(right);
        } else {
            return OperationResult::error(typeError("--", left, right));
        }
        std::vector<std::pair<Value, Value>> entries;
        for (const auto &entry : map->entries) {
            if (!containsValue(keys, entry.first)) {
                entries.push_back(entry);
            }
        }
        return OperationResult::success(ValueUtils::makeMap(std::move(entries)));
    }

    return OperationResult::error(typeError("--", left, right));
}

OperationResult Operators::interpolate(const Value &text, const Value &map) {
    const auto *format = ValueUtils::asString(text);
    const ValueMap *values = ValueUtils::asMap(map);
    if (!format || !values) {
        return OperationResult::error(typeError("%%", text, map));
    }

    std::string out;
    size_t pos = 0;
    while (pos < format->size()) {
        size_t open = format->find("${", pos);
        if (open == std::string::npos) {
            out += format->substr(pos);
            break;
        }
        size_t close = format->find('}', open + 2);
        if (close == std::string::npos) {
            out += format->substr(pos);
            break;
        }
        out += format->substr(pos, open - pos);

        std::string key = format->substr(open + 2, close - open - 2);
        auto it = std::find_if(values->entries.begin(), values->entries.end(), [&key](const auto &entry) {
            const auto *name = ValueUtils::asString(entry.first);
            return name && *name == key;
        });
        // Unknown keys are left in place
        out += it != values->entries.end() ? plainText(it->second) : format->substr(open, close - open + 1);
        pos = close + 1;
    }
    return OperationResult::success(ValueUtils::fromString(std::move(out)));
}

OperationResult Operators::applyMethod(const std::string &name, const Value &receiver, const std::vector<Value> &args) {
    const auto *sequence = ValueUtils::sequenceElements(receiver);
    const ValueMap *map = ValueUtils::asMap(receiver);
    const auto *text = ValueUtils::asString(receiver);

    auto unsupported = [&name, &receiver]() {
        return OperationResult::error("method " + name + " not defined for " + ValueUtils::typeName(receiver));
    };

    if (name == "length" || name == "size") {
        if (!args.empty()) {
            return arityError(name, 0, args.size());
        }
        if (text) {
            return OperationResult::success(ValueUtils::fromInt(static_cast<int64_t>(text->size())));
        }
        if (sequence) {
            return OperationResult::success(ValueUtils::fromInt(static_cast<int64_t>(sequence->size())));
        }
        if (map) {
            return OperationResult::success(ValueUtils::fromInt(static_cast<int64_t>(map->entries.size())));
        }
        return unsupported();
    }

    if (name == "nth") {
        if (args.size() != 1) {
            return arityError(name, 1, args.size());
        }
        if (!sequence || isSet(receiver)) {
            return unsupported();
        }
        auto index = intArg(args, 0);
        if (!index) {
            return OperationResult::error("nth expects an Int index");
        }
        if (*index < 0 || static_cast<size_t>(*index) >= sequence->size()) {
            return OperationResult::error("nth index " + std::to_string(*index) + " out of range for size " +
                                          std::to_string(sequence->size()));
        }
        return OperationResult::success((*sequence)[static_cast<size_t>(*index)]);
    }

    if (name == "get" || name == "getOrElse") {
        size_t expected = name == "get" ? 1 : 2;
        if (args.size() != expected) {
            return arityError(name, expected, args.size());
        }
        if (!map) {
            return unsupported();
        }
        for (const auto &entry : map->entries) {
            if (ValueUtils::equals(entry.first, args[0])) {
                return OperationResult::success(entry.second);
            }
        }
        return OperationResult::success(expected == 2 ? args[1] : ValueUtils::nil());
    }

    if (name == "contains") {
        if (args.size() != 1) {
            return arityError(name, 1, args.size());
        }
        if (map) {
            bool found = std::any_of(map->entries.begin(), map->entries.end(),
                                     [&args](const auto &entry) { return ValueUtils::equals(entry.first, args[0]); });
            return OperationResult::success(ValueUtils::fromBool(found));
        }
        if (sequence) {
            return OperationResult::success(ValueUtils::fromBool(containsValue(*sequence, args[0])));
        }
        if (text) {
            const auto *needle = ValueUtils::asString(args[0]);
            if (!needle) {
                return OperationResult::error("contains on String expects a String");
            }
            return OperationResult::success(ValueUtils::fromBool(text->find(*needle) != std::string::npos));
        }
        return unsupported();
    }

    if (name == "keys" || name == "values") {
        if (!args.empty()) {
            return arityError(name, 0, args.size());
        }
        if (!map) {
            return unsupported();
        }
        std::vector<Value> out;
        for (const auto &entry : map->entries) {
            out.push_back(name == "keys" ? entry.first : entry.second);
        }
        return OperationResult::success(name == "keys" ? ValueUtils::makeSet(std::move(out))
                                                       : ValueUtils::makeList(std::move(out)));
    }

    if (name == "add") {
        if (args.size() != 1) {
            return arityError(name, 1, args.size());
        }
        if (!isSet(receiver)) {
            return unsupported();
        }
        std::vector<Value> elements = *sequence;
        elements.push_back(args[0]);
        return OperationResult::success(ValueUtils::makeSet(std::move(elements)));
    }

    if (name == "delete") {
        if (args.size() != 1) {
            return arityError(name, 1, args.size());
        }
        if (isSet(receiver)) {
            return difference(receiver, ValueUtils::makeSet({args[0]}));
        }
        if (map) {
            return difference(receiver, ValueUtils::makeSet({args[0]}));
        }
        return unsupported();
    }

    if (name == "union") {
        if (args.size() != 1) {
            return arityError(name, 1, args.size());
        }
        if (isSet(receiver) && isSet(args[0])) {
            std::vector<Value> elements = *sequence;
            const auto &more = *ValueUtils::sequenceElements(args[0]);
            elements.insert(elements.end(), more.begin(), more.end());
            return OperationResult::success(ValueUtils::makeSet(std::move(elements)));
        }
        const ValueMap *other = ValueUtils::asMap(args[0]);
        if (map && other) {
            auto entries = map->entries;
            entries.insert(entries.end(), other->entries.begin(), other->entries.end());
            return OperationResult::success(ValueUtils::makeMap(std::move(entries)));
        }
        return unsupported();
    }

    if (name == "diff") {
        if (args.size() != 1) {
            return arityError(name, 1, args.size());
        }
        return difference(receiver, args[0]);
    }

    if (name == "slice") {
        if (args.size() != 2) {
            return arityError(name, 2, args.size());
        }
        auto from = intArg(args, 0);
        auto to = intArg(args, 1);
        if (!from || !to) {
            return OperationResult::error("slice expects Int bounds");
        }
        size_t size = text ? text->size() : (isList(receiver) ? sequence->size() : 0);
        if (!text && !isList(receiver)) {
            return unsupported();
        }
        if (*from < 0 || *to < *from || static_cast<size_t>(*to) > size) {
            return OperationResult::error("slice bounds [" + std::to_string(*from) + ", " + std::to_string(*to) +
                                          ") out of range for size " + std::to_string(size));
        }
        auto begin = static_cast<size_t>(*from);
        auto end = static_cast<size_t>(*to);
        if (text) {
            return OperationResult::success(ValueUtils::fromString(text->substr(begin, end - begin)));
        }
        return OperationResult::success(ValueUtils::makeList(
            std::vector<Value>(sequence->begin() + static_cast<std::ptrdiff_t>(begin),
                               sequence->begin() + static_cast<std::ptrdiff_t>(end))));
    }

    if (name == "toList") {
        if (!args.empty()) {
            return arityError(name, 0, args.size());
        }
        if (sequence) {
            return OperationResult::success(ValueUtils::makeList(*sequence));
        }
        if (map) {
            std::vector<Value> pairs;
            for (const auto &entry : map->entries) {
                pairs.push_back(ValueUtils::makeTuple({entry.first, entry.second}));
            }
            return OperationResult::success(ValueUtils::makeList(std::move(pairs)));
        }
        return unsupported();
    }

    if (name == "toSet") {
        if (!args.empty()) {
            return arityError(name, 0, args.size());
        }
        if (sequence && !isTuple(receiver)) {
            return OperationResult::success(ValueUtils::makeSet(*sequence));
        }
        return unsupported();
    }

    if (name == "toString") {
        if (!args.empty()) {
            return arityError(name, 0, args.size());
        }
        return OperationResult::success(ValueUtils::fromString(plainText(receiver)));
    }

    return OperationResult::error("unknown method " + name);
}

}  // namespace PCE
