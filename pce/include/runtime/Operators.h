#pragma once

#include "model/ProcessNode.h"
#include "model/Value.h"
#include <string>
#include <vector>

namespace PCE {

/**
 * @brief Result of applying an operator or method
 */
struct OperationResult {
    bool isSuccess = false;
    Value value;
    std::string errorMessage;

    static OperationResult success(Value value) {
        OperationResult result;
        result.isSuccess = true;
        result.value = std::move(value);
        return result;
    }

    static OperationResult error(const std::string &message) {
        OperationResult result;
        result.errorMessage = message;
        return result;
    }
};

/**
 * @brief Pure evaluation of operators and built-in methods over values
 */
class Operators {
public:
    static OperationResult applyBinary(BinaryOp op, const Value &left, const Value &right);
    static OperationResult applyUnary(UnaryOp op, const Value &operand);

    /**
     * @brief Built-in method call `receiver.name(args)`
     *
     * Supported: length, size, nth, get, getOrElse, contains, keys, values,
     * add, delete, union, diff, slice, toList, toSet, toString.
     */
    static OperationResult applyMethod(const std::string &name, const Value &receiver, const std::vector<Value> &args);

    /**
     * @brief `"${key}" %% {"key": value}`
     */
    static OperationResult interpolate(const Value &text, const Value &map);

    /**
     * @brief `left -- right` for lists, sets and maps
     */
    static OperationResult difference(const Value &left, const Value &right);

private:
    static OperationResult arithmetic(BinaryOp op, int64_t left, int64_t right);
};

}  // namespace PCE
