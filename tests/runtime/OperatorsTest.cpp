#include "runtime/Operators.h"
#include <gtest/gtest.h>
#include <limits>

namespace PCE {

class OperatorsTest : public ::testing::Test {
protected:
    static Value num(int64_t value) {
        return ValueUtils::fromInt(value);
    }

    static Value str(const std::string &text) {
        return ValueUtils::fromString(text);
    }

    static std::string binary(BinaryOp op, const Value &left, const Value &right) {
        auto result = Operators::applyBinary(op, left, right);
        return result.isSuccess ? ValueUtils::toString(result.value) : "error: " + result.errorMessage;
    }

    static std::string method(const std::string &name, const Value &receiver, const std::vector<Value> &args = {}) {
        auto result = Operators::applyMethod(name, receiver, args);
        return result.isSuccess ? ValueUtils::toString(result.value) : "error: " + result.errorMessage;
    }
};

TEST_F(OperatorsTest, Arithmetic) {
    EXPECT_EQ(binary(BinaryOp::ADD, num(2), num(3)), "5");
    EXPECT_EQ(binary(BinaryOp::SUB, num(2), num(3)), "-1");
    EXPECT_EQ(binary(BinaryOp::MULT, num(-4), num(3)), "-12");
    EXPECT_EQ(binary(BinaryOp::DIV, num(7), num(2)), "3");
    EXPECT_EQ(binary(BinaryOp::MOD, num(7), num(2)), "1");
}

TEST_F(OperatorsTest, ArithmeticErrors) {
    EXPECT_EQ(binary(BinaryOp::DIV, num(1), num(0)), "error: division by zero");
    EXPECT_EQ(binary(BinaryOp::MOD, num(1), num(0)), "error: modulo by zero");
    EXPECT_EQ(binary(BinaryOp::ADD, num(std::numeric_limits<int64_t>::max()), num(1)),
              "error: integer overflow in +");
    EXPECT_EQ(binary(BinaryOp::ADD, num(1), str("1")), "error: operator + not defined for Int and String");
}

TEST_F(OperatorsTest, ComparisonUsesStructuralOrder) {
    EXPECT_EQ(binary(BinaryOp::LT, num(1), num(2)), "true");
    EXPECT_EQ(binary(BinaryOp::GTE, str("b"), str("a")), "true");
    EXPECT_EQ(binary(BinaryOp::EQ, ValueUtils::makeSet({num(2), num(1)}), ValueUtils::makeSet({num(1), num(2)})),
              "true");
    EXPECT_EQ(binary(BinaryOp::NEQ, num(1), str("1")), "true");
}

TEST_F(OperatorsTest, BooleanOperatorsRequireBools) {
    EXPECT_EQ(binary(BinaryOp::AND, ValueUtils::fromBool(true), ValueUtils::fromBool(false)), "false");
    EXPECT_EQ(binary(BinaryOp::DISJUNCTION, ValueUtils::fromBool(true), ValueUtils::fromBool(false)), "true");
    EXPECT_FALSE(Operators::applyBinary(BinaryOp::OR, num(1), ValueUtils::fromBool(true)).isSuccess);
    EXPECT_EQ(ValueUtils::toString(Operators::applyUnary(UnaryOp::NOT, ValueUtils::fromBool(true)).value), "false");
    EXPECT_EQ(ValueUtils::toString(Operators::applyUnary(UnaryOp::NEG, num(5)).value), "-5");
    EXPECT_FALSE(Operators::applyUnary(UnaryOp::NEG, str("5")).isSuccess);
}

TEST_F(OperatorsTest, ConcatAndDifference) {
    EXPECT_EQ(binary(BinaryOp::CONCAT, str("ab"), str("cd")), "\"abcd\"");
    EXPECT_EQ(binary(BinaryOp::CONCAT, ValueUtils::makeList({num(1)}), ValueUtils::makeList({num(2)})), "[1, 2]");
    EXPECT_EQ(binary(BinaryOp::DIFF, ValueUtils::makeList({num(1), num(2), num(1)}), ValueUtils::makeList({num(1)})),
              "[2, 1]");
    EXPECT_EQ(binary(BinaryOp::DIFF, ValueUtils::makeSet({num(1), num(2)}), ValueUtils::makeSet({num(2)})),
              "Set(1)");
    Value map = ValueUtils::makeMap({{str("a"), num(1)}, {str("b"), num(2)}});
    EXPECT_EQ(binary(BinaryOp::DIFF, map, ValueUtils::makeSet({str("a")})), "{\"b\": 2}");
}

TEST_F(OperatorsTest, InterpolationReplacesKnownKeys) {
    Value values = ValueUtils::makeMap({{str("name"), str("Ada")}, {str("n"), num(3)}});
    EXPECT_EQ(binary(BinaryOp::INTERPOLATION, str("hi ${name}, ${n} new, ${missing}"), values),
              "\"hi Ada, 3 new, ${missing}\"");
    EXPECT_FALSE(Operators::interpolate(num(1), values).isSuccess);
}

TEST_F(OperatorsTest, SequenceMethods) {
    Value list = ValueUtils::makeList({num(10), num(20), num(30)});
    EXPECT_EQ(method("length", list), "3");
    EXPECT_EQ(method("length", str("abcd")), "4");
    EXPECT_EQ(method("nth", list, {num(1)}), "20");
    EXPECT_EQ(method("nth", list, {num(3)}), "error: nth index 3 out of range for size 3");
    EXPECT_EQ(method("slice", list, {num(1), num(3)}), "[20, 30]");
    EXPECT_EQ(method("slice", str("hello"), {num(0), num(2)}), "\"he\"");
    EXPECT_EQ(method("contains", list, {num(20)}), "true");
    EXPECT_EQ(method("toSet", list), "Set(10, 20, 30)");
    EXPECT_EQ(method("nth", list), "error: method nth expects 1 argument(s), got 0");
}

TEST_F(OperatorsTest, MapAndSetMethods) {
    Value map = ValueUtils::makeMap({{str("a"), num(1)}});
    EXPECT_EQ(method("get", map, {str("a")}), "1");
    EXPECT_EQ(method("get", map, {str("z")}), "Nil");
    EXPECT_EQ(method("getOrElse", map, {str("z"), num(0)}), "0");
    EXPECT_EQ(method("keys", map), "Set(\"a\")");
    EXPECT_EQ(method("union", map, {ValueUtils::makeMap({{str("a"), num(2)}})}), "{\"a\": 2}");
    EXPECT_EQ(method("toList", map), "[(\"a\", 1)]");

    Value set = ValueUtils::makeSet({num(1)});
    EXPECT_EQ(method("add", set, {num(0)}), "Set(0, 1)");
    EXPECT_EQ(method("delete", set, {num(1)}), "Set()");
    EXPECT_EQ(method("get", set, {num(1)}), "error: method get not defined for Set");
}

TEST_F(OperatorsTest, UnknownMethodIsAnError) {
    EXPECT_EQ(method("frobnicate", num(1)), "error: unknown method frobnicate");
    EXPECT_EQ(method("toString", num(42)), "\"42\"");
}

}  // namespace PCE
