#include "store/PatternMatcher.h"
#include <gtest/gtest.h>

namespace PCE {

class PatternMatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        env_ = Environment::empty()->with("expected", ValueUtils::fromInt(7));
    }

    std::optional<BindingList> match(const PatternPtr &pattern, const Value &value) {
        return PatternMatcher::match(*pattern, value, *env_);
    }

    static Value num(int64_t value) {
        return ValueUtils::fromInt(value);
    }

    static const Value *find(const BindingList &bindings, const std::string &name) {
        for (const auto &[bound, value] : bindings) {
            if (bound == name) {
                return &value;
            }
        }
        return nullptr;
    }

    EnvironmentPtr env_;
};

TEST_F(PatternMatcherTest, WildcardAndBind) {
    auto wildcard = match(Pattern::wildcard(), num(1));
    ASSERT_TRUE(wildcard.has_value());
    EXPECT_TRUE(wildcard->empty());

    auto bound = match(Pattern::bind("x"), ValueUtils::fromString("v"));
    ASSERT_TRUE(bound.has_value());
    ASSERT_EQ(bound->size(), 1u);
    EXPECT_EQ(bound->front().first, "x");
    EXPECT_EQ(*ValueUtils::asString(bound->front().second), "v");
}

TEST_F(PatternMatcherTest, RepeatedBindRequiresEqualValues) {
    auto pattern = Pattern::tuple({Pattern::bind("x"), Pattern::bind("x")});
    EXPECT_TRUE(match(pattern, ValueUtils::makeTuple({num(2), num(2)})).has_value());
    EXPECT_FALSE(match(pattern, ValueUtils::makeTuple({num(2), num(3)})).has_value());
}

TEST_F(PatternMatcherTest, LiteralAndVarRef) {
    EXPECT_TRUE(match(Pattern::literalValue(num(3)), num(3)).has_value());
    EXPECT_FALSE(match(Pattern::literalValue(num(3)), ValueUtils::fromString("3")).has_value());
    EXPECT_TRUE(match(Pattern::varRef("expected"), num(7)).has_value());
    EXPECT_FALSE(match(Pattern::varRef("expected"), num(8)).has_value());
    EXPECT_FALSE(match(Pattern::varRef("unbound"), num(7)).has_value());
}

TEST_F(PatternMatcherTest, TypePatterns) {
    EXPECT_TRUE(match(Pattern::typed(SimpleType::INT), num(0)).has_value());
    EXPECT_TRUE(match(Pattern::typed(SimpleType::BOOL), ValueUtils::fromBool(false)).has_value());
    EXPECT_TRUE(match(Pattern::typed(SimpleType::NAME), ValueUtils::fromChannel(ChannelName("a"))).has_value());
    EXPECT_FALSE(match(Pattern::typed(SimpleType::STRING), num(0)).has_value());
}

TEST_F(PatternMatcherTest, ListRemainderBindsTail) {
    auto pattern = Pattern::list({Pattern::bind("head")}, "tail");
    auto bindings = match(pattern, ValueUtils::makeList({num(1), num(2), num(3)}));
    ASSERT_TRUE(bindings.has_value());
    EXPECT_EQ(ValueUtils::toString(*find(*bindings, "head")), "1");
    EXPECT_EQ(ValueUtils::toString(*find(*bindings, "tail")), "[2, 3]");

    EXPECT_FALSE(match(pattern, ValueUtils::makeList({})).has_value());
    EXPECT_FALSE(match(pattern, ValueUtils::makeTuple({num(1)})).has_value());
}

TEST_F(PatternMatcherTest, ListWithoutRemainderRequiresExactLength) {
    auto pattern = Pattern::list({Pattern::wildcard()});
    EXPECT_TRUE(match(pattern, ValueUtils::makeList({num(1)})).has_value());
    EXPECT_FALSE(match(pattern, ValueUtils::makeList({num(1), num(2)})).has_value());
}

TEST_F(PatternMatcherTest, SetMatchingBacktracks) {
    // The literal must claim 1 even though the bind is tried against it first
    auto pattern = Pattern::set({Pattern::bind("x"), Pattern::literalValue(num(1))});
    auto bindings = match(pattern, ValueUtils::makeSet({num(1), num(2)}));
    ASSERT_TRUE(bindings.has_value());
    EXPECT_EQ(ValueUtils::toString(*find(*bindings, "x")), "2");
}

TEST_F(PatternMatcherTest, SetRemainderCollectsUnusedElements) {
    auto pattern = Pattern::set({Pattern::literalValue(num(2))}, "rest");
    auto bindings = match(pattern, ValueUtils::makeSet({num(3), num(2), num(1)}));
    ASSERT_TRUE(bindings.has_value());
    EXPECT_EQ(ValueUtils::toString(*find(*bindings, "rest")), "Set(1, 3)");
}

TEST_F(PatternMatcherTest, MapEntriesAndRemainder) {
    Value map = ValueUtils::makeMap({{ValueUtils::fromString("a"), num(1)}, {ValueUtils::fromString("b"), num(2)}});
    auto pattern = Pattern::map({{Pattern::literalValue(ValueUtils::fromString("b")), Pattern::bind("b")}}, "others");

    auto bindings = match(pattern, map);
    ASSERT_TRUE(bindings.has_value());
    EXPECT_EQ(ValueUtils::toString(*find(*bindings, "b")), "2");
    EXPECT_EQ(ValueUtils::toString(*find(*bindings, "others")), "{\"a\": 1}");

    auto exact = Pattern::map({{Pattern::wildcard(), Pattern::wildcard()}});
    EXPECT_FALSE(match(exact, map).has_value());
}

TEST_F(PatternMatcherTest, LogicalPatterns) {
    auto both = Pattern::conjunction(Pattern::typed(SimpleType::INT), Pattern::bind("n"));
    auto bindings = match(both, num(5));
    ASSERT_TRUE(bindings.has_value());
    EXPECT_NE(find(*bindings, "n"), nullptr);
    EXPECT_FALSE(match(both, ValueUtils::fromString("5")).has_value());

    auto either = Pattern::disjunction(Pattern::literalValue(num(1)), Pattern::bind("other"));
    auto disjunct = match(either, num(9));
    ASSERT_TRUE(disjunct.has_value());
    EXPECT_TRUE(disjunct->empty());

    auto notNil = Pattern::negation(Pattern::literalValue(ValueUtils::nil()));
    EXPECT_TRUE(match(notNil, num(0)).has_value());
    EXPECT_FALSE(match(notNil, ValueUtils::nil()).has_value());
}

TEST_F(PatternMatcherTest, PayloadArityMustMatch) {
    std::vector<PatternPtr> patterns = {Pattern::bind("a"), Pattern::bind("b")};
    EXPECT_FALSE(PatternMatcher::matchPayload(patterns, {num(1)}, *env_).has_value());

    auto bindings = PatternMatcher::matchPayload(patterns, {num(1), num(2)}, *env_);
    ASSERT_TRUE(bindings.has_value());
    ASSERT_EQ(bindings->size(), 2u);
    EXPECT_EQ((*bindings)[0].first, "a");
    EXPECT_EQ((*bindings)[1].first, "b");
}

}  // namespace PCE
