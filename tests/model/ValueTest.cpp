#include "model/Environment.h"
#include "model/Value.h"
#include <gtest/gtest.h>

namespace PCE {

class ValueTest : public ::testing::Test {
protected:
    Value num(int64_t value) {
        return ValueUtils::fromInt(value);
    }

    Value str(const std::string &text) {
        return ValueUtils::fromString(text);
    }
};

TEST_F(ValueTest, KindsOrderBeforeContents) {
    std::vector<Value> ascending = {ValueUtils::nil(),
                                    ValueUtils::fromBool(true),
                                    num(-5),
                                    str(""),
                                    ValueUtils::fromChannel(ChannelName("a")),
                                    ValueUtils::makeList({}),
                                    ValueUtils::makeTuple({}),
                                    ValueUtils::makeSet({}),
                                    ValueUtils::makeMap({})};

    for (size_t i = 0; i + 1 < ascending.size(); ++i) {
        EXPECT_LT(ValueUtils::compare(ascending[i], ascending[i + 1]), 0)
            << ValueUtils::toString(ascending[i]) << " vs " << ValueUtils::toString(ascending[i + 1]);
        EXPECT_GT(ValueUtils::compare(ascending[i + 1], ascending[i]), 0);
    }
}

TEST_F(ValueTest, SequencesCompareLexicographically) {
    EXPECT_LT(ValueUtils::compare(ValueUtils::makeList({num(1), num(2)}), ValueUtils::makeList({num(1), num(3)})), 0);
    EXPECT_LT(ValueUtils::compare(ValueUtils::makeList({num(1)}), ValueUtils::makeList({num(1), num(0)})), 0);
    EXPECT_TRUE(ValueUtils::equals(ValueUtils::makeList({str("x")}), ValueUtils::makeList({str("x")})));
}

TEST_F(ValueTest, SetIsSortedAndUnique) {
    Value set = ValueUtils::makeSet({num(3), num(1), num(3), num(2)});
    EXPECT_EQ(ValueUtils::toString(set), "Set(1, 2, 3)");
    EXPECT_TRUE(ValueUtils::equals(set, ValueUtils::makeSet({num(2), num(1), num(3)})));
}

TEST_F(ValueTest, MapKeepsLastDuplicateKey) {
    Value map = ValueUtils::makeMap({{str("b"), num(1)}, {str("a"), num(2)}, {str("b"), num(3)}});
    EXPECT_EQ(ValueUtils::toString(map), "{\"a\": 2, \"b\": 3}");
}

TEST_F(ValueTest, PrintsSurfaceSyntax) {
    EXPECT_EQ(ValueUtils::toString(ValueUtils::nil()), "Nil");
    EXPECT_EQ(ValueUtils::toString(str("say \"hi\"")), "\"say \\\"hi\\\"\"");
    EXPECT_EQ(ValueUtils::toString(ValueUtils::makeTuple({num(1)})), "(1,)");
    EXPECT_EQ(ValueUtils::toString(ValueUtils::makeTuple({num(1), ValueUtils::fromBool(false)})), "(1, false)");
    EXPECT_EQ(ValueUtils::toString(ValueUtils::fromChannel(ChannelName("7:0", true))), "Unforgeable(7:0)");
    EXPECT_EQ(ValueUtils::payloadToString({num(1), str("a")}), "(1, \"a\")");
}

TEST_F(ValueTest, QuotingGroundValuesYieldsPublicNames) {
    ChannelName name = ValueUtils::quote(str("stdout"));
    EXPECT_FALSE(name.unforgeable);
    EXPECT_EQ(name.key(), "@\"stdout\"");
    EXPECT_EQ(ValueUtils::quote(ValueUtils::fromChannel(name)), name);
    EXPECT_NE(ValueUtils::quote(num(1)), ValueUtils::quote(str("1")));
}

TEST_F(ValueTest, UnforgeableNameNeverEqualsPublicSpelling) {
    ChannelName minted("1:0", true);
    ChannelName spelled("1:0", false);
    EXPECT_FALSE(minted == spelled);
    EXPECT_NE(minted.key(), spelled.key());
    EXPECT_FALSE(ValueUtils::equals(ValueUtils::fromChannel(minted), ValueUtils::fromChannel(spelled)));
}

TEST_F(ValueTest, AccessorsRejectOtherKinds) {
    EXPECT_FALSE(ValueUtils::asInt(str("1")).has_value());
    EXPECT_FALSE(ValueUtils::asBool(num(0)).has_value());
    EXPECT_EQ(ValueUtils::asChannel(str("x")), nullptr);
    EXPECT_EQ(ValueUtils::sequenceElements(ValueUtils::makeMap({})), nullptr);
    EXPECT_EQ(ValueUtils::sequenceElements(ValueUtils::makeTuple({num(1)}))->size(), 1u);
    EXPECT_TRUE(ValueUtils::isCollection(ValueUtils::makeSet({})));
    EXPECT_FALSE(ValueUtils::isCollection(str("abc")));
}

TEST_F(ValueTest, EnvironmentIsCopyOnWrite) {
    EnvironmentPtr base = Environment::empty()->with("x", num(1));
    EnvironmentPtr extended = base->with("y", num(2));
    EnvironmentPtr shadowed = extended->withAll({{"x", num(10)}, {"x", num(11)}});
    EnvironmentPtr moved = shadowed->without("y");

    EXPECT_EQ(base->size(), 1u);
    EXPECT_FALSE(base->contains("y"));
    EXPECT_EQ(ValueUtils::asInt(*shadowed->lookup("x")), 11);
    EXPECT_EQ(ValueUtils::asInt(*extended->lookup("x")), 1);
    EXPECT_FALSE(moved->lookup("y").has_value());
    EXPECT_TRUE(shadowed->contains("y"));
    EXPECT_EQ(moved->names(), std::vector<std::string>{"x"});
}

}  // namespace PCE
