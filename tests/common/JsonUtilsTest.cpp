#include "common/JsonUtils.h"
#include <gtest/gtest.h>

namespace PCE {

class JsonUtilsTest : public ::testing::Test {};

TEST_F(JsonUtilsTest, ParseReportsErrors) {
    std::string error;
    EXPECT_FALSE(JsonUtils::parseJson("{\"a\": ", &error).has_value());
    EXPECT_FALSE(error.empty());

    auto parsed = JsonUtils::parseJson(R"({"a": 1, "b": "x", "c": true})");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(JsonUtils::getInt(*parsed, "a"), 1);
    EXPECT_EQ(JsonUtils::getString(*parsed, "b"), "x");
    EXPECT_TRUE(JsonUtils::getBool(*parsed, "c"));
    EXPECT_EQ(JsonUtils::getString(*parsed, "missing", "fallback"), "fallback");
    EXPECT_FALSE(JsonUtils::hasKey(*parsed, "missing"));
}

TEST_F(JsonUtilsTest, ValuesFromJson) {
    auto value = JsonUtils::valueFromJson(json::parse(R"({"list": [1, null, false], "name": "n"})"));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(ValueUtils::toString(*value), "{\"list\": [1, Nil, false], \"name\": \"n\"}");

    std::string error;
    EXPECT_FALSE(JsonUtils::valueFromJson(json(2.5), &error).has_value());
    EXPECT_EQ(error, "Floating point numbers are not supported: 2.5");
    EXPECT_FALSE(JsonUtils::valueFromJson(json(18446744073709551615ULL), &error).has_value());
}

TEST_F(JsonUtilsTest, ValuesToJsonKeepCollectionKinds) {
    EXPECT_EQ(JsonUtils::valueToJson(ValueUtils::nil()), json(nullptr));
    EXPECT_EQ(JsonUtils::valueToJson(ValueUtils::makeTuple({ValueUtils::fromInt(1)})), json::parse(R"({"@tuple": [1]})"));
    EXPECT_EQ(JsonUtils::valueToJson(ValueUtils::makeSet({ValueUtils::fromInt(2), ValueUtils::fromInt(1)})),
              json::parse(R"({"@set": [1, 2]})"));
    EXPECT_EQ(JsonUtils::valueToJson(ValueUtils::makeMap({{ValueUtils::fromInt(1), ValueUtils::fromBool(true)}})),
              json::parse(R"({"@map": [[1, true]]})"));
    EXPECT_EQ(JsonUtils::valueToJson(ValueUtils::fromChannel(ChannelName("7:1", true))),
              json::parse(R"({"@name": "7:1", "unforgeable": true})"));
}

}  // namespace PCE
