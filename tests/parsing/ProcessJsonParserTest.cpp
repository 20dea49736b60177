#include "common/TestUtils.h"
#include "parsing/ProcessJsonParser.h"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

namespace PCE {

using namespace Test::Utils;

class ProcessJsonParserTest : public ::testing::Test {
protected:
    ProcessPtr parse(const std::string &content) {
        return parser_.parseContent(content);
    }

    std::string firstError() const {
        return parser_.getErrorMessages().empty() ? std::string() : parser_.getErrorMessages().front();
    }

    ProcessJsonParser parser_;
};

TEST_F(ProcessJsonParserTest, ParsesWrappedAndBareDocuments) {
    auto wrapped = parse(R"({"process": {"type": "nil"}})");
    ASSERT_NE(wrapped, nullptr);
    EXPECT_EQ(wrapped->constructName(), "nil");

    auto bare = parse(R"({"type": "par", "processes": [{"type": "nil"}, {"type": "literal", "value": 1}]})");
    ASSERT_NE(bare, nullptr);
    EXPECT_EQ(bare->constructName(), "par");
    EXPECT_FALSE(parser_.hasErrors());
}

TEST_F(ProcessJsonParserTest, ParsedProgramRuns) {
    auto program = parse(R"({
        "type": "par",
        "processes": [
            {"type": "receive",
             "binds": [{"patterns": [{"type": "and", "left": {"type": "type", "name": "String"}, "right": "name"}],
                        "channel": {"type": "channel", "name": "greet"}}],
             "body": {"type": "send",
                      "channel": {"type": "channel", "name": "out"},
                      "args": [{"type": "binary", "op": "++",
                                "left": {"type": "literal", "value": "Hello, "},
                                "right": {"type": "var", "name": "name"}}]}},
            {"type": "send", "channel": {"type": "channel", "name": "greet"},
             "args": [{"type": "literal", "value": "Ada"}]}
        ]
    })");
    ASSERT_NE(program, nullptr) << firstError();

    RunReport report = runProgram(program);
    EXPECT_EQ(report.status, RunStatus::COMPLETED);
    EXPECT_EQ(payloadsToString(pendingPayloads(report, "out")), "(\"Hello, Ada\")");
}

TEST_F(ProcessJsonParserTest, CollectionsAndPatterns) {
    auto program = parse(R"({
        "type": "match",
        "expression": {"type": "list", "elements": [{"type": "literal", "value": 1},
                                                    {"type": "literal", "value": 2},
                                                    {"type": "literal", "value": 3}]},
        "cases": [
            {"pattern": {"type": "list", "elements": [{"type": "literal", "value": 9}], "remainder": "_"},
             "body": {"type": "literal", "value": "nine"}},
            {"pattern": {"type": "list", "elements": ["head"], "remainder": "tail"},
             "body": {"type": "method", "receiver": {"type": "var", "name": "tail"}, "name": "length"}}
        ]
    })");
    ASSERT_NE(program, nullptr) << firstError();

    RunReport report = runProgram(program);
    ASSERT_EQ(report.status, RunStatus::COMPLETED);
    ASSERT_TRUE(report.rootValue.has_value());
    EXPECT_EQ(ValueUtils::toString(*report.rootValue), "2");
}

TEST_F(ProcessJsonParserTest, UnknownTypeIsReportedWithPath) {
    EXPECT_EQ(parse(R"({"type": "par", "processes": [{"type": "nil"}, {"type": "spawn"}]})"), nullptr);
    EXPECT_TRUE(parser_.hasErrors());
    EXPECT_EQ(firstError(), "Unknown process type 'spawn' at process.processes[1]");
}

TEST_F(ProcessJsonParserTest, MissingFieldIsReported) {
    EXPECT_EQ(parse(R"({"type": "new", "names": ["x"]})"), nullptr);
    EXPECT_EQ(firstError(), "Missing 'body' at process");
}

TEST_F(ProcessJsonParserTest, InvalidOperatorsAndModes) {
    EXPECT_EQ(parse(R"({"type": "binary", "op": "**", "left": {"type": "nil"}, "right": {"type": "nil"}})"), nullptr);
    EXPECT_EQ(firstError(), "Unknown binary operator '**' at process");

    EXPECT_EQ(parse(R"({"type": "bundle", "mode": "execute", "body": {"type": "nil"}})"), nullptr);
    EXPECT_EQ(firstError(), "Unknown bundle mode 'execute' at process");

    EXPECT_EQ(parse(R"({"type": "receive", "binds": []})"), nullptr);
    EXPECT_EQ(firstError(), "Receive needs a non-empty 'binds' array at process");
}

TEST_F(ProcessJsonParserTest, TupleRemainderIsRejected) {
    EXPECT_EQ(parse(R"({"type": "tuple", "elements": [], "remainder": "rest"})"), nullptr);
    EXPECT_EQ(firstError(), "Tuples take no remainder at process");
}

TEST_F(ProcessJsonParserTest, FloatLiteralIsRejected) {
    EXPECT_EQ(parse(R"({"type": "literal", "value": 1.5})"), nullptr);
    EXPECT_NE(firstError().find("Floating point numbers are not supported"), std::string::npos);
}

TEST_F(ProcessJsonParserTest, ErrorsResetBetweenParses) {
    EXPECT_EQ(parse("{not json"), nullptr);
    EXPECT_NE(firstError().find("Failed to parse JSON content"), std::string::npos);

    EXPECT_NE(parse(R"({"type": "nil"})"), nullptr);
    EXPECT_FALSE(parser_.hasErrors());
}

TEST_F(ProcessJsonParserTest, ParsesFromFile) {
    auto path = std::filesystem::temp_directory_path() / "pce_parser_test_program.json";
    {
        std::ofstream file(path);
        file << R"({"process": {"type": "literal", "value": true}})";
    }

    auto program = parser_.parseFile(path.string());
    std::filesystem::remove(path);
    ASSERT_NE(program, nullptr) << firstError();
    EXPECT_EQ(program->constructName(), "literal");

    EXPECT_EQ(parser_.parseFile(path.string()), nullptr);
    EXPECT_EQ(firstError(), "File not found: " + path.string());
}

}  // namespace PCE
