#include "backends/SpdlogBackend.h"
#include "common/Logger.h"
#include "common/TestUtils.h"
#include "mocks/MockLoggerBackend.h"
#include <filesystem>
#include <fstream>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace PCE {

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::HasSubstr;
using ::testing::NiceMock;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto backend = std::make_unique<NiceMock<MockLoggerBackend>>();
        backend_ = backend.get();
        Logger::setBackend(std::move(backend));
    }

    void TearDown() override {
        // Fall back to the default backend for the remaining tests
        Logger::setBackend(nullptr);
    }

    NiceMock<MockLoggerBackend> *backend_ = nullptr;
};

TEST_F(LoggerTest, MessagesCarryCallingFunction) {
    EXPECT_CALL(*backend_,
                log(LogLevel::Info, HasSubstr("LoggerTest_MessagesCarryCallingFunction_Test::TestBody() - answer is 42"), _))
        .Times(1);
    LOG_INFO("answer is {}", 42);
}

TEST_F(LoggerTest, LevelAndFlushAreForwarded) {
    EXPECT_CALL(*backend_, setLevel(LogLevel::Warn)).Times(1);
    EXPECT_CALL(*backend_, flush()).Times(1);
    Logger::setLevel(LogLevel::Warn);
    Logger::flush();
}

TEST_F(LoggerTest, ParseLogLevelAcceptsAliases) {
    EXPECT_EQ(parseLogLevel("WARNING", LogLevel::Info), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("err", LogLevel::Info), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("off", LogLevel::Info), LogLevel::Off);
    EXPECT_EQ(parseLogLevel("loud", LogLevel::Debug), LogLevel::Debug);
}

TEST_F(LoggerTest, RejectedInjectionIsLoggedAsWarning) {
    EXPECT_CALL(*backend_, log(_, _, _)).Times(AnyNumber());
    EXPECT_CALL(*backend_, log(LogLevel::Warn, HasSubstr("rejected injection with empty channel name"), _)).Times(1);

    ProcessEngine engine(PCE::Test::Utils::testConfig());
    engine.load(ProcessFactory::nil());
    EXPECT_FALSE(engine.inject("", {}).isSuccess);
}

TEST_F(LoggerTest, FailedInstanceIsLoggedAsError) {
    EXPECT_CALL(*backend_, log(_, _, _)).Times(AnyNumber());
    EXPECT_CALL(*backend_, log(LogLevel::Error, HasSubstr("division by zero"), _)).Times(::testing::AtLeast(1));

    PCE::Test::Utils::runProgram(ProcessFactory::binary(BinaryOp::DIV, ProcessFactory::integer(1), ProcessFactory::integer(0)));
}

TEST(SpdlogBackendTest, FileSinkKeepsLevelAndSourceLine) {
    auto dir = std::filesystem::temp_directory_path() / "pce_logger_test";
    std::filesystem::remove_all(dir);

    LogOptions options;
    options.level = LogLevel::Warn;
    options.logDir = dir.string();
    options.logToFile = true;
    {
        SpdlogBackend backend(options);
        backend.log(LogLevel::Info, "quiet", std::source_location::current());
        backend.log(LogLevel::Error, "loud", std::source_location::current());
        backend.flush();
    }

    std::ifstream file(dir / "pce.log");
    ASSERT_TRUE(file.is_open());
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content.find("quiet"), std::string::npos);
    EXPECT_NE(content.find("[error] [LoggerTest.cpp:"), std::string::npos);
    EXPECT_NE(content.find("loud"), std::string::npos);

    file.close();
    std::filesystem::remove_all(dir);
}

TEST(LogOptionsTest, EngineConfigMapsLoggingKeys) {
    EngineConfig config = EngineConfig::fromJson(json{{"logLevel", "WARNING"}, {"logDir", "out"}, {"logToFile", true}});
    LogOptions options = config.logOptions();
    EXPECT_EQ(options.level, LogLevel::Warn);
    EXPECT_EQ(options.logDir, "out");
    EXPECT_TRUE(options.logToFile);

    config.logLevel = "chatty";
    EXPECT_EQ(config.logOptions().level, LogLevel::Info);
    EXPECT_STREQ(toString(LogLevel::Off), "off");
}

}  // namespace PCE
