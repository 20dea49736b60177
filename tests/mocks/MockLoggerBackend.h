#pragma once

#include "common/ILoggerBackend.h"
#include <gmock/gmock.h>

namespace PCE {

class MockLoggerBackend : public ILoggerBackend {
public:
    MOCK_METHOD(void, log, (LogLevel level, const std::string &message, const std::source_location &loc), (override));
    MOCK_METHOD(void, setLevel, (LogLevel level), (override));
    MOCK_METHOD(void, flush, (), (override));
};

}  // namespace PCE
