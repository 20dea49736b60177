// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-PCE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of PCE (Process Calculus Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: https://github.com/newmassrael/process-calculus-engine/blob/main/LICENSE


#pragma once

#include <source_location>
#include <string>

namespace PCE {

enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Off = 5 };

/**
 * @brief Level from a configuration or SPDLOG_LEVEL string, case-insensitive
 *
 * Accepts the level names plus "warning" and "err"; unknown names give @p fallback.
 */
LogLevel parseLogLevel(const std::string &name, LogLevel fallback);

const char *toString(LogLevel level);

/**
 * @brief Where engine diagnostics go
 *
 * Console output always goes to stderr; stdout is reserved for run reports.
 * With logToFile set, a copy is written to `<logDir>/pce.log`.
 */
struct LogOptions {
    LogLevel level = LogLevel::Info;
    std::string logDir;
    bool logToFile = false;
};

/**
 * @brief Sink for Logger messages
 *
 * Embedders replace the spdlog backend through Logger::setBackend(); tests
 * install a mock to assert on engine diagnostics.
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    // message already carries the "Function() - " prefix
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;
    virtual void setLevel(LogLevel level) = 0;
    virtual void flush() = 0;
};

}  // namespace PCE
