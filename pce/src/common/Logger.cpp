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

#include "common/Logger.h"

#include "backends/SpdlogBackend.h"

#include <algorithm>
#include <cctype>
#include <mutex>

namespace PCE {

std::unique_ptr<ILoggerBackend> Logger::backend_;

static std::mutex backend_mutex;

LogLevel parseLogLevel(const std::string &name, LogLevel fallback) {
    std::string level = name;
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (level == "trace") {
        return LogLevel::Trace;
    } else if (level == "debug") {
        return LogLevel::Debug;
    } else if (level == "info") {
        return LogLevel::Info;
    } else if (level == "warn" || level == "warning") {
        return LogLevel::Warn;
    } else if (level == "err" || level == "error") {
        return LogLevel::Error;
    } else if (level == "off") {
        return LogLevel::Off;
    }
    return fallback;
}

const char *toString(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    case LogLevel::Off:
        return "off";
    }
    return "unknown";
}

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    backend_ = std::move(backend);
}

void Logger::initialize(const LogOptions &options) {
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>(options);
    }
}

void Logger::setLevel(LogLevel level) {
    ensureBackend();
    backend_->setLevel(level);
}

void Logger::trace(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(LogLevel::Trace, extractCleanFunctionName(loc) + "() - " + message, loc);
}

void Logger::debug(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(LogLevel::Debug, extractCleanFunctionName(loc) + "() - " + message, loc);
}

void Logger::info(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(LogLevel::Info, extractCleanFunctionName(loc) + "() - " + message, loc);
}

void Logger::warn(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(LogLevel::Warn, extractCleanFunctionName(loc) + "() - " + message, loc);
}

void Logger::error(const std::string &message, const std::source_location &loc) {
    ensureBackend();
    backend_->log(LogLevel::Error, extractCleanFunctionName(loc) + "() - " + message, loc);
}

void Logger::flush() {
    ensureBackend();
    backend_->flush();
}

void Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
}

// "PCE::Scheduler::step()" out of "bool PCE::Scheduler::step(PCE::RunReport&)"
std::string Logger::extractCleanFunctionName(const std::source_location &loc) {
    std::string fullName = loc.function_name();

    size_t parenPos = fullName.find('(');
    if (parenPos == std::string::npos) {
        return "UnknownFunction";
    }

    size_t nameEnd = parenPos;
    while (nameEnd > 0 && std::isspace(static_cast<unsigned char>(fullName[nameEnd - 1]))) {
        nameEnd--;
    }

    // Last space outside template arguments separates the return type
    size_t nameStart = 0;
    int angleDepth = 0;
    for (size_t i = 0; i < nameEnd; i++) {
        char c = fullName[i];
        if (c == '<') {
            angleDepth++;
        } else if (c == '>') {
            angleDepth--;
        } else if (c == ' ' && angleDepth == 0) {
            nameStart = i + 1;
        }
    }

    std::string result;
    angleDepth = 0;
    for (size_t i = nameStart; i < nameEnd; i++) {
        char c = fullName[i];
        if (c == '<') {
            angleDepth++;
        } else if (c == '>') {
            angleDepth--;
        } else if (angleDepth == 0 && c != '*' && c != '&') {
            result += c;
        }
    }

    return result.empty() ? "UnknownFunction" : result;
}

}  // namespace PCE
