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


#include "backends/SpdlogBackend.h"
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace PCE {

namespace {

spdlog::level::level_enum toSpdlog(LogLevel level) {
    static constexpr spdlog::level::level_enum levels[] = {spdlog::level::trace, spdlog::level::debug,
                                                           spdlog::level::info,  spdlog::level::warn,
                                                           spdlog::level::err,   spdlog::level::off};
    return levels[static_cast<int>(level)];
}

}  // namespace

SpdlogBackend::SpdlogBackend(const LogOptions &options) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    sinks.push_back(console);

    if (options.logToFile && !options.logDir.empty()) {
        std::filesystem::create_directories(options.logDir);
        auto path = std::filesystem::path(options.logDir) / "pce.log";
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), true);
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");
        sinks.push_back(file);
    }

    logger_ = std::make_shared<spdlog::logger>("pce", sinks.begin(), sinks.end());
    logger_->flush_on(spdlog::level::err);

    LogLevel level = options.level;
    if (const char *env = std::getenv("SPDLOG_LEVEL")) {
        level = parseLogLevel(env, level);
    }
    setLevel(level);
}

void SpdlogBackend::log(LogLevel level, const std::string &message, const std::source_location &loc) {
    spdlog::source_loc where{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()};
    logger_->log(where, toSpdlog(level), spdlog::string_view_t(message));
}

void SpdlogBackend::setLevel(LogLevel level) {
    logger_->set_level(toSpdlog(level));
}

void SpdlogBackend::flush() {
    logger_->flush();
}

}  // namespace PCE
