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

#include "common/ILoggerBackend.h"
#include <memory>
#include <spdlog/logger.h>

namespace PCE {

/**
 * @brief Logger backend writing through a private spdlog logger
 *
 * The logger is not registered with spdlog, so several engines or tools in
 * one process can each own a backend. SPDLOG_LEVEL overrides the configured level.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    explicit SpdlogBackend(const LogOptions &options = LogOptions());

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace PCE
