/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>

#include "logup/logger.hpp"

namespace logup {

struct Config {
    std::filesystem::path workspace;
    int workers = 1;
    LogLevel logLevel = LogLevel::INFO;
    // Zero runs the requested uploads once.
    std::chrono::seconds watchInterval{0};

    // LOGUP_WORKSPACE, LOGUP_WORKERS, LOGUP_LOG_LEVEL, LOGUP_WATCH_SECONDS.
    // Unset or invalid values keep the defaults.
    [[nodiscard]] static Config fromEnvironment() noexcept;
};

}
