/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "logup/config.hpp"
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace logup {

namespace {
std::size_t env_size(const char* name, std::size_t defv, bool allowZero) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t parsed = static_cast<std::size_t>(std::stoull(val));
        return (parsed == 0 && !allowZero) ? defv : parsed;
    } catch (const std::logic_error&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}
}

Config Config::fromEnvironment() noexcept {
    Config config;
    try {
        if (const char* workspace = std::getenv("LOGUP_WORKSPACE"); workspace && *workspace) {
            config.workspace = workspace;
        }
        config.workers = static_cast<int>(std::min<std::size_t>(env_size("LOGUP_WORKERS", 1, false), 64));
        config.watchInterval = std::chrono::seconds(env_size("LOGUP_WATCH_SECONDS", 0, true));
        if (const char* level = std::getenv("LOGUP_LOG_LEVEL"); level && *level) {
            if (auto parsed = Logger::parseLevel(level)) {
                config.logLevel = *parsed;
            } else {
                LOG_WARN(std::string("Ignoring invalid LOGUP_LOG_LEVEL=") + level);
            }
        }
    } catch (const std::exception& e) {
        LOG_WARN("Falling back to default configuration: " + std::string(e.what()));
        config = Config{};
    }
    return config;
}

}
