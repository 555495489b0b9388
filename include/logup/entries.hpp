/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace logup {

enum class EventPriority : uint8_t {
    Essential = 0,
    Optional = 1
};

struct EventLogEntry {
    int64_t timestampMs = 0;
    EventPriority priority = EventPriority::Essential;
    std::string name;
    std::string context;
};

struct StackFrame {
    std::string declaringClass;
    std::string methodName;
    std::string fileName;
    int lineNumber = -1;
};

struct ExceptionCause {
    std::string type;
    std::string message;
    std::vector<StackFrame> frames;
};

struct ExceptionLogEntry {
    int64_t timestampMs = 0;
    bool fatal = false;
    std::string type;
    std::string message;
    std::vector<StackFrame> frames;
    // Outermost cause first.
    std::vector<ExceptionCause> causes;
};

enum class MemoryTier : uint8_t {
    Unknown = 0,
    Low = 1,
    Medium = 2,
    High = 3
};

struct PerformanceMetricLogEntry {
    int64_t timestampMs = 0;
    std::string metricName;
    std::string currentScreen;
    double value = 0.0;
    MemoryTier memoryTier = MemoryTier::Unknown;
};

}
