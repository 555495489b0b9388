/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include "logup/entries.hpp"
#include "logup/types.hpp"

namespace logup {

template <typename Entry>
struct EntryTraits;

template <>
struct EntryTraits<EventLogEntry> {
    static constexpr Category category = Category::Event;
};

template <>
struct EntryTraits<ExceptionLogEntry> {
    static constexpr Category category = Category::Exception;
};

template <>
struct EntryTraits<PerformanceMetricLogEntry> {
    static constexpr Category category = Category::PerformanceMetric;
};

// Text records: one key=value per line, backslash escapes in values.
// Decoding throws StoreError on anything it does not understand.
[[nodiscard]] std::string encodeEntry(const EventLogEntry& entry);
[[nodiscard]] std::string encodeEntry(const ExceptionLogEntry& entry);
[[nodiscard]] std::string encodeEntry(const PerformanceMetricLogEntry& entry);

void decodeEntry(const std::string& record, EventLogEntry& entry);
void decodeEntry(const std::string& record, ExceptionLogEntry& entry);
void decodeEntry(const std::string& record, PerformanceMetricLogEntry& entry);

}
