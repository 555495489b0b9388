/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace logup {

// Log categories, each with its own store.
enum class Category : std::uint8_t { Event, Exception, PerformanceMetric };

// What the worker reports for one invocation.
enum class Outcome : std::uint8_t { Success, Failure };

// Key/value bag handed over by the scheduler for one invocation.
using JobInput = std::unordered_map<std::string, std::string>;

inline constexpr const char* WORKER_CASE_KEY = "worker_case_key";
inline constexpr const char* EVENT_WORKER = "event_worker";
inline constexpr const char* EXCEPTION_WORKER = "exception_worker";
inline constexpr const char* PERFORMANCE_METRICS_WORKER = "performance_metrics_worker";

// Diagnostic tag for upload failures.
inline constexpr const char* WORKER_TAG = "LogUploadWorker.tag";

// Exact match only; anything else is not a category.
[[nodiscard]] std::optional<Category> categoryFromSelector(const std::string& selector) noexcept;
[[nodiscard]] std::optional<Category> categoryFromInput(const JobInput& input) noexcept;

// Drops repeated cases, keeping first occurrences in order. Two runs of one
// category at once would each remove the head for the same entries.
[[nodiscard]] std::vector<std::string> distinctWorkerCases(const std::vector<std::string>& cases);

[[nodiscard]] const char* selectorFor(Category category) noexcept;
[[nodiscard]] const char* categoryName(Category category) noexcept;
[[nodiscard]] const char* outcomeName(Outcome outcome) noexcept;

} // namespace logup
