/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "logup/types.hpp"
#include <algorithm>

namespace logup {

std::optional<Category> categoryFromSelector(const std::string& selector) noexcept {
    if (selector == EVENT_WORKER) return Category::Event;
    if (selector == EXCEPTION_WORKER) return Category::Exception;
    if (selector == PERFORMANCE_METRICS_WORKER) return Category::PerformanceMetric;
    return std::nullopt;
}

std::optional<Category> categoryFromInput(const JobInput& input) noexcept {
    auto it = input.find(WORKER_CASE_KEY);
    if (it == input.end()) {
        return std::nullopt;
    }
    return categoryFromSelector(it->second);
}

std::vector<std::string> distinctWorkerCases(const std::vector<std::string>& cases) {
    std::vector<std::string> distinct;
    for (const auto& workerCase : cases) {
        if (std::find(distinct.begin(), distinct.end(), workerCase) == distinct.end()) {
            distinct.push_back(workerCase);
        }
    }
    return distinct;
}

const char* selectorFor(Category category) noexcept {
    switch (category) {
        case Category::Event: return EVENT_WORKER;
        case Category::Exception: return EXCEPTION_WORKER;
        case Category::PerformanceMetric: return PERFORMANCE_METRICS_WORKER;
    }
    return "";
}

const char* categoryName(Category category) noexcept {
    switch (category) {
        case Category::Event: return "events";
        case Category::Exception: return "exceptions";
        case Category::PerformanceMetric: return "performance_metrics";
    }
    return "unknown";
}

const char* outcomeName(Outcome outcome) noexcept {
    return outcome == Outcome::Success ? "success" : "failure";
}

}
