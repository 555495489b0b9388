/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <deque>
#include <initializer_list>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

namespace logup {

// Raised by stores when pending entries cannot be read or removed.
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Ordered queue of pending entries for one category.
// Callers remove the head only after that entry was delivered.
template <typename Entry>
class LogStore {
public:
    virtual ~LogStore() = default;

    // Snapshot of all pending entries, oldest first.
    [[nodiscard]] virtual std::vector<Entry> listPending() = 0;
    virtual void removeOldest() = 0;
};

template <typename Entry>
class MemoryLogStore final : public LogStore<Entry> {
public:
    MemoryLogStore() = default;
    MemoryLogStore(std::initializer_list<Entry> entries) : entries_(entries) {}

    void append(Entry entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(std::move(entry));
    }

    [[nodiscard]] std::vector<Entry> listPending() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<Entry>(entries_.begin(), entries_.end());
    }

    void removeOldest() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entries_.empty()) {
            throw StoreError("removeOldest on empty store");
        }
        entries_.pop_front();
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<Entry> entries_;
};

}
