/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "logup/types.hpp"

namespace logup {

enum class ResultKind : uint8_t {
    Success,
    Failure,
    // The upload operation itself crashed; cause holds what escaped.
    Fault
};

struct WorkResult {
    ResultKind kind = ResultKind::Failure;
    std::exception_ptr cause;

    [[nodiscard]] static WorkResult from(Outcome outcome) noexcept {
        return {outcome == Outcome::Success ? ResultKind::Success : ResultKind::Failure, nullptr};
    }
    [[nodiscard]] static WorkResult fault(std::exception_ptr error) noexcept {
        return {ResultKind::Fault, std::move(error)};
    }

    [[nodiscard]] bool succeeded() const noexcept { return kind == ResultKind::Success; }
    [[nodiscard]] bool faulted() const noexcept { return kind == ResultKind::Fault; }
    // Throws the original cause of a Fault; no-op otherwise.
    void rethrowIfFault() const;
    [[nodiscard]] std::string describe() const;
};

// Cooperative cancellation flag shared between a future and its task.
class CancelToken {
public:
    void cancel() noexcept { cancelled_.store(true); }
    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// Write-once result slot shared by the producing task and any number of readers.
class WorkFuture {
public:
    using Listener = std::function<void(const WorkResult&)>;

    WorkFuture();

    [[nodiscard]] static WorkFuture resolved(WorkResult result);

    // First call wins; later calls return false and change nothing.
    bool set(WorkResult result);

    [[nodiscard]] bool ready() const;
    [[nodiscard]] WorkResult get() const;
    [[nodiscard]] std::optional<WorkResult> waitFor(std::chrono::milliseconds timeout) const;

    // Runs on the completing thread, or immediately if already complete.
    void onComplete(Listener listener);

    // Requests cancellation; the future still resolves when the task ends.
    void cancel() noexcept;
    [[nodiscard]] bool cancelRequested() const noexcept;
    [[nodiscard]] std::shared_ptr<const CancelToken> token() const noexcept { return token_; }

private:
    struct State {
        mutable std::mutex mutex;
        std::condition_variable done;
        std::optional<WorkResult> result;
        std::vector<Listener> listeners;
    };

    static void notify(const Listener& listener, const WorkResult& result) noexcept;

    std::shared_ptr<State> state_;
    std::shared_ptr<CancelToken> token_;
};

}
