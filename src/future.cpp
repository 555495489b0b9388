/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "logup/future.hpp"
#include "logup/exception.hpp"
#include "logup/logger.hpp"

namespace logup {

void WorkResult::rethrowIfFault() const {
    if (kind == ResultKind::Fault && cause) {
        std::rethrow_exception(cause);
    }
}

std::string WorkResult::describe() const {
    switch (kind) {
        case ResultKind::Success: return "success";
        case ResultKind::Failure: return "failure";
        case ResultKind::Fault: return "fault: " + logup::describe(cause);
    }
    return "unknown";
}

WorkFuture::WorkFuture()
    : state_(std::make_shared<State>()), token_(std::make_shared<CancelToken>()) {
}

WorkFuture WorkFuture::resolved(WorkResult result) {
    WorkFuture future;
    future.set(std::move(result));
    return future;
}

bool WorkFuture::set(WorkResult result) {
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->result) {
            LOG_WARN("Ignoring second completion of work result");
            return false;
        }
        state_->result = result;
        listeners.swap(state_->listeners);
    }
    state_->done.notify_all();

    for (auto& listener : listeners) {
        notify(listener, result);
    }
    return true;
}

void WorkFuture::notify(const Listener& listener, const WorkResult& result) noexcept {
    // A failing listener must not stop the others or change the result
    try {
        listener(result);
    } catch (const std::exception& e) {
        LOG_ERROR("Completion listener failed: " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR("Completion listener failed with unknown error");
    }
}

bool WorkFuture::ready() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->result.has_value();
}

WorkResult WorkFuture::get() const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->done.wait(lock, [this] { return state_->result.has_value(); });
    return *state_->result;
}

std::optional<WorkResult> WorkFuture::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (!state_->done.wait_for(lock, timeout, [this] { return state_->result.has_value(); })) {
        return std::nullopt;
    }
    return state_->result;
}

void WorkFuture::onComplete(Listener listener) {
    if (!listener) {
        return;
    }
    std::optional<WorkResult> completed;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->result) {
            state_->listeners.push_back(std::move(listener));
            return;
        }
        completed = state_->result;
    }
    notify(listener, *completed);
}

void WorkFuture::cancel() noexcept {
    token_->cancel();
}

bool WorkFuture::cancelRequested() const noexcept {
    return token_->cancelled();
}

}
