/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "logup/exception.hpp"
#include "logup/future.hpp"
#include "logup/logger.hpp"
#include "logup/sinks.hpp"
#include "logup/store.hpp"
#include "logup/types.hpp"

namespace logup {

// Reads one snapshot of a store and forwards it oldest-first, removing the
// head after each confirmed delivery. The first error stops the pass and
// leaves the failing entry and everything after it pending.
template <typename Entry>
class DrainUploader final {
public:
    using Forward = std::function<void(const Entry&)>;

    DrainUploader(Category category, LogStore<Entry>& store, Forward forward, Diagnostics& diagnostics,
                  std::shared_ptr<const CancelToken> token = nullptr)
        : category_(category), store_(store), forward_(std::move(forward)),
          diagnostics_(diagnostics), token_(std::move(token)) {}

    DrainUploader(const DrainUploader&) = delete;
    DrainUploader& operator=(const DrainUploader&) = delete;

    [[nodiscard]] Outcome run() {
        const std::string name = categoryName(category_);
        try {
            std::vector<Entry> snapshot = store_.listPending();
            LOG_DEBUG("Uploading " + std::to_string(snapshot.size()) + " pending " + name);

            std::size_t forwarded = 0;
            for (const Entry& entry : snapshot) {
                if (token_ && token_->cancelled()) {
                    LOG_WARN("Upload of " + name + " cancelled after " + std::to_string(forwarded) + " of " +
                             std::to_string(snapshot.size()));
                    return Outcome::Failure;
                }
                forward_(entry);
                store_.removeOldest();
                ++forwarded;
            }

            LOG_DEBUG("Uploaded " + std::to_string(forwarded) + " " + name);
            return Outcome::Success;
        } catch (const std::exception&) {
            diagnostics_.error(WORKER_TAG, "Failed to upload " + name + ": " + describe(std::current_exception()),
                               std::current_exception());
            return Outcome::Failure;
        }
    }

private:
    Category category_;
    LogStore<Entry>& store_;
    Forward forward_;
    Diagnostics& diagnostics_;
    std::shared_ptr<const CancelToken> token_;
};

}
