/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>

#include "logup/entries.hpp"
#include "logup/future.hpp"
#include "logup/pool.hpp"
#include "logup/sinks.hpp"
#include "logup/store.hpp"
#include "logup/types.hpp"

namespace logup {

// Collaborators used by the worker. Not owned; all must outlive every
// future returned by the worker.
struct UploadContext {
    LogStore<ExceptionLogEntry>* exceptionStore = nullptr;
    LogStore<PerformanceMetricLogEntry>* metricStore = nullptr;
    ExceptionSink* exceptionSink = nullptr;
    PerformanceMetricSink* metricSink = nullptr;
    EventUploader* eventUploader = nullptr;
    SyncStatusReporter* syncStatus = nullptr;
    Diagnostics* diagnostics = nullptr;
};

class LogUploadWorker final {
public:
    // Throws std::invalid_argument if a collaborator is missing.
    LogUploadWorker(Pool& pool, const UploadContext& context);

    LogUploadWorker(const LogUploadWorker&) = delete;
    LogUploadWorker& operator=(const LogUploadWorker&) = delete;

    // Never blocks. An input without a known worker case yields an
    // already-failed future and touches no store or sink.
    [[nodiscard]] WorkFuture startWork(const JobInput& input);

    // Runs one category's upload on the calling thread.
    [[nodiscard]] static Outcome upload(const UploadContext& context, Category category,
                                        const std::shared_ptr<const CancelToken>& token = nullptr);

private:
    static void validate(const UploadContext& context);

    Pool& pool_;
    UploadContext context_;
};

}
