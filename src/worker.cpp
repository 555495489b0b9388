/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "logup/worker.hpp"
#include "logup/bulk_uploader.hpp"
#include "logup/drain_uploader.hpp"
#include "logup/exception.hpp"
#include "logup/logger.hpp"
#include <stdexcept>

namespace logup {

LogUploadWorker::LogUploadWorker(Pool& pool, const UploadContext& context)
    : pool_(pool), context_(context) {
    validate(context_);
}

void LogUploadWorker::validate(const UploadContext& context) {
    if (!context.exceptionStore) throw std::invalid_argument("missing exception store");
    if (!context.metricStore) throw std::invalid_argument("missing performance metric store");
    if (!context.exceptionSink) throw std::invalid_argument("missing exception sink");
    if (!context.metricSink) throw std::invalid_argument("missing performance metric sink");
    if (!context.eventUploader) throw std::invalid_argument("missing event uploader");
    if (!context.syncStatus) throw std::invalid_argument("missing sync status reporter");
    if (!context.diagnostics) throw std::invalid_argument("missing diagnostics");
}

WorkFuture LogUploadWorker::startWork(const JobInput& input) {
    std::optional<Category> category = categoryFromInput(input);
    if (!category) {
        auto it = input.find(WORKER_CASE_KEY);
        LOG_WARN("Unrecognized worker case '" + (it == input.end() ? std::string("<missing>") : it->second) +
                 "', nothing uploaded");
        return WorkFuture::resolved(WorkResult::from(Outcome::Failure));
    }

    WorkFuture future;
    const Category selected = *category;
    const UploadContext context = context_;
    std::shared_ptr<const CancelToken> token = future.token();

    // TODO: bound the task with a deadline once sinks support cancellation
    bool submitted = pool_.submit([future, context, selected, token]() mutable {
        try {
            future.set(WorkResult::from(upload(context, selected, token)));
        } catch (...) {
            future.set(WorkResult::fault(std::current_exception()));
        }
    });

    if (!submitted) {
        LOG_ERROR(std::string("Could not schedule upload of ") + categoryName(selected));
        future.set(WorkResult::fault(
            std::make_exception_ptr(std::runtime_error("background pool refused upload task"))));
    } else {
        LOG_DEBUG(std::string("Scheduled upload of ") + categoryName(selected));
    }
    return future;
}

Outcome LogUploadWorker::upload(const UploadContext& context, Category category,
                                const std::shared_ptr<const CancelToken>& token) {
    switch (category) {
        case Category::Event: {
            BulkUploader uploader(*context.eventUploader, *context.syncStatus, *context.diagnostics);
            return uploader.run();
        }
        case Category::Exception: {
            ExceptionSink* sink = context.exceptionSink;
            DrainUploader<ExceptionLogEntry> uploader(
                category, *context.exceptionStore,
                [sink](const ExceptionLogEntry& entry) { sink->logException(toException(entry)); },
                *context.diagnostics, token);
            return uploader.run();
        }
        case Category::PerformanceMetric: {
            PerformanceMetricSink* sink = context.metricSink;
            DrainUploader<PerformanceMetricLogEntry> uploader(
                category, *context.metricStore,
                [sink](const PerformanceMetricLogEntry& entry) { sink->logPerformanceMetric(entry); },
                *context.diagnostics, token);
            return uploader.run();
        }
    }
    return Outcome::Failure;
}

}
