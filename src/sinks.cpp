/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "logup/sinks.hpp"
#include "logup/logger.hpp"
#include <sstream>

namespace logup {

void ConsoleDiagnostics::error(const std::string& tag, const std::string& message, std::exception_ptr cause) {
    if (cause) {
        LOG_ERROR(tag + ": " + message + "\n" + describe(cause));
    } else {
        LOG_ERROR(tag + ": " + message);
    }
}

void LoggingExceptionSink::logException(const LoggedException& exception) {
    std::ostringstream out;
    out << (exception.fatal() ? "FATAL " : "NON_FATAL ") << describe(exception);
    for (const auto& frame : exception.frames()) {
        out << "\n    at " << frame.declaringClass << "." << frame.methodName
            << "(" << (frame.fileName.empty() ? "Unknown Source" : frame.fileName);
        if (frame.lineNumber >= 0) {
            out << ":" << frame.lineNumber;
        }
        out << ")";
    }
    LOG_INFO("Exception uploaded: " + out.str());
}

void LoggingPerformanceMetricSink::logPerformanceMetric(const PerformanceMetricLogEntry& entry) {
    std::ostringstream out;
    out << entry.metricName << "=" << entry.value << " screen=" << entry.currentScreen
        << " ts=" << entry.timestampMs;
    LOG_INFO("Performance metric uploaded: " + out.str());
}

void LoggingEventSink::logEvent(const EventLogEntry& entry) {
    LOG_INFO("Event uploaded: " + entry.name + " ts=" + std::to_string(entry.timestampMs) +
             (entry.context.empty() ? "" : " context=" + entry.context));
}

const char* syncStatusName(SyncStatus status) noexcept {
    switch (status) {
        case SyncStatus::InitialUnknown: return "initial_unknown";
        case SyncStatus::DataUploading: return "data_uploading";
        case SyncStatus::DataUploaded: return "data_uploaded";
        case SyncStatus::UploadError: return "upload_error";
    }
    return "unknown";
}

void SyncStatusTracker::reportUploadError() {
    setStatus(SyncStatus::UploadError);
}

void SyncStatusTracker::setStatus(SyncStatus status) noexcept {
    SyncStatus previous = status_.exchange(status);
    if (previous != status) {
        LOG_DEBUG(std::string("Sync status: ") + syncStatusName(previous) + " -> " + syncStatusName(status));
    }
}

}
