/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <exception>
#include <string>

#include "logup/entries.hpp"
#include "logup/exception.hpp"

namespace logup {

// Remote destinations. Any throw means the item was not delivered.

class ExceptionSink {
public:
    virtual ~ExceptionSink() = default;
    virtual void logException(const LoggedException& exception) = 0;
};

class PerformanceMetricSink {
public:
    virtual ~PerformanceMetricSink() = default;
    virtual void logPerformanceMetric(const PerformanceMetricLogEntry& entry) = 0;
};

class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void logEvent(const EventLogEntry& entry) = 0;
};

// Uploads every pending event and returns once the batch is done.
class EventUploader {
public:
    virtual ~EventUploader() = default;
    virtual void uploadAllEventsAndWait() = 0;
};

class SyncStatusReporter {
public:
    virtual ~SyncStatusReporter() = default;
    virtual void reportUploadError() = 0;
};

class Diagnostics {
public:
    virtual ~Diagnostics() = default;
    virtual void error(const std::string& tag, const std::string& message, std::exception_ptr cause) = 0;
};

// Diagnostics on top of Logger.
class ConsoleDiagnostics final : public Diagnostics {
public:
    void error(const std::string& tag, const std::string& message, std::exception_ptr cause) override;
};

class LoggingExceptionSink final : public ExceptionSink {
public:
    void logException(const LoggedException& exception) override;
};

class LoggingPerformanceMetricSink final : public PerformanceMetricSink {
public:
    void logPerformanceMetric(const PerformanceMetricLogEntry& entry) override;
};

class LoggingEventSink final : public EventSink {
public:
    void logEvent(const EventLogEntry& entry) override;
};

enum class SyncStatus : uint8_t {
    InitialUnknown,
    DataUploading,
    DataUploaded,
    UploadError
};

[[nodiscard]] const char* syncStatusName(SyncStatus status) noexcept;

class SyncStatusTracker final : public SyncStatusReporter {
public:
    void reportUploadError() override;
    void setStatus(SyncStatus status) noexcept;
    [[nodiscard]] SyncStatus status() const noexcept { return status_.load(); }

private:
    std::atomic<SyncStatus> status_{SyncStatus::InitialUnknown};
};

}
