#pragma once
#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "logup/entries.hpp"
#include "logup/exception.hpp"
#include "logup/sinks.hpp"
#include "logup/store.hpp"
#include "logup/worker.hpp"

namespace fakes {

// Not derived from std::exception, so uploaders do not treat it as a delivery failure.
struct Crash {
    int code;
};

template <typename Entry>
class CountingStore final : public logup::LogStore<Entry> {
public:
    void append(Entry entry) { inner.append(std::move(entry)); }

    std::vector<Entry> listPending() override {
        ++lists;
        return inner.listPending();
    }

    void removeOldest() override {
        ++removes;
        if (failRemove) {
            throw logup::StoreError("disk full");
        }
        inner.removeOldest();
    }

    std::size_t size() const { return inner.size(); }

    logup::MemoryLogStore<Entry> inner;
    std::atomic<int> lists{0};
    std::atomic<int> removes{0};
    bool failRemove = false;
};

// Fails the failAt-th call (1-indexed); 0 never fails.
class ScriptedExceptionSink final : public logup::ExceptionSink {
public:
    void logException(const logup::LoggedException& exception) override {
        ++calls;
        if (calls == failAt) {
            if (crash) throw Crash{calls};
            throw std::runtime_error("remote rejected " + std::string(exception.what()));
        }
        received.push_back(exception.what());
    }

    int calls = 0;
    int failAt = 0;
    bool crash = false;
    std::vector<std::string> received;
};

class ScriptedMetricSink final : public logup::PerformanceMetricSink {
public:
    void logPerformanceMetric(const logup::PerformanceMetricLogEntry& entry) override {
        ++calls;
        if (calls == failAt) {
            if (crash) throw Crash{calls};
            throw std::runtime_error("remote rejected " + entry.metricName);
        }
        received.push_back(entry.metricName);
    }

    int calls = 0;
    int failAt = 0;
    bool crash = false;
    std::vector<std::string> received;
};

class ScriptedEventUploader final : public logup::EventUploader {
public:
    void uploadAllEventsAndWait() override {
        ++calls;
        if (crash) throw Crash{7};
        if (fail) throw std::runtime_error("network unreachable");
    }

    std::atomic<int> calls{0};
    bool fail = false;
    bool crash = false;
};

class CountingSyncStatus final : public logup::SyncStatusReporter {
public:
    void reportUploadError() override { ++errors; }
    std::atomic<int> errors{0};
};

class RecordingDiagnostics final : public logup::Diagnostics {
public:
    struct Record {
        std::string tag;
        std::string message;
        std::exception_ptr cause;
    };

    void error(const std::string& tag, const std::string& message, std::exception_ptr cause) override {
        if (crash) throw Crash{99};
        std::lock_guard<std::mutex> lock(mutex);
        records.push_back({tag, message, cause});
    }

    std::size_t count() {
        std::lock_guard<std::mutex> lock(mutex);
        return records.size();
    }

    std::mutex mutex;
    std::vector<Record> records;
    bool crash = false;
};

// Blocks every event upload until open() is called.
class GatedEventUploader final : public logup::EventUploader {
public:
    void uploadAllEventsAndWait() override {
        std::unique_lock<std::mutex> lock(mutex);
        entered = true;
        changed.notify_all();
        changed.wait(lock, [this] { return isOpen; });
    }

    void open() {
        std::lock_guard<std::mutex> lock(mutex);
        isOpen = true;
        changed.notify_all();
    }

    void waitEntered() {
        std::unique_lock<std::mutex> lock(mutex);
        changed.wait(lock, [this] { return entered; });
    }

    std::mutex mutex;
    std::condition_variable changed;
    bool isOpen = false;
    bool entered = false;
};

struct Harness {
    CountingStore<logup::ExceptionLogEntry> exceptionStore;
    CountingStore<logup::PerformanceMetricLogEntry> metricStore;
    ScriptedExceptionSink exceptionSink;
    ScriptedMetricSink metricSink;
    ScriptedEventUploader eventUploader;
    CountingSyncStatus syncStatus;
    RecordingDiagnostics diagnostics;

    logup::UploadContext context() {
        logup::UploadContext ctx;
        ctx.exceptionStore = &exceptionStore;
        ctx.metricStore = &metricStore;
        ctx.exceptionSink = &exceptionSink;
        ctx.metricSink = &metricSink;
        ctx.eventUploader = &eventUploader;
        ctx.syncStatus = &syncStatus;
        ctx.diagnostics = &diagnostics;
        return ctx;
    }

    int collaboratorCalls() const {
        return exceptionStore.lists + exceptionStore.removes + metricStore.lists + metricStore.removes +
               exceptionSink.calls + metricSink.calls + eventUploader.calls + syncStatus.errors;
    }
};

inline logup::ExceptionLogEntry exceptionEntry(const std::string& message) {
    logup::ExceptionLogEntry entry;
    entry.type = "java.lang.IllegalStateException";
    entry.message = message;
    entry.frames.push_back({"org.example.Player", "advance", "Player.kt", 42});
    return entry;
}

inline logup::PerformanceMetricLogEntry metricEntry(const std::string& name, double value = 1.0) {
    logup::PerformanceMetricLogEntry entry;
    entry.metricName = name;
    entry.currentScreen = "home";
    entry.value = value;
    return entry;
}

template <typename Entry, typename Get>
std::vector<std::string> pendingNames(logup::MemoryLogStore<Entry>& store, Get get) {
    std::vector<std::string> names;
    for (const auto& entry : store.listPending()) {
        names.push_back(get(entry));
    }
    return names;
}

}
