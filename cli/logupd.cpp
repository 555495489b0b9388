/*
 * logup - Upload daemon (logupd)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "logup/config.hpp"
#include "logup/directory_store.hpp"
#include "logup/event_uploader.hpp"
#include "logup/logger.hpp"
#include "logup/pool.hpp"
#include "logup/sinks.hpp"
#include "logup/worker.hpp"
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace logup;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "logup Upload Daemon v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> [worker_case...] [options]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Worker cases:\n";
    std::cout << "  " << EVENT_WORKER << "\n";
    std::cout << "  " << EXCEPTION_WORKER << "\n";
    std::cout << "  " << PERFORMANCE_METRICS_WORKER << "\n";
    std::cout << "  (default: all three)\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --workers <n>     Background threads (default: 1)\n";
    std::cout << "  --log-level <level>   Log level (overrides LOGUP_LOG_LEVEL)\n";
    std::cout << "  --watch <seconds>     Repeat the uploads every <seconds> until interrupted\n";
    std::cout << "  -h, --help            Show this help message\n";
    std::cout << "  -v, --version         Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  LOGUP_WORKSPACE       Workspace used when none is given\n";
    std::cout << "  LOGUP_WORKERS         Background threads\n";
    std::cout << "  LOGUP_WATCH_SECONDS   Repeat interval\n";
    std::cout << "  LOGUP_LOG_LEVEL       Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
}

bool parseCount(const std::string& text, long long& value) {
    try {
        std::size_t used = 0;
        value = std::stoll(text, &used);
        return used == text.size() && value >= 0;
    } catch (const std::exception&) {
        return false;
    }
}

// Starts every case at once and waits for all of them.
bool runRound(LogUploadWorker& worker, const std::vector<std::string>& cases) {
    std::vector<WorkFuture> futures;
    futures.reserve(cases.size());
    for (const auto& workerCase : cases) {
        futures.push_back(worker.startWork(JobInput{{WORKER_CASE_KEY, workerCase}}));
    }

    bool allSucceeded = true;
    for (std::size_t i = 0; i < cases.size(); ++i) {
        WorkResult result = futures[i].get();
        std::cout << "  " << cases[i] << "  " << result.describe() << "\n" << std::flush;
        allSucceeded = allSucceeded && result.succeeded();
    }
    return allSucceeded;
}

int main(int argc, char* argv[]) {
    Config config = Config::fromEnvironment();
    std::vector<std::string> positional;
    std::vector<std::string> cases;
    std::string workspace = config.workspace.string();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
        if (arg == "--log-level") {
            std::optional<LogLevel> level;
            if (i + 1 >= argc || !(level = Logger::parseLevel(argv[i + 1]))) {
                std::cerr << "Error: --log-level requires error, warn, info, debug or trace\n";
                return 1;
            }
            ++i;
            config.logLevel = *level;
            continue;
        }
        if (arg == "-w" || arg == "--workers" || arg == "--watch") {
            long long value = 0;
            if (i + 1 >= argc || !parseCount(argv[i + 1], value)) {
                std::cerr << "Error: " << arg << " requires a non-negative number\n";
                return 1;
            }
            ++i;
            if (arg == "--watch") {
                config.watchInterval = std::chrono::seconds(value);
            } else {
                config.workers = value > 0 ? static_cast<int>(std::min<long long>(value, 64)) : 1;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown option " << arg << "\n";
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    // The workspace may come from LOGUP_WORKSPACE, leaving only worker cases
    std::size_t first = 0;
    if (!positional.empty() && !(categoryFromSelector(positional[0]) && !workspace.empty())) {
        workspace = positional[0];
        first = 1;
    }
    cases = distinctWorkerCases(
        std::vector<std::string>(positional.begin() + static_cast<std::ptrdiff_t>(first), positional.end()));

    if (workspace.empty()) {
        printUsage(argv[0]);
        return 1;
    }
    if (cases.empty()) {
        cases = {EVENT_WORKER, EXCEPTION_WORKER, PERFORMANCE_METRICS_WORKER};
    }

    Logger::setLevel(config.logLevel);
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    setThreadName("Main");

    try {
        DirectoryLogStore<EventLogEntry> eventStore(workspace);
        DirectoryLogStore<ExceptionLogEntry> exceptionStore(workspace);
        DirectoryLogStore<PerformanceMetricLogEntry> metricStore(workspace);

        LoggingEventSink eventSink;
        LoggingExceptionSink exceptionSink;
        LoggingPerformanceMetricSink metricSink;
        SyncStatusTracker syncStatus;
        ConsoleDiagnostics diagnostics;
        StoreEventUploader eventUploader(eventStore, eventSink, syncStatus);

        UploadContext context;
        context.exceptionStore = &exceptionStore;
        context.metricStore = &metricStore;
        context.exceptionSink = &exceptionSink;
        context.metricSink = &metricSink;
        context.eventUploader = &eventUploader;
        context.syncStatus = &syncStatus;
        context.diagnostics = &diagnostics;

        Pool pool(config.workers);
        if (!pool.start()) {
            std::cerr << "Error: failed to start background pool\n";
            return 1;
        }
        LogUploadWorker worker(pool, context);

        LOG_DEBUG("Workspace: " + workspace);
        LOG_DEBUG("Workers: " + std::to_string(config.workers));

        bool ok = runRound(worker, cases);
        while (config.watchInterval.count() > 0 && !g_shutdown_requested) {
            auto wakeAt = std::chrono::steady_clock::now() + config.watchInterval;
            while (!g_shutdown_requested && std::chrono::steady_clock::now() < wakeAt) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            if (g_shutdown_requested) {
                break;
            }
            ok = runRound(worker, cases);
        }

        LOG_DEBUG(std::string("Sync status: ") + syncStatusName(syncStatus.status()));
        pool.stop();
        return ok ? 0 : 2;

    } catch (const std::exception& e) {
        LOG_ERROR("Upload daemon error: " + std::string(e.what()));
        return 1;
    }
}
