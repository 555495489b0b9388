#include <cstdlib>

#include "logup/config.hpp"
#include "logup/logger.hpp"
#include "logup/types.hpp"

using namespace logup;

int main() {
    if (categoryFromSelector("event_worker") != Category::Event) return 1;
    if (categoryFromSelector("exception_worker") != Category::Exception) return 2;
    if (categoryFromSelector("performance_metrics_worker") != Category::PerformanceMetric) return 3;
    if (categoryFromSelector("Event_Worker")) return 4;
    if (categoryFromInput(JobInput{})) return 5;
    for (Category c : {Category::Event, Category::Exception, Category::PerformanceMetric}) {
        if (categoryFromSelector(selectorFor(c)) != c) return 6;
    }

    if (Logger::parseLevel("Warning") != LogLevel::WARN) return 10;
    if (Logger::parseLevel("TRACE") != LogLevel::TRACE) return 11;
    if (Logger::parseLevel("loud")) return 12;

    ::setenv("LOGUP_WORKSPACE", "/var/lib/logup", 1);
    ::setenv("LOGUP_WORKERS", "3", 1);
    ::setenv("LOGUP_WATCH_SECONDS", "30", 1);
    Config config = Config::fromEnvironment();
    if (config.workspace != "/var/lib/logup") return 20;
    if (config.workers != 3) return 21;
    if (config.watchInterval != std::chrono::seconds(30)) return 22;

    ::setenv("LOGUP_WORKERS", "many", 1);
    ::setenv("LOGUP_WATCH_SECONDS", "0", 1);
    config = Config::fromEnvironment();
    if (config.workers != 1) return 30;
    if (config.watchInterval.count() != 0) return 31;

    ::setenv("LOGUP_LOG_LEVEL", "debug", 1);
    config = Config::fromEnvironment();
    if (config.logLevel != LogLevel::DEBUG) return 32;
    ::setenv("LOGUP_LOG_LEVEL", "loud", 1);
    config = Config::fromEnvironment();
    if (config.logLevel != LogLevel::INFO) return 33;
    ::unsetenv("LOGUP_LOG_LEVEL");

    auto cases = distinctWorkerCases({EXCEPTION_WORKER, EVENT_WORKER, EXCEPTION_WORKER});
    if (cases.size() != 2) return 50;
    if (cases[0] != std::string(EXCEPTION_WORKER) || cases[1] != std::string(EVENT_WORKER)) return 51;

    ::unsetenv("LOGUP_WORKSPACE");
    ::unsetenv("LOGUP_WORKERS");
    ::unsetenv("LOGUP_WATCH_SECONDS");
    config = Config::fromEnvironment();
    if (!config.workspace.empty() || config.workers != 1) return 40;
    return 0;
}
