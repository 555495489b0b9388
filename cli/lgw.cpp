/*
 * logup - Log entry writer (lgw)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "logup/directory_store.hpp"
#include "logup/entries.hpp"
#include "logup/logger.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace logup;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "logup Log Entry Writer v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> event <name> [context...] [--optional]\n";
    std::cout << "       " << progName << " <workspace> exception <message...> [--type <name>] [--fatal]\n";
    std::cout << "                 [--frame <class> <method> <file> <line>] ...\n";
    std::cout << "       " << progName << " <workspace> metric <name> <value> [--screen <name>]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Appends one pending entry to the workspace store and prints its id.\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  LOGUP_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
}

int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string joinWords(const std::vector<std::string>& words) {
    std::ostringstream out;
    for (std::size_t i = 0; i < words.size(); ++i) {
        if (i) out << " ";
        out << words[i];
    }
    return out.str();
}

int report(const AppendResult& result) {
    if (!result) {
        std::cerr << "Error: " << result.message << std::endl;
        return 1;
    }
    std::cout << result.id << std::endl;
    return 0;
}

int writeEvent(const std::string& workspace, const std::vector<std::string>& args) {
    EventLogEntry entry;
    entry.timestampMs = nowMs();
    std::vector<std::string> context;
    for (const auto& arg : args) {
        if (arg == "--optional") {
            entry.priority = EventPriority::Optional;
        } else if (entry.name.empty()) {
            entry.name = arg;
        } else {
            context.push_back(arg);
        }
    }
    if (entry.name.empty()) {
        std::cerr << "Error: event name required\n";
        return 1;
    }
    entry.context = joinWords(context);

    DirectoryLogStore<EventLogEntry> store(workspace);
    return report(store.append(entry));
}

int writeException(const std::string& workspace, const std::vector<std::string>& args) {
    ExceptionLogEntry entry;
    entry.timestampMs = nowMs();
    entry.type = "Exception";
    std::vector<std::string> words;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--fatal") {
            entry.fatal = true;
        } else if (arg == "--type") {
            if (i + 1 >= args.size()) {
                std::cerr << "Error: --type requires a name\n";
                return 1;
            }
            entry.type = args[++i];
        } else if (arg == "--frame") {
            if (i + 4 >= args.size()) {
                std::cerr << "Error: --frame requires <class> <method> <file> <line>\n";
                return 1;
            }
            StackFrame frame;
            frame.declaringClass = args[++i];
            frame.methodName = args[++i];
            frame.fileName = args[++i];
            try {
                frame.lineNumber = std::stoi(args[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: invalid frame line: " << args[i] << "\n";
                return 1;
            }
            entry.frames.push_back(frame);
        } else {
            words.push_back(arg);
        }
    }
    entry.message = joinWords(words);
    if (entry.message.empty()) {
        std::cerr << "Error: exception message required\n";
        return 1;
    }

    DirectoryLogStore<ExceptionLogEntry> store(workspace);
    return report(store.append(entry));
}

int writeMetric(const std::string& workspace, const std::vector<std::string>& args) {
    PerformanceMetricLogEntry entry;
    entry.timestampMs = nowMs();
    std::vector<std::string> positional;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--screen") {
            if (i + 1 >= args.size()) {
                std::cerr << "Error: --screen requires a name\n";
                return 1;
            }
            entry.currentScreen = args[++i];
        } else {
            positional.push_back(args[i]);
        }
    }
    if (positional.size() != 2) {
        std::cerr << "Error: metric needs <name> <value>\n";
        return 1;
    }
    entry.metricName = positional[0];
    try {
        entry.value = std::stod(positional[1]);
    } catch (const std::exception&) {
        std::cerr << "Error: invalid metric value: " << positional[1] << "\n";
        return 1;
    }

    DirectoryLogStore<PerformanceMetricLogEntry> store(workspace);
    return report(store.append(entry));
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; LOGUP_LOG_LEVEL overrides
    if (!std::getenv("LOGUP_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

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
    }

    if (argc < 4) {
        printUsage(argv[0]);
        return 1;
    }

    std::string workspace = argv[1];
    std::string kind = argv[2];
    std::vector<std::string> args(argv + 3, argv + argc);

    try {
        if (kind == "event") return writeEvent(workspace, args);
        if (kind == "exception") return writeException(workspace, args);
        if (kind == "metric") return writeMetric(workspace, args);

        std::cerr << "Error: unknown entry kind '" << kind << "'\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
