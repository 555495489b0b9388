/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "logup/record_codec.hpp"
#include "logup/store.hpp"
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace logup {

namespace {

using Field = std::pair<std::string, std::string>;

std::string escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string unescape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\') {
            out += s[i];
            continue;
        }
        if (++i >= s.size()) {
            throw StoreError("dangling escape in record value");
        }
        switch (s[i]) {
            case '\\': out += '\\'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            default: throw StoreError(std::string("unknown escape \\") + s[i]);
        }
    }
    return out;
}

std::vector<std::string> splitTabs(const std::string& raw) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        std::size_t tab = raw.find('\t', start);
        parts.push_back(unescape(raw.substr(start, tab - start)));
        if (tab == std::string::npos) break;
        start = tab + 1;
    }
    return parts;
}

std::vector<Field> parse(const std::string& record, const char* kind) {
    std::vector<Field> fields;
    std::istringstream in(record);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw StoreError("malformed record line: " + line);
        }
        fields.emplace_back(line.substr(0, eq), line.substr(eq + 1));
    }
    if (fields.empty() || fields.front().first != "record" || fields.front().second != kind) {
        throw StoreError(std::string("not a ") + kind + " record");
    }
    fields.erase(fields.begin());
    return fields;
}

int64_t parseInt(const std::string& key, const std::string& raw) {
    try {
        std::size_t used = 0;
        long long value = std::stoll(raw, &used);
        if (used != raw.size()) throw std::invalid_argument(raw);
        return static_cast<int64_t>(value);
    } catch (const std::logic_error&) {
        throw StoreError("invalid integer for " + key + ": " + raw);
    }
}

double parseDouble(const std::string& key, const std::string& raw) {
    try {
        std::size_t used = 0;
        double value = std::stod(raw, &used);
        if (used != raw.size()) throw std::invalid_argument(raw);
        return value;
    } catch (const std::logic_error&) {
        throw StoreError("invalid number for " + key + ": " + raw);
    }
}

std::string frameLine(const StackFrame& frame) {
    return escape(frame.declaringClass) + "\t" + escape(frame.methodName) + "\t" +
           escape(frame.fileName) + "\t" + std::to_string(frame.lineNumber);
}

StackFrame parseFrame(const std::string& raw) {
    auto parts = splitTabs(raw);
    if (parts.size() != 4) {
        throw StoreError("stack frame needs 4 fields, got " + std::to_string(parts.size()));
    }
    StackFrame frame;
    frame.declaringClass = parts[0];
    frame.methodName = parts[1];
    frame.fileName = parts[2];
    frame.lineNumber = static_cast<int>(parseInt("frame line", parts[3]));
    return frame;
}

const char* tierName(MemoryTier tier) noexcept {
    switch (tier) {
        case MemoryTier::Unknown: return "unknown";
        case MemoryTier::Low: return "low";
        case MemoryTier::Medium: return "medium";
        case MemoryTier::High: return "high";
    }
    return "unknown";
}

[[noreturn]] void unknownField(const std::string& key) {
    throw StoreError("unknown record field: " + key);
}

}

std::string encodeEntry(const EventLogEntry& entry) {
    std::ostringstream out;
    out << "record=event\n";
    out << "timestamp_ms=" << entry.timestampMs << "\n";
    out << "priority=" << (entry.priority == EventPriority::Optional ? "optional" : "essential") << "\n";
    out << "name=" << escape(entry.name) << "\n";
    out << "context=" << escape(entry.context) << "\n";
    return out.str();
}

void decodeEntry(const std::string& record, EventLogEntry& entry) {
    entry = EventLogEntry{};
    for (const auto& [key, raw] : parse(record, "event")) {
        if (key == "timestamp_ms") {
            entry.timestampMs = parseInt(key, raw);
        } else if (key == "priority") {
            if (raw == "essential") entry.priority = EventPriority::Essential;
            else if (raw == "optional") entry.priority = EventPriority::Optional;
            else throw StoreError("invalid priority: " + raw);
        } else if (key == "name") {
            entry.name = unescape(raw);
        } else if (key == "context") {
            entry.context = unescape(raw);
        } else {
            unknownField(key);
        }
    }
}

std::string encodeEntry(const ExceptionLogEntry& entry) {
    std::ostringstream out;
    out << "record=exception\n";
    out << "timestamp_ms=" << entry.timestampMs << "\n";
    out << "fatal=" << (entry.fatal ? "true" : "false") << "\n";
    out << "type=" << escape(entry.type) << "\n";
    out << "message=" << escape(entry.message) << "\n";
    for (const auto& frame : entry.frames) {
        out << "frame=" << frameLine(frame) << "\n";
    }
    for (const auto& cause : entry.causes) {
        out << "cause=" << escape(cause.type) << "\t" << escape(cause.message) << "\n";
        for (const auto& frame : cause.frames) {
            out << "cause_frame=" << frameLine(frame) << "\n";
        }
    }
    return out.str();
}

void decodeEntry(const std::string& record, ExceptionLogEntry& entry) {
    entry = ExceptionLogEntry{};
    for (const auto& [key, raw] : parse(record, "exception")) {
        if (key == "timestamp_ms") {
            entry.timestampMs = parseInt(key, raw);
        } else if (key == "fatal") {
            if (raw != "true" && raw != "false") throw StoreError("invalid fatal flag: " + raw);
            entry.fatal = raw == "true";
        } else if (key == "type") {
            entry.type = unescape(raw);
        } else if (key == "message") {
            entry.message = unescape(raw);
        } else if (key == "frame") {
            entry.frames.push_back(parseFrame(raw));
        } else if (key == "cause") {
            auto parts = splitTabs(raw);
            if (parts.size() != 2) throw StoreError("cause needs type and message");
            entry.causes.push_back(ExceptionCause{parts[0], parts[1], {}});
        } else if (key == "cause_frame") {
            if (entry.causes.empty()) throw StoreError("cause_frame before any cause");
            entry.causes.back().frames.push_back(parseFrame(raw));
        } else {
            unknownField(key);
        }
    }
}

std::string encodeEntry(const PerformanceMetricLogEntry& entry) {
    std::ostringstream out;
    out << "record=performance_metric\n";
    out << "timestamp_ms=" << entry.timestampMs << "\n";
    out << "metric=" << escape(entry.metricName) << "\n";
    out << "screen=" << escape(entry.currentScreen) << "\n";
    out << "value=" << std::setprecision(std::numeric_limits<double>::max_digits10) << entry.value << "\n";
    out << "memory_tier=" << tierName(entry.memoryTier) << "\n";
    return out.str();
}

void decodeEntry(const std::string& record, PerformanceMetricLogEntry& entry) {
    entry = PerformanceMetricLogEntry{};
    for (const auto& [key, raw] : parse(record, "performance_metric")) {
        if (key == "timestamp_ms") {
            entry.timestampMs = parseInt(key, raw);
        } else if (key == "metric") {
            entry.metricName = unescape(raw);
        } else if (key == "screen") {
            entry.currentScreen = unescape(raw);
        } else if (key == "value") {
            entry.value = parseDouble(key, raw);
        } else if (key == "memory_tier") {
            if (raw == "unknown") entry.memoryTier = MemoryTier::Unknown;
            else if (raw == "low") entry.memoryTier = MemoryTier::Low;
            else if (raw == "medium") entry.memoryTier = MemoryTier::Medium;
            else if (raw == "high") entry.memoryTier = MemoryTier::High;
            else throw StoreError("invalid memory tier: " + raw);
        } else {
            unknownField(key);
        }
    }
}

}
