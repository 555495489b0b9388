/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "logup/exception.hpp"
#include <sstream>
#include <utility>

namespace logup {

namespace {

std::vector<StackFrame> checkedFrames(const std::vector<StackFrame>& frames) {
    for (const auto& frame : frames) {
        if (frame.declaringClass.empty()) {
            throw TranslationError("stack frame without declaring class");
        }
        if (frame.methodName.empty()) {
            throw TranslationError("stack frame without method name in " + frame.declaringClass);
        }
    }
    return frames;
}

}

LoggedException::LoggedException(std::string type, const std::string& message, std::vector<StackFrame> frames,
                                 std::shared_ptr<const LoggedException> cause, bool fatal)
    : std::runtime_error(message), type_(std::move(type)), frames_(std::move(frames)),
      cause_(std::move(cause)), fatal_(fatal) {
}

LoggedException toException(const ExceptionLogEntry& entry) {
    // Build innermost first so each level can point at the next.
    std::shared_ptr<const LoggedException> cause;
    for (auto it = entry.causes.rbegin(); it != entry.causes.rend(); ++it) {
        cause = std::make_shared<const LoggedException>(
            it->type, it->message, checkedFrames(it->frames), cause);
    }
    return LoggedException(entry.type, entry.message, checkedFrames(entry.frames), cause, entry.fatal);
}

std::string describe(const LoggedException& exception) {
    std::ostringstream out;
    const LoggedException* current = &exception;
    bool first = true;
    while (current) {
        if (!first) {
            out << "\nCaused by: ";
        }
        out << (current->type().empty() ? "Exception" : current->type());
        if (*current->what() != '\0') {
            out << ": " << current->what();
        }
        first = false;
        current = current->cause();
    }
    return out.str();
}

std::string describe(const std::exception_ptr& error) noexcept {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const LoggedException& e) {
        try {
            return describe(e);
        } catch (...) {
            return e.what();
        }
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

}
