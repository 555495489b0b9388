/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "logup/entries.hpp"

namespace logup {

// Throwable form of a stored exception, handed to the exception sink.
class LoggedException : public std::runtime_error {
public:
    LoggedException(std::string type, const std::string& message, std::vector<StackFrame> frames,
                    std::shared_ptr<const LoggedException> cause = nullptr, bool fatal = false);

    [[nodiscard]] const std::string& type() const noexcept { return type_; }
    [[nodiscard]] const std::vector<StackFrame>& frames() const noexcept { return frames_; }
    [[nodiscard]] const LoggedException* cause() const noexcept { return cause_.get(); }
    [[nodiscard]] bool fatal() const noexcept { return fatal_; }

private:
    std::string type_;
    std::vector<StackFrame> frames_;
    std::shared_ptr<const LoggedException> cause_;
    bool fatal_;
};

// Raised when a stored exception cannot be turned back into a LoggedException.
class TranslationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

[[nodiscard]] LoggedException toException(const ExceptionLogEntry& entry);

// "type: message" for the whole cause chain, one line per level.
[[nodiscard]] std::string describe(const LoggedException& exception);

// Best-effort text for any captured exception.
[[nodiscard]] std::string describe(const std::exception_ptr& error) noexcept;

}
