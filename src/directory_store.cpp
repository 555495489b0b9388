/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "logup/directory_store.hpp"
#include "logup/logger.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <unistd.h>

namespace logup {

namespace {
constexpr const char* RECORD_SUFFIX = ".rec";
}

RecordDirectory::RecordDirectory(const std::filesystem::path& root)
    : root_(root), writingPath_(root / "writing"), pendingPath_(root / "pending"),
      failedPath_(root / "failed") {
    if (!createLayout()) {
        LOG_ERROR("Failed to initialize record directory: " + root_.string());
    }
}

bool RecordDirectory::createLayout() noexcept {
    try {
        std::filesystem::create_directories(writingPath_);
        std::filesystem::create_directories(pendingPath_);
        std::filesystem::create_directories(failedPath_);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create record directory: " + std::string(e.what()));
        return false;
    }
}

AppendResult RecordDirectory::append(const std::string& content) noexcept {
    if (content.empty()) {
        return {false, "", AppendError::InvalidContent, "Record is empty"};
    }

    try {
        RecordId id = generateId();
        auto writing = writingPath_ / (id + RECORD_SUFFIX);
        auto ready = pendingPath_ / (id + RECORD_SUFFIX);

        {
            std::ofstream file(writing, std::ios::binary);
            if (!file) {
                return {false, "", AppendError::IoError, "Failed to open " + writing.string()};
            }
            file << content;
            file.flush();
            if (!file.good()) {
                file.close();
                std::error_code ec;
                std::filesystem::remove(writing, ec);
                return {false, "", AppendError::IoError, "Failed to write record " + id};
            }
        }

        std::error_code ec;
        std::filesystem::rename(writing, ready, ec);
        if (ec) {
            std::filesystem::remove(writing, ec);
            return {false, "", AppendError::IoError, "Failed to publish record " + id};
        }

        LOG_DEBUG("Record appended: " + root_.filename().string() + "/" + id);
        return {true, id, AppendError::None, ""};
    } catch (const std::exception& e) {
        return {false, "", AppendError::IoError, e.what()};
    }
}

std::vector<std::filesystem::path> RecordDirectory::pending() const {
    std::vector<std::filesystem::path> records;
    std::error_code ec;
    std::filesystem::directory_iterator it(pendingPath_, ec);
    if (ec) {
        throw StoreError("Cannot list " + pendingPath_.string() + ": " + ec.message());
    }

    for (const auto& entry : it) {
        if (entry.is_regular_file() && entry.path().extension().string() == RECORD_SUFFIX) {
            records.push_back(entry.path());
        }
    }

    // Ids sort by creation time
    std::sort(records.begin(), records.end());
    return records;
}

std::string RecordDirectory::read(const std::filesystem::path& record) const {
    std::ifstream file(record, std::ios::binary);
    if (!file) {
        throw StoreError("Cannot open record " + record.string());
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

void RecordDirectory::removeOldest() {
    auto records = pending();
    if (records.empty()) {
        throw StoreError("removeOldest on empty store " + root_.string());
    }

    std::error_code ec;
    if (!std::filesystem::remove(records.front(), ec) || ec) {
        throw StoreError("Failed to remove " + records.front().string() +
                         (ec ? ": " + ec.message() : std::string()));
    }
    LOG_TRACE("Record removed: " + records.front().filename().string());
}

void RecordDirectory::quarantine(const std::filesystem::path& record, const std::string& reason) {
    LOG_ERROR("Unreadable record " + record.filename().string() + ": " + reason);

    std::error_code ec;
    std::filesystem::create_directories(failedPath_, ec);
    std::filesystem::rename(record, failedPath_ / record.filename(), ec);
    if (ec) {
        throw StoreError("Failed to move " + record.filename().string() + " to " +
                         failedPath_.string() + ": " + ec.message());
    }
    LOG_WARN("Record moved to failed: " + record.filename().string());
}

std::size_t RecordDirectory::count() const noexcept {
    try {
        return pending().size();
    } catch (const std::exception&) {
        return 0;
    }
}

RecordId RecordDirectory::generateId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    // Fixed widths keep lexical order equal to creation order
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(20) << now << "_"
       << std::setw(8) << getpid() << "_"
       << std::setw(10) << unique_counter;
    return ss.str();
}

}
