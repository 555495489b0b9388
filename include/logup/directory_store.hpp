/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "logup/record_codec.hpp"
#include "logup/store.hpp"
#include "logup/types.hpp"

namespace logup {

using RecordId = std::string;

enum class AppendError : uint8_t {
    None = 0,
    IoError,
    InvalidContent
};

struct AppendResult {
    bool ok = false;
    RecordId id;
    AppendError error = AppendError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// One file per record under <root>/pending, named by a sortable id.
// Records are written under <root>/writing and published by rename.
// Unreadable records are moved aside to <root>/failed.
class RecordDirectory final {
public:
    explicit RecordDirectory(const std::filesystem::path& root);

    RecordDirectory(const RecordDirectory&) = delete;
    RecordDirectory& operator=(const RecordDirectory&) = delete;

    [[nodiscard]] AppendResult append(const std::string& content) noexcept;

    // Pending record paths, oldest first. Throws StoreError.
    [[nodiscard]] std::vector<std::filesystem::path> pending() const;
    [[nodiscard]] std::string read(const std::filesystem::path& record) const;
    void removeOldest();
    // Moves a pending record to failed/. Throws StoreError if it stays pending.
    void quarantine(const std::filesystem::path& record, const std::string& reason);

    [[nodiscard]] std::size_t count() const noexcept;
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
    std::filesystem::path writingPath_;
    std::filesystem::path pendingPath_;
    std::filesystem::path failedPath_;

    [[nodiscard]] bool createLayout() noexcept;
    [[nodiscard]] static RecordId generateId();
};

template <typename Entry>
class DirectoryLogStore final : public LogStore<Entry> {
public:
    explicit DirectoryLogStore(const std::filesystem::path& workspace)
        : records_(workspace / categoryName(EntryTraits<Entry>::category)) {}

    [[nodiscard]] AppendResult append(const Entry& entry) noexcept {
        std::string record;
        try {
            record = encodeEntry(entry);
        } catch (const std::exception& e) {
            return {false, "", AppendError::InvalidContent, e.what()};
        }
        return records_.append(record);
    }

    [[nodiscard]] std::vector<Entry> listPending() override {
        std::vector<Entry> entries;
        for (const auto& path : records_.pending()) {
            std::string record = records_.read(path);
            Entry entry;
            try {
                decodeEntry(record, entry);
            } catch (const StoreError& e) {
                // Skipped records leave pending, so head removal never reaches them
                records_.quarantine(path, e.what());
                continue;
            }
            entries.push_back(std::move(entry));
        }
        return entries;
    }

    void removeOldest() override { records_.removeOldest(); }

    [[nodiscard]] std::size_t size() const noexcept { return records_.count(); }
    [[nodiscard]] const std::filesystem::path& root() const noexcept { return records_.root(); }

private:
    RecordDirectory records_;
};

}
