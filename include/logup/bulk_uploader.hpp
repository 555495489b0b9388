/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include "logup/sinks.hpp"
#include "logup/types.hpp"

namespace logup {

// Hands the whole event upload to an EventUploader. Which events are
// removed, and when, is up to that uploader.
class BulkUploader final {
public:
    BulkUploader(EventUploader& uploader, SyncStatusReporter& syncStatus, Diagnostics& diagnostics) noexcept
        : uploader_(uploader), syncStatus_(syncStatus), diagnostics_(diagnostics) {}

    BulkUploader(const BulkUploader&) = delete;
    BulkUploader& operator=(const BulkUploader&) = delete;

    [[nodiscard]] Outcome run();

private:
    EventUploader& uploader_;
    SyncStatusReporter& syncStatus_;
    Diagnostics& diagnostics_;
};

}
