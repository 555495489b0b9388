/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "logup/bulk_uploader.hpp"
#include "logup/logger.hpp"

namespace logup {

Outcome BulkUploader::run() {
    try {
        uploader_.uploadAllEventsAndWait();
        LOG_DEBUG("Event upload finished");
        return Outcome::Success;
    } catch (const std::exception&) {
        syncStatus_.reportUploadError();
        diagnostics_.error(WORKER_TAG, "Failed to upload events", std::current_exception());
        return Outcome::Failure;
    }
}

}
