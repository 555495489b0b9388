/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "logup/event_uploader.hpp"
#include "logup/logger.hpp"

namespace logup {

void StoreEventUploader::uploadAllEventsAndWait() {
    auto events = store_.listPending();
    if (events.empty()) {
        LOG_DEBUG("No pending events");
        return;
    }

    syncStatus_.setStatus(SyncStatus::DataUploading);
    for (const auto& event : events) {
        sink_.logEvent(event);
        store_.removeOldest();
    }
    syncStatus_.setStatus(SyncStatus::DataUploaded);
    LOG_DEBUG("Uploaded " + std::to_string(events.size()) + " events");
}

}
