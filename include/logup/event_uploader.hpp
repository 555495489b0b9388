/*
 * logup - Background Log Upload Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include "logup/entries.hpp"
#include "logup/sinks.hpp"
#include "logup/store.hpp"

namespace logup {

// EventUploader over a local event store: sends every pending event to the
// sink and removes each one once sent. Errors propagate to the caller after
// the sync status is left at DataUploading for the worker to flag.
class StoreEventUploader final : public EventUploader {
public:
    StoreEventUploader(LogStore<EventLogEntry>& store, EventSink& sink, SyncStatusTracker& syncStatus) noexcept
        : store_(store), sink_(sink), syncStatus_(syncStatus) {}

    void uploadAllEventsAndWait() override;

private:
    LogStore<EventLogEntry>& store_;
    EventSink& sink_;
    SyncStatusTracker& syncStatus_;
};

}
