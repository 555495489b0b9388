#include <string>

#include "fakes.hpp"
#include "logup/bulk_uploader.hpp"

using namespace logup;

int main() {
    if (std::string(WORKER_TAG) != "LogUploadWorker.tag") return 30;
    {
        fakes::Harness h;
        BulkUploader uploader(h.eventUploader, h.syncStatus, h.diagnostics);
        if (uploader.run() != Outcome::Success) return 1;
        if (h.eventUploader.calls != 1) return 2;
        if (h.syncStatus.errors != 0) return 3;
        if (h.diagnostics.count() != 0) return 4;
    }
    {
        fakes::Harness h;
        h.eventUploader.fail = true;
        BulkUploader uploader(h.eventUploader, h.syncStatus, h.diagnostics);
        if (uploader.run() != Outcome::Failure) return 10;
        if (h.eventUploader.calls != 1) return 11;
        if (h.syncStatus.errors != 1) return 12;
        if (h.diagnostics.count() != 1) return 13;
        if (h.diagnostics.records[0].tag != WORKER_TAG) return 14;
        if (h.diagnostics.records[0].message != "Failed to upload events") return 15;
        if (describe(h.diagnostics.records[0].cause) != "network unreachable") return 16;
        // Store ownership lies with the event uploader
        if (h.exceptionStore.lists != 0 || h.metricStore.lists != 0) return 17;
    }
    {
        fakes::Harness h;
        h.eventUploader.crash = true;
        BulkUploader uploader(h.eventUploader, h.syncStatus, h.diagnostics);
        try {
            (void)uploader.run();
            return 20;
        } catch (const fakes::Crash& crash) {
            if (crash.code != 7) return 21;
            if (h.syncStatus.errors != 0) return 22;
        }
    }
    return 0;
}
