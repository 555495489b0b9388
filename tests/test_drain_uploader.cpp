#include <memory>
#include <string>
#include <vector>

#include "fakes.hpp"
#include "logup/drain_uploader.hpp"

using namespace logup;

namespace {

DrainUploader<ExceptionLogEntry> exceptionUploader(fakes::Harness& h,
                                                  std::shared_ptr<const CancelToken> token = nullptr) {
    auto* sink = &h.exceptionSink;
    return DrainUploader<ExceptionLogEntry>(
        Category::Exception, h.exceptionStore,
        [sink](const ExceptionLogEntry& entry) { sink->logException(toException(entry)); },
        h.diagnostics, std::move(token));
}

std::vector<std::string> pendingMessages(fakes::Harness& h) {
    return fakes::pendingNames(h.exceptionStore.inner, [](const ExceptionLogEntry& e) { return e.message; });
}

int emptySnapshotSucceedsWithoutMutation() {
    fakes::Harness h;
    if (exceptionUploader(h).run() != Outcome::Success) return 10;
    if (h.exceptionStore.lists != 1) return 11;
    if (h.exceptionStore.removes != 0) return 12;
    if (h.exceptionSink.calls != 0) return 13;
    if (h.diagnostics.count() != 0) return 14;
    return 0;
}

int drainsEverythingOldestFirst() {
    fakes::Harness h;
    for (const char* m : {"E1", "E2", "E3", "E4"}) h.exceptionStore.append(fakes::exceptionEntry(m));

    if (exceptionUploader(h).run() != Outcome::Success) return 20;
    if (h.exceptionSink.received != std::vector<std::string>{"E1", "E2", "E3", "E4"}) return 21;
    if (h.exceptionStore.size() != 0) return 22;
    if (h.exceptionStore.removes != 4) return 23;
    if (h.exceptionStore.lists != 1) return 24;
    return 0;
}

int failureKeepsUndeliveredSuffix() {
    // Sink accepts E1, rejects E2.
    fakes::Harness h;
    for (const char* m : {"E1", "E2", "E3"}) h.exceptionStore.append(fakes::exceptionEntry(m));
    h.exceptionSink.failAt = 2;

    if (exceptionUploader(h).run() != Outcome::Failure) return 30;
    if (pendingMessages(h) != std::vector<std::string>{"E2", "E3"}) return 31;
    if (h.exceptionSink.calls != 2) return 32;
    if (h.diagnostics.count() != 1) return 33;
    const auto& record = h.diagnostics.records.front();
    if (record.tag != WORKER_TAG) return 34;
    if (record.message.find("exceptions") == std::string::npos) return 35;
    if (record.message.find("remote rejected E2") == std::string::npos) return 36;
    if (!record.cause) return 37;
    return 0;
}

int failureAtEveryPositionRemovesOnlyPrefix() {
    const int n = 5;
    for (int k = 1; k <= n; ++k) {
        fakes::Harness h;
        for (int i = 1; i <= n; ++i) {
            h.metricStore.append(fakes::metricEntry("m" + std::to_string(i)));
        }
        h.metricSink.failAt = k;
        auto* sink = &h.metricSink;
        DrainUploader<PerformanceMetricLogEntry> uploader(
            Category::PerformanceMetric, h.metricStore,
            [sink](const PerformanceMetricLogEntry& e) { sink->logPerformanceMetric(e); }, h.diagnostics);

        if (uploader.run() != Outcome::Failure) return 40;
        if (h.metricStore.removes != k - 1) return 41;
        auto pending = fakes::pendingNames(h.metricStore.inner,
                                           [](const PerformanceMetricLogEntry& e) { return e.metricName; });
        if (pending.size() != static_cast<std::size_t>(n - k + 1)) return 42;
        if (pending.front() != "m" + std::to_string(k)) return 43;
        if (pending.back() != "m" + std::to_string(n)) return 44;
    }
    return 0;
}

int translationErrorAbortsBeforeForwarding() {
    fakes::Harness h;
    h.exceptionStore.append(fakes::exceptionEntry("E1"));
    auto broken = fakes::exceptionEntry("E2");
    broken.frames.push_back({"", "run", "Thread.java", 1});
    h.exceptionStore.append(broken);
    h.exceptionStore.append(fakes::exceptionEntry("E3"));

    if (exceptionUploader(h).run() != Outcome::Failure) return 50;
    if (h.exceptionSink.calls != 1) return 51;
    if (pendingMessages(h) != std::vector<std::string>{"E2", "E3"}) return 52;
    if (h.diagnostics.count() != 1) return 53;
    return 0;
}

int storeRemovalErrorIsDeliveryFailure() {
    fakes::Harness h;
    h.exceptionStore.append(fakes::exceptionEntry("E1"));
    h.exceptionStore.failRemove = true;

    if (exceptionUploader(h).run() != Outcome::Failure) return 60;
    if (h.exceptionSink.calls != 1) return 61;
    if (h.exceptionStore.size() != 1) return 62;
    if (h.diagnostics.count() != 1) return 63;
    return 0;
}

int cancelledDrainStopsBeforeNextEntry() {
    fakes::Harness h;
    for (const char* m : {"E1", "E2"}) h.exceptionStore.append(fakes::exceptionEntry(m));
    auto token = std::make_shared<CancelToken>();
    token->cancel();

    if (exceptionUploader(h, token).run() != Outcome::Failure) return 70;
    if (h.exceptionSink.calls != 0) return 71;
    if (h.exceptionStore.size() != 2) return 72;
    if (h.diagnostics.count() != 0) return 73;
    return 0;
}

int crashEscapesUploader() {
    fakes::Harness h;
    h.exceptionStore.append(fakes::exceptionEntry("E1"));
    h.exceptionSink.failAt = 1;
    h.exceptionSink.crash = true;

    try {
        (void)exceptionUploader(h).run();
    } catch (const fakes::Crash& crash) {
        if (crash.code != 1) return 81;
        if (h.exceptionStore.size() != 1) return 82;
        if (h.diagnostics.count() != 0) return 83;
        return 0;
    }
    return 80;
}

}

int main() {
    if (int rc = emptySnapshotSucceedsWithoutMutation()) return rc;
    if (int rc = drainsEverythingOldestFirst()) return rc;
    if (int rc = failureKeepsUndeliveredSuffix()) return rc;
    if (int rc = failureAtEveryPositionRemovesOnlyPrefix()) return rc;
    if (int rc = translationErrorAbortsBeforeForwarding()) return rc;
    if (int rc = storeRemovalErrorIsDeliveryFailure()) return rc;
    if (int rc = cancelledDrainStopsBeforeNextEntry()) return rc;
    if (int rc = crashEscapesUploader()) return rc;
    return 0;
}
