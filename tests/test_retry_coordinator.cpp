#include "retry_coordinator.hpp"
#include "test_support.hpp"

namespace
{
    // Cancels as soon as the coordinator starts backing off
    class CancellingClock : public FakeClock
    {
    public:
        explicit CancellingClock(CancellationSource &source) : source_(source) {}

        bool sleepFor(std::chrono::milliseconds duration, const CancellationToken &cancel) override
        {
            source_.cancel();
            return FakeClock::sleepFor(duration, cancel);
        }

    private:
        CancellationSource &source_;
    };
}

int main()
{
    TestReport report("retry coordinator");
    TempDir dir("retry");
    using std::chrono::milliseconds;

    const std::string payload = makePayload(10000);
    auto file = dir / "a.bin";
    DownloadOptions options;

    report.check(RetryCoordinator::backoffDelay(1) == std::chrono::seconds(1) &&
                     RetryCoordinator::backoffDelay(2) == std::chrono::seconds(2) &&
                     RetryCoordinator::backoffDelay(3) == std::chrono::seconds(4),
                 "backoff doubles from one second");

    {
        MemoryObjectStore store;
        store.put("a.bin", payload);
        for (int i = 0; i < 4; ++i)
        {
            store.failNextOpen("a.bin", {0, false});
        }
        FakeClock clock;
        TransferExecutor executor(store, clock);
        RetryCoordinator retry(executor, clock);

        std::vector<int> retryCounts;
        auto outcome = retry.run(DownloadSession::create("a.bin", "media", file, payload.size()), options,
                                 [&](const ProgressSnapshot &s) { retryCounts.push_back(s.retryCount); }, {});

        report.check(store.openCount("a.bin") == 4, "three retries mean four attempts");
        report.check(clock.sleeps == std::vector<milliseconds>{milliseconds(1000), milliseconds(2000), milliseconds(4000)},
                     "waits 1s, 2s, 4s between attempts");
        report.check(outcome.attempt.status == AttemptStatus::TransientFailure && !outcome.attempt.error.empty(),
                     "exhausted retries return the last failure");
        report.check(outcome.session.retryCount() == 3, "session counts retries");
        report.check(!retryCounts.empty() && retryCounts.back() == 3, "snapshots carry the retry count");
    }

    {
        MemoryObjectStore store;
        store.put("a.bin", payload);
        store.failNextOpen("a.bin", {3000, false});
        store.failNextOpen("a.bin", {2000, false});
        FakeClock clock;
        TransferExecutor executor(store, clock);
        RetryCoordinator retry(executor, clock);

        auto outcome = retry.run(DownloadSession::create("a.bin", "media", file, payload.size()), options, {}, {});
        report.check(outcome.attempt.status == AttemptStatus::Succeeded, "succeeds on the third attempt");
        report.check(store.opens.size() == 3 && store.opens[1].offset == 3000 && store.opens[2].offset == 5000,
                     "each retry resumes at the bytes on disk");
        report.check(readFile(file) == payload, "resumed file is intact");
        report.check(outcome.session.downloadedBytes() == payload.size() && outcome.session.retryCount() == 2,
                     "final session state");
    }

    {
        MemoryObjectStore store;
        store.put("a.bin", payload);
        store.failNextOpen("a.bin", {3000, false});
        FakeClock clock;
        TransferExecutor executor(store, clock);
        RetryCoordinator retry(executor, clock);
        DownloadOptions noResume;
        noResume.enableResumption = false;

        auto outcome = retry.run(DownloadSession::create("a.bin", "media", file, payload.size()), noResume, {}, {});
        report.check(outcome.attempt.status == AttemptStatus::Succeeded && store.opens.size() == 2 &&
                         !store.opens[1].ranged,
                     "without resumption a retry starts over");
    }

    {
        MemoryObjectStore store;
        store.put("a.bin", payload);
        store.failNextOpen("a.bin", {100, true});
        FakeClock clock;
        TransferExecutor executor(store, clock);
        RetryCoordinator retry(executor, clock);

        auto outcome = retry.run(DownloadSession::create("a.bin", "media", file, payload.size()), options, {}, {});
        report.check(outcome.attempt.status == AttemptStatus::PermanentFailure, "permanent failure is returned");
        report.check(store.opens.size() == 1 && clock.sleeps.empty(), "permanent failure is not retried");
    }

    {
        MemoryObjectStore store;
        store.put("a.bin", payload);
        store.failNextOpen("a.bin", {100, false});
        CancellationSource source;
        CancellingClock clock(source);
        TransferExecutor executor(store, clock);
        RetryCoordinator retry(executor, clock);

        auto outcome = retry.run(DownloadSession::create("a.bin", "media", file, payload.size()), options, {},
                                 source.token());
        report.check(outcome.attempt.status == AttemptStatus::Cancelled, "cancellation during backoff");
        report.check(store.opens.size() == 1, "no attempt after cancellation");
    }

    {
        MemoryObjectStore store;
        store.put("a.bin", payload);
        store.failNextOpen("a.bin", {100, false});
        FakeClock clock;
        TransferExecutor executor(store, clock);
        RetryCoordinator retry(executor, clock);
        DownloadOptions once;
        once.maxRetryAttempts = 0;

        auto outcome = retry.run(DownloadSession::create("a.bin", "media", file, payload.size()), once, {}, {});
        report.check(outcome.attempt.status == AttemptStatus::TransientFailure && store.opens.size() == 1,
                     "zero retries means a single attempt");
        report.check(outcome.session.downloadedBytes() == 100, "failed session keeps the partial size");
    }

    return report.finish();
}
