#include "transfer_executor.hpp"
#include "test_support.hpp"

int main()
{
    TestReport report("transfer executor");
    TempDir dir("executor");

    const std::string payload = makePayload(10000);
    MemoryObjectStore store;
    store.put("a.bin", payload);
    FakeClock clock;
    TransferExecutor executor(store, clock);
    DownloadOptions options;
    auto file = dir / "a.bin";

    {
        std::vector<ProgressSnapshot> snapshots;
        auto session = DownloadSession::create("a.bin", "media", file, payload.size());
        auto result = executor.run(session, options,
                                   [&](const ProgressSnapshot &s) { snapshots.push_back(s); }, {});
        report.check(result.status == AttemptStatus::Succeeded && result.error.empty(), "fresh download succeeds");
        report.check(result.bytesOnDisk == payload.size() && readFile(file) == payload, "file content matches");
        report.check(store.opens.size() == 1 && !store.opens[0].ranged, "fresh download reads the whole object");
        report.check(!snapshots.empty() && snapshots.back().downloadedBytes == payload.size(),
                     "final snapshot reports the full size");
    }

    {
        store.opens.clear();
        writeFile(file, payload.substr(0, 4000));
        auto session = DownloadSession::resume("a.bin", "media", file, payload.size(), 4000);
        auto result = executor.run(session, options, {}, {});
        report.check(result.status == AttemptStatus::Succeeded && readFile(file) == payload, "resume completes the file");
        report.check(store.opens.size() == 1 && store.opens[0].ranged && store.opens[0].offset == 4000 &&
                         store.opens[0].length == 6000,
                     "resume requests only the missing range");
    }

    {
        store.opens.clear();
        writeFile(file, payload.substr(0, 4000) + std::string(2000, '#'));
        auto session = DownloadSession::resume("a.bin", "media", file, payload.size(), 4000);
        auto result = executor.run(session, options, {}, {});
        report.check(result.status == AttemptStatus::Succeeded && readFile(file) == payload,
                     "bytes past the resume offset are rewritten");
    }

    {
        store.opens.clear();
        writeFile(file, payload.substr(0, 4000));
        DownloadOptions noResume;
        noResume.enableResumption = false;
        auto session = DownloadSession::resume("a.bin", "media", file, payload.size(), 4000);
        auto result = executor.run(session, noResume, {}, {});
        report.check(result.status == AttemptStatus::Succeeded && !store.opens[0].ranged && readFile(file) == payload,
                     "disabled resumption downloads from the start");
    }

    {
        store.failNextOpen("a.bin", {3000, false});
        auto session = DownloadSession::create("a.bin", "media", file, payload.size());
        auto result = executor.run(session, options, {}, {});
        report.check(result.status == AttemptStatus::TransientFailure, "network error is transient");
        report.check(result.bytesOnDisk == 3000, "partial bytes are reported from disk");
        report.check(!result.error.empty(), "failure carries a message");
    }

    {
        store.failNextOpen("a.bin", {1000, true});
        auto session = DownloadSession::create("a.bin", "media", file, payload.size());
        auto result = executor.run(session, options, {}, {});
        report.check(result.status == AttemptStatus::PermanentFailure, "permanent error is reported as such");
    }

    {
        auto session = DownloadSession::create("a.bin", "media", file, payload.size() + 500);
        auto result = executor.run(session, options, {}, {});
        report.check(result.status == AttemptStatus::TransientFailure && result.bytesOnDisk == payload.size(),
                     "short object is a size mismatch");
    }

    {
        CancellationSource source;
        store.setReadChunk(1000);
        store.onRead([&](const std::string &, std::uint64_t delivered)
                     {
                         if (delivered >= 5000)
                         {
                             source.cancel();
                         }
                     });
        auto session = DownloadSession::create("a.bin", "media", file, payload.size());
        auto result = executor.run(session, options, {}, source.token());
        report.check(result.status == AttemptStatus::Cancelled, "cancellation is observed between chunks");
        report.check(result.bytesOnDisk == 5000, "bytes written before cancellation stay on disk");
        store.onRead({});
    }

    {
        FakeClock pacedClock;
        TransferExecutor paced(store, pacedClock);
        DownloadOptions limited;
        limited.bandwidthLimitBytesPerSecond = 5000;
        auto session = DownloadSession::create("a.bin", "media", file, payload.size());
        auto result = paced.run(session, limited, {}, {});
        report.check(result.status == AttemptStatus::Succeeded, "limited download succeeds");
        report.check(pacedClock.totalSlept() == std::chrono::milliseconds(2000),
                     "10000 bytes at 5000 B/s take two seconds");
    }

    {
        store.put("empty", "");
        auto emptyFile = dir / "empty";
        auto result = executor.run(DownloadSession::create("empty", "media", emptyFile, 0), options, {}, {});
        report.check(result.status == AttemptStatus::Succeeded && std::filesystem::exists(emptyFile),
                     "empty object creates an empty file");
    }

    return report.finish();
}
