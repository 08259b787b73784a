#include "blob_downloader.hpp"
#include "test_support.hpp"

#include <stdexcept>

int main()
{
    TestReport report("blob downloader");
    TempDir dir("downloader");

    const std::string payload = makePayload(20000);
    MemoryObjectStore store;
    store.put("videos/clip.mp4", payload);
    FakeClock clock;
    ConflictResolver conflicts;
    SessionPathResolver paths;
    BlobDownloader downloader(store, conflicts, paths, clock, &store);

    DownloadOptions options;
    options.conflictMode = ConflictMode::Overwrite;

    {
        std::vector<DownloadStage> stages;
        auto target = dir / "nested" / "clip.mp4";
        auto result = downloader.startDownload("videos/clip.mp4", target, options,
                                               [&](const ProgressSnapshot &s) { stages.push_back(s.stage); });
        report.check(result.success && result.outcome == DownloadOutcome::Completed && !result.error,
                     "download completes");
        report.check(result.bytesDownloaded == payload.size() && readFile(target) == payload,
                     "file is written, creating directories");
        report.check(!stages.empty() && stages.front() == DownloadStage::Starting &&
                         stages.back() == DownloadStage::Completed,
                     "stages run from Starting to Completed");
        bool verified = false;
        for (auto stage : stages)
        {
            verified = verified || stage == DownloadStage::Verifying;
        }
        report.check(verified, "checksum is verified");
    }

    {
        store.opens.clear();
        auto target = dir / "existing.mp4";
        writeFile(target, "keep me");
        DownloadOptions skip = options;
        skip.conflictMode = ConflictMode::Skip;
        auto result = downloader.startDownload("videos/clip.mp4", target, skip);
        report.check(!result.success && result.outcome == DownloadOutcome::Skipped, "skip yields a skipped result");
        report.check(result.error == std::optional<std::string>("Download cancelled due to file conflict"),
                     "skip explains the conflict");
        report.check(store.opens.empty() && readFile(target) == "keep me", "skip performs no read");

        DownloadOptions rename = options;
        rename.conflictMode = ConflictMode::Rename;
        auto renamed = downloader.startDownload("videos/clip.mp4", target, rename);
        report.check(renamed.success && renamed.localFilePath == dir / "existing (1).mp4" &&
                         readFile(target) == "keep me",
                     "rename writes next to the existing file");
    }

    {
        store.put("bad.bin", payload);
        store.setChecksum("bad.bin", md5Checksum("something else"));
        auto target = dir / "bad.bin";
        auto result = downloader.startDownload("bad.bin", target, options);
        report.check(!result.success && result.outcome == DownloadOutcome::IntegrityFailed, "mismatch fails integrity");
        report.check(result.error == std::optional<std::string>("Download integrity verification failed"),
                     "integrity failure message");
        report.check(std::filesystem::exists(target) && readFile(target) == payload, "file is kept after mismatch");

        DownloadOptions noVerify = options;
        noVerify.verifyChecksum = false;
        report.check(downloader.startDownload("bad.bin", target, noVerify).success, "verification can be disabled");

        store.setChecksum("bad.bin", "md5:not-hex");
        auto malformed = downloader.startDownload("bad.bin", target, options);
        report.check(malformed.outcome == DownloadOutcome::IntegrityFailed, "malformed checksum fails integrity");
    }

    {
        store.opens.clear();
        auto result = downloader.startDownload("missing.bin", dir / "missing.bin", options);
        report.check(!result.success && result.outcome == DownloadOutcome::Failed && store.opens.empty(),
                     "metadata failure returns without transferring");
    }

    {
        // Interrupt, then continue from the bytes on disk
        store.opens.clear();
        store.setReadChunk(1000);
        CancellationSource source;
        store.onRead([&](const std::string &, std::uint64_t delivered)
                     {
                         if (delivered >= 8000)
                         {
                             source.cancel();
                         }
                     });
        auto target = dir / "resumable.mp4";
        auto first = downloader.startDownload("videos/clip.mp4", target, options, {}, source.token());
        store.onRead({});
        report.check(first.outcome == DownloadOutcome::Cancelled && first.bytesDownloaded == 8000,
                     "cancelled download keeps partial bytes");
        report.check(first.error == std::optional<std::string>("Download was cancelled"), "cancel message");

        auto session = DownloadSession::resume("videos/clip.mp4", store.containerName(), target, payload.size(),
                                               first.bytesDownloaded, md5Checksum(payload));
        auto second = downloader.resumeDownload(session, options);
        report.check(second.success && readFile(target) == payload, "resume completes the download");
        report.check(store.opens.size() == 2 && store.opens[1].ranged && store.opens[1].offset == 8000,
                     "resume does not fetch the first 8000 bytes again");
    }

    {
        // On-disk file larger than the object: the session is not trusted
        store.opens.clear();
        auto target = dir / "oversized.mp4";
        writeFile(target, std::string(payload.size() + 10, 'x'));
        auto session = DownloadSession::resume("videos/clip.mp4", store.containerName(), target, payload.size(), 5000);
        auto result = downloader.resumeDownload(session, options);
        report.check(result.success && readFile(target) == payload, "invalid session restarts from scratch");
        report.check(store.opens.size() == 1 && !store.opens[0].ranged, "fresh restart reads the whole object");
    }

    {
        auto foreign = DownloadSession::create("videos/clip.mp4", "other", dir / "x.mp4", payload.size());
        report.check(downloader.resumeDownload(foreign, options).outcome == DownloadOutcome::Failed,
                     "session from another container is rejected");
    }

    {
        MemoryObjectStore flaky;
        flaky.put("a.bin", payload);
        flaky.failNextOpen("a.bin", {2000, false});
        flaky.failNextOpen("a.bin", {3000, false});
        flaky.failNextOpen("a.bin", {1000, false});
        FakeClock retryClock;
        ConflictResolver retryConflicts;
        BlobDownloader retrying(flaky, retryConflicts, paths, retryClock);

        DownloadOptions threeRetries = options;
        threeRetries.maxRetryAttempts = 3;
        auto target = dir / "flaky.bin";
        auto result = retrying.startDownload("a.bin", target, threeRetries);
        report.check(result.success && readFile(target) == payload, "fourth attempt completes the download");
        report.check(flaky.openCount("a.bin") == 4, "three failures lead to four reads");
        report.check(retryClock.sleeps == std::vector<std::chrono::milliseconds>{std::chrono::seconds(1),
                                                                                 std::chrono::seconds(2),
                                                                                 std::chrono::seconds(4)},
                     "backoff waits 1s, 2s then 4s");
    }

    {
        DownloadOptions noDirs = options;
        noDirs.createDirectories = false;
        noDirs.maxRetryAttempts = 1;
        auto result = downloader.startDownload("videos/clip.mp4", dir / "absent" / "clip.mp4", noDirs);
        report.check(!result.success && result.outcome == DownloadOutcome::Failed,
                     "missing directory fails when creation is disabled");
    }

    {
        DownloadOptions invalid = options;
        invalid.bufferSize = 0;
        bool thrown = false;
        try
        {
            downloader.startDownload("videos/clip.mp4", dir / "c.mp4", invalid);
        }
        catch (const std::invalid_argument &)
        {
            thrown = true;
        }
        report.check(thrown, "invalid options throw before any work");
    }

    return report.finish();
}
