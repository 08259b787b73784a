#include "progress_renderer.hpp"
#include "progress_reporter.hpp"
#include "test_support.hpp"

#include <string>
#include <vector>

namespace
{
    class NullSink : public ChunkSink
    {
    public:
        void write(const char *, std::size_t size) override { total += size; }
        std::size_t total = 0;
    };
}

int main()
{
    TestReport report("progress reporter");
    using std::chrono::milliseconds;

    auto session = DownloadSession::create("video.mp4", "media", "/tmp/video.mp4", 10000).withProgress(2000);
    std::string chunk(1000, 'a');

    {
        NullSink sink;
        FakeClock clock;
        std::vector<ProgressSnapshot> snapshots;
        ProgressReporter reporter(sink, session, 2000, clock,
                                  [&](const ProgressSnapshot &s) { snapshots.push_back(s); });

        reporter.write(chunk.data(), chunk.size());
        report.check(snapshots.empty(), "no snapshot before 250 ms");

        clock.advance(milliseconds(100));
        reporter.write(chunk.data(), chunk.size());
        report.check(snapshots.empty(), "still throttled at 100 ms");

        clock.advance(milliseconds(150));
        reporter.write(chunk.data(), chunk.size());
        report.check(snapshots.size() == 1, "snapshot at 250 ms");
        if (!snapshots.empty())
        {
            const auto &s = snapshots.back();
            report.check(s.downloadedBytes == 5000, "downloaded includes start offset");
            report.check(s.percentage == 50.0, "percentage of total");
            report.check(s.bytesPerSecond == 12000.0, "rate from bytes since attempt start");
            report.check(s.etaSeconds.has_value(), "ETA present while data flows");
            report.check(s.stage == DownloadStage::Downloading, "downloading stage");
        }

        clock.advance(milliseconds(10));
        reporter.write(chunk.data(), chunk.size());
        report.check(snapshots.size() == 1, "throttle restarts after a snapshot");
        report.check(sink.total == 4000 && reporter.bytesTransferred() == 4000, "bytes forwarded and counted");
    }

    {
        // A stream longer than announced never reports more than the total
        NullSink sink;
        FakeClock clock;
        ProgressReporter reporter(sink, session, 9500, clock, {});
        reporter.write(chunk.data(), chunk.size());
        report.check(reporter.snapshot().downloadedBytes == 10000, "snapshot clamps to total");
    }

    report.check(ProgressRenderer::formatBytes(512) == "512 B", "formatBytes bytes");
    report.check(ProgressRenderer::formatBytes(1536) == "1.50 KB", "formatBytes kilobytes");
    report.check(ProgressRenderer::formatBytes(5 * 1024 * 1024) == "5.00 MB", "formatBytes megabytes");
    report.check(ProgressRenderer::formatDuration(150) == "2m 30s", "formatDuration minutes");
    report.check(ProgressRenderer::formatDuration(-1) == "unknown", "formatDuration unknown");
    report.check(ProgressRenderer::makeBar(50.0).size() == 52, "bar has fixed width");

    return report.finish();
}
