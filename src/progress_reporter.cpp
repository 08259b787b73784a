#include "progress_reporter.hpp"

ProgressReporter::ProgressReporter(ChunkSink &inner,
                                   const DownloadSession &session,
                                   std::uint64_t startOffset,
                                   Clock &clock,
                                   ProgressCallback callback)
    : inner_(inner),
      session_(session),
      startOffset_(startOffset),
      clock_(clock),
      callback_(std::move(callback)),
      startTime_(clock.now()),
      lastReportTime_(startTime_)
{
}

void ProgressReporter::write(const char *data, std::size_t size)
{
    inner_.write(data, size);
    bytesTransferred_ += size;

    if (!callback_)
    {
        return;
    }

    auto now = clock_.now();
    if (now - lastReportTime_ >= REPORT_INTERVAL)
    {
        lastReportTime_ = now;
        callback_(snapshot());
    }
}

ProgressSnapshot ProgressReporter::snapshot() const
{
    auto elapsed = std::chrono::duration<double>(clock_.now() - startTime_).count();
    double bytesPerSecond = elapsed > 0.0 ? static_cast<double>(bytesTransferred_) / elapsed : 0.0;

    // withProgress clamps to the object size
    auto current = session_.withProgress(startOffset_ + bytesTransferred_);
    return ProgressSnapshot::fromSession(current, DownloadStage::Downloading, bytesPerSecond);
}
