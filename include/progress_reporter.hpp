#pragma once

#include <chrono>
#include <cstdint>

#include "chunk_sink.hpp"
#include "clock.hpp"
#include "download_types.hpp"

/**
 * Counts bytes flowing to an inner sink and calls the progress callback at
 * most once per REPORT_INTERVAL. The callback runs synchronously on the
 * write path.
 */
class ProgressReporter : public ChunkSink
{
public:
    static constexpr std::chrono::milliseconds REPORT_INTERVAL{250};

    /**
     * @param session Transfer being reported; supplies name, size and retry count
     * @param startOffset Bytes already on disk before this attempt
     */
    ProgressReporter(ChunkSink &inner,
                     const DownloadSession &session,
                     std::uint64_t startOffset,
                     Clock &clock,
                     ProgressCallback callback);

    void write(const char *data, std::size_t size) override;

    /**
     * Bytes written through this reporter (excludes startOffset).
     */
    std::uint64_t bytesTransferred() const { return bytesTransferred_; }

    /**
     * Current state, regardless of throttling.
     */
    ProgressSnapshot snapshot() const;

private:
    ChunkSink &inner_;
    DownloadSession session_;
    std::uint64_t startOffset_;
    Clock &clock_;
    ProgressCallback callback_;

    std::uint64_t bytesTransferred_ = 0;
    Clock::TimePoint startTime_;
    Clock::TimePoint lastReportTime_;
};
