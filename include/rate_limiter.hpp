#pragma once

#include <cstdint>

#include "cancellation.hpp"
#include "chunk_sink.hpp"
#include "clock.hpp"

/**
 * Paces writes to an inner sink so the average rate since the first write
 * stays at or below bytesPerSecond. After each chunk it sleeps until the
 * elapsed time catches up with the time the written bytes are allowed.
 */
class RateLimiter : public ChunkSink
{
public:
    /**
     * @throws std::invalid_argument if bytesPerSecond is 0
     */
    RateLimiter(ChunkSink &inner, std::uint64_t bytesPerSecond, Clock &clock, CancellationToken cancel = {});

    /**
     * @throws TransferCancelled if cancelled while waiting
     */
    void write(const char *data, std::size_t size) override;

    std::uint64_t bytesWritten() const { return bytesWritten_; }

private:
    ChunkSink &inner_;
    std::uint64_t bytesPerSecond_;
    Clock &clock_;
    CancellationToken cancel_;
    std::uint64_t bytesWritten_ = 0;
    bool started_ = false;
    Clock::TimePoint start_;
};
