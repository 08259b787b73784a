#include "rate_limiter.hpp"
#include "errors.hpp"

#include <stdexcept>

RateLimiter::RateLimiter(ChunkSink &inner, std::uint64_t bytesPerSecond, Clock &clock, CancellationToken cancel)
    : inner_(inner), bytesPerSecond_(bytesPerSecond), clock_(clock), cancel_(std::move(cancel))
{
    if (bytesPerSecond_ == 0)
    {
        throw std::invalid_argument("Bandwidth limit must be greater than zero");
    }
}

void RateLimiter::write(const char *data, std::size_t size)
{
    if (!started_)
    {
        start_ = clock_.now();
        started_ = true;
    }

    inner_.write(data, size);
    bytesWritten_ += size;

    // Time the bytes written so far are allowed to take at the configured rate
    auto allowed = std::chrono::milliseconds(bytesWritten_ * 1000 / bytesPerSecond_);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock_.now() - start_);
    if (allowed > elapsed)
    {
        if (!clock_.sleepFor(allowed - elapsed, cancel_))
        {
            throw TransferCancelled();
        }
    }
}
