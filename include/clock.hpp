#pragma once

#include <chrono>

#include "cancellation.hpp"

/**
 * Monotonic time source with a cancellable sleep.
 * Backoff and bandwidth pacing go through this so tests can run without
 * real waiting.
 */
class Clock
{
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;

    /**
     * Sleep for the given duration unless cancelled.
     *
     * @return false if cancellation was observed before the full duration elapsed
     */
    virtual bool sleepFor(std::chrono::milliseconds duration, const CancellationToken &cancel) = 0;
};

class SystemClock : public Clock
{
public:
    TimePoint now() const override;
    bool sleepFor(std::chrono::milliseconds duration, const CancellationToken &cancel) override;

private:
    // Cancellation is polled at this granularity while sleeping
    static constexpr std::chrono::milliseconds SLEEP_SLICE{100};
};
