#include "clock.hpp"

#include <algorithm>
#include <thread>

Clock::TimePoint SystemClock::now() const
{
    return std::chrono::steady_clock::now();
}

bool SystemClock::sleepFor(std::chrono::milliseconds duration, const CancellationToken &cancel)
{
    const auto deadline = now() + duration;
    while (true)
    {
        if (cancel.isCancelled())
        {
            return false;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now());
        if (remaining.count() <= 0)
        {
            return true;
        }
        std::this_thread::sleep_for(std::min(remaining, SLEEP_SLICE));
    }
}
