#include "rate_limiter.hpp"
#include "test_support.hpp"

#include <stdexcept>
#include <string>

namespace
{
    class CollectingSink : public ChunkSink
    {
    public:
        void write(const char *data, std::size_t size) override { received.append(data, size); }
        std::string received;
    };
}

int main()
{
    TestReport report("rate limiter");
    using std::chrono::milliseconds;

    {
        CollectingSink sink;
        FakeClock clock;
        RateLimiter limiter(sink, 1000, clock);
        std::string chunk(500, 'x');

        limiter.write(chunk.data(), chunk.size());
        report.check(clock.sleeps.size() == 1 && clock.sleeps[0] == milliseconds(500),
                     "500 bytes at 1000 B/s waits 500 ms");

        limiter.write(chunk.data(), chunk.size());
        report.check(clock.totalSlept() == milliseconds(1000), "1000 bytes take one second in total");
        report.check(sink.received.size() == 1000 && limiter.bytesWritten() == 1000, "all bytes forwarded");
    }

    {
        // Time already spent elsewhere counts towards the budget
        CollectingSink sink;
        FakeClock clock;
        RateLimiter limiter(sink, 1000, clock);
        std::string chunk(100, 'y');
        limiter.write(chunk.data(), chunk.size());
        clock.advance(milliseconds(2000));
        std::size_t sleepsBefore = clock.sleeps.size();
        limiter.write(chunk.data(), chunk.size());
        report.check(clock.sleeps.size() == sleepsBefore, "no wait while under the limit");
    }

    {
        CollectingSink sink;
        FakeClock clock;
        CancellationSource source;
        RateLimiter limiter(sink, 10, clock, source.token());
        source.cancel();
        std::string chunk(100, 'z');
        bool cancelled = false;
        try
        {
            limiter.write(chunk.data(), chunk.size());
        }
        catch (const TransferCancelled &)
        {
            cancelled = true;
        }
        report.check(cancelled, "cancellation interrupts pacing");
        report.check(sink.received.size() == 100, "chunk written before the wait is kept");
    }

    {
        CollectingSink sink;
        FakeClock clock;
        bool rejected = false;
        try
        {
            RateLimiter limiter(sink, 0, clock);
        }
        catch (const std::invalid_argument &)
        {
            rejected = true;
        }
        report.check(rejected, "zero rate is rejected");
    }

    return report.finish();
}
