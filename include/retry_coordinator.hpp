#pragma once

#include <chrono>

#include "cancellation.hpp"
#include "clock.hpp"
#include "download_types.hpp"
#include "transfer_executor.hpp"

struct TransferOutcome
{
    DownloadSession session; // Final state, downloadedBytes = bytes on disk
    AttemptResult attempt;   // Last attempt
};

/**
 * Runs TransferExecutor up to maxRetryAttempts + 1 times with exponential
 * backoff (1s, 2s, 4s, ...). Between attempts the session is reconciled
 * with the partial file so the next attempt resumes where the last one
 * stopped. Permanent failures and cancellation end the loop immediately.
 */
class RetryCoordinator
{
public:
    RetryCoordinator(TransferExecutor &executor, Clock &clock);

    TransferOutcome run(DownloadSession session,
                        const DownloadOptions &options,
                        const ProgressCallback &progress,
                        const CancellationToken &cancel);

    /**
     * Wait before the given attempt (attempt >= 1): 2^(attempt-1) seconds.
     */
    static std::chrono::seconds backoffDelay(int attempt);

private:
    static DownloadSession prepareRetry(const DownloadSession &session, const DownloadOptions &options);

    TransferExecutor &executor_;
    Clock &clock_;
};
