#include "retry_coordinator.hpp"
#include "logging.hpp"
#include "session_validator.hpp"

#include <algorithm>
#include <system_error>

RetryCoordinator::RetryCoordinator(TransferExecutor &executor, Clock &clock)
    : executor_(executor), clock_(clock)
{
}

TransferOutcome RetryCoordinator::run(DownloadSession session,
                                      const DownloadOptions &options,
                                      const ProgressCallback &progress,
                                      const CancellationToken &cancel)
{
    auto logger = engineLogger();
    AttemptResult last;

    for (int attempt = 0; attempt <= options.maxRetryAttempts; ++attempt)
    {
        if (attempt > 0)
        {
            auto delay = backoffDelay(attempt);
            logger->info("Retrying {} in {}s (retry {}/{})",
                         session.objectName(), delay.count(), attempt, options.maxRetryAttempts);

            if (!clock_.sleepFor(delay, cancel))
            {
                last.status = AttemptStatus::Cancelled;
                last.error = "Download was cancelled";
                return {session, last};
            }

            session = prepareRetry(session, options);
            if (progress)
            {
                progress(ProgressSnapshot::fromSession(session, DownloadStage::Downloading));
            }
        }

        if (cancel.isCancelled())
        {
            last.status = AttemptStatus::Cancelled;
            last.error = "Download was cancelled";
            return {session, last};
        }

        last = executor_.run(session, options, progress, cancel);
        session = session.withProgress(last.bytesOnDisk);

        switch (last.status)
        {
        case AttemptStatus::Succeeded:
            if (attempt > 0)
            {
                logger->info("{} completed after {} retries", session.objectName(), attempt);
            }
            return {session, last};
        case AttemptStatus::Cancelled:
            logger->info("{} cancelled with {} bytes on disk", session.objectName(), last.bytesOnDisk);
            return {session, last};
        case AttemptStatus::PermanentFailure:
            logger->error("{} failed permanently: {}", session.objectName(), last.error);
            return {session, last};
        case AttemptStatus::TransientFailure:
            break;
        }
    }

    logger->error("Maximum retry attempts exceeded for {}: {}", session.objectName(), last.error);
    return {session, last};
}

std::chrono::seconds RetryCoordinator::backoffDelay(int attempt)
{
    if (attempt <= 0)
    {
        return std::chrono::seconds(0);
    }
    return std::chrono::seconds(1LL << std::min(attempt - 1, 30));
}

DownloadSession RetryCoordinator::prepareRetry(const DownloadSession &session, const DownloadOptions &options)
{
    std::error_code ec;
    bool fileExists = std::filesystem::exists(session.localFilePath(), ec);

    if (!options.enableResumption || !fileExists)
    {
        return session.withProgress(0).withRetryIncrement();
    }

    auto onDisk = std::filesystem::file_size(session.localFilePath(), ec);
    auto candidate = session.withProgress(ec ? 0 : static_cast<std::uint64_t>(onDisk));
    auto validated = SessionValidator::validate(candidate);
    if (!validated)
    {
        return candidate.withProgress(0).withRetryIncrement();
    }
    return validated->withRetryIncrement();
}
