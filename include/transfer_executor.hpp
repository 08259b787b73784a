#pragma once

#include <cstdint>
#include <string>

#include "cancellation.hpp"
#include "clock.hpp"
#include "download_types.hpp"
#include "remote_object.hpp"

enum class AttemptStatus
{
    Succeeded,
    TransientFailure,
    PermanentFailure,
    Cancelled
};

struct AttemptResult
{
    AttemptStatus status = AttemptStatus::TransientFailure;
    std::uint64_t bytesOnDisk = 0; // Size of the local file after the attempt
    std::string error;             // Empty on success
};

/**
 * Runs one transfer attempt: opens the local file fresh or at the resume
 * offset, requests the whole object or the missing range, and copies it
 * through the optional RateLimiter and the ProgressReporter.
 */
class TransferExecutor
{
public:
    TransferExecutor(RemoteObjectReader &reader, Clock &clock);

    /**
     * Never throws for transfer problems; they come back as the attempt status.
     */
    AttemptResult run(const DownloadSession &session,
                      const DownloadOptions &options,
                      const ProgressCallback &progress,
                      const CancellationToken &cancel);

private:
    void copyObject(const DownloadSession &session,
                    const DownloadOptions &options,
                    const ProgressCallback &progress,
                    const CancellationToken &cancel);

    static std::uint64_t sizeOnDisk(const std::filesystem::path &path);

    RemoteObjectReader &reader_;
    Clock &clock_;
};
