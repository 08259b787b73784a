#include "download_types.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <fmt/core.h>

ConflictMode parseConflictMode(const std::string &name)
{
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (lowered == "overwrite")
        return ConflictMode::Overwrite;
    if (lowered == "skip")
        return ConflictMode::Skip;
    if (lowered == "rename")
        return ConflictMode::Rename;
    if (lowered == "ask")
        return ConflictMode::Ask;

    throw std::invalid_argument(
        fmt::format("Unknown conflict mode '{}' (expected overwrite, skip, rename or ask)", name));
}

std::string toString(ConflictMode mode)
{
    switch (mode)
    {
    case ConflictMode::Overwrite:
        return "overwrite";
    case ConflictMode::Skip:
        return "skip";
    case ConflictMode::Rename:
        return "rename";
    case ConflictMode::Ask:
        return "ask";
    }
    return "unknown";
}

std::string toString(DownloadStage stage)
{
    switch (stage)
    {
    case DownloadStage::Starting:
        return "starting";
    case DownloadStage::Downloading:
        return "downloading";
    case DownloadStage::Verifying:
        return "verifying";
    case DownloadStage::Completed:
        return "completed";
    }
    return "unknown";
}

std::string toString(DownloadOutcome outcome)
{
    switch (outcome)
    {
    case DownloadOutcome::Completed:
        return "completed";
    case DownloadOutcome::Skipped:
        return "skipped";
    case DownloadOutcome::Failed:
        return "failed";
    case DownloadOutcome::IntegrityFailed:
        return "integrity-failed";
    case DownloadOutcome::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// DownloadSession
// ---------------------------------------------------------------------------

DownloadSession DownloadSession::create(std::string objectName,
                                        std::string containerName,
                                        std::filesystem::path localFilePath,
                                        std::uint64_t totalBytes,
                                        std::optional<std::string> expectedChecksum)
{
    return resume(std::move(objectName), std::move(containerName), std::move(localFilePath),
                  totalBytes, 0, std::move(expectedChecksum));
}

DownloadSession DownloadSession::resume(std::string objectName,
                                        std::string containerName,
                                        std::filesystem::path localFilePath,
                                        std::uint64_t totalBytes,
                                        std::uint64_t existingBytes,
                                        std::optional<std::string> expectedChecksum)
{
    DownloadSession session;
    session.objectName_ = std::move(objectName);
    session.containerName_ = std::move(containerName);
    session.localFilePath_ = std::move(localFilePath);
    session.totalBytes_ = totalBytes;
    session.downloadedBytes_ = std::min(existingBytes, totalBytes);
    session.expectedChecksum_ = std::move(expectedChecksum);
    session.createdAt_ = std::chrono::system_clock::now();
    session.lastUpdatedAt_ = session.createdAt_;
    return session;
}

DownloadSession DownloadSession::withProgress(std::uint64_t downloadedBytes) const
{
    DownloadSession next = *this;
    next.downloadedBytes_ = std::min(downloadedBytes, totalBytes_);
    next.lastUpdatedAt_ = std::chrono::system_clock::now();
    return next;
}

DownloadSession DownloadSession::withRetryIncrement() const
{
    DownloadSession next = *this;
    next.retryCount_ = retryCount_ + 1;
    next.lastUpdatedAt_ = std::chrono::system_clock::now();
    return next;
}

std::uint64_t DownloadSession::startOffset(bool resumptionEnabled) const
{
    return resumptionEnabled ? downloadedBytes_ : 0;
}

double DownloadSession::progressPercentage() const
{
    if (totalBytes_ == 0)
    {
        return 0.0;
    }
    return static_cast<double>(downloadedBytes_) / static_cast<double>(totalBytes_) * 100.0;
}

// ---------------------------------------------------------------------------
// DownloadOptions
// ---------------------------------------------------------------------------

void DownloadOptions::validate() const
{
    if (maxRetryAttempts < 0)
    {
        throw std::invalid_argument(
            fmt::format("maxRetryAttempts must not be negative (got {})", maxRetryAttempts));
    }
    if (bandwidthLimitBytesPerSecond && *bandwidthLimitBytesPerSecond == 0)
    {
        throw std::invalid_argument("Bandwidth limit must be greater than zero");
    }
    if (bufferSize == 0)
    {
        throw std::invalid_argument("Buffer size must be greater than zero");
    }
}

// ---------------------------------------------------------------------------
// ProgressSnapshot / DownloadResult
// ---------------------------------------------------------------------------

ProgressSnapshot ProgressSnapshot::fromSession(const DownloadSession &session,
                                               DownloadStage stage,
                                               double bytesPerSecond)
{
    ProgressSnapshot snapshot;
    snapshot.objectName = session.objectName();
    snapshot.totalBytes = session.totalBytes();
    snapshot.downloadedBytes = session.downloadedBytes();
    snapshot.percentage = session.progressPercentage();
    snapshot.bytesPerSecond = bytesPerSecond;
    if (bytesPerSecond > 0.0)
    {
        snapshot.etaSeconds = static_cast<double>(session.remainingBytes()) / bytesPerSecond;
    }
    snapshot.retryCount = session.retryCount();
    snapshot.stage = stage;
    return snapshot;
}

DownloadResult DownloadResult::completed(std::string objectName, std::filesystem::path path,
                                         std::uint64_t bytes)
{
    DownloadResult result;
    result.objectName = std::move(objectName);
    result.localFilePath = std::move(path);
    result.bytesDownloaded = bytes;
    result.success = true;
    result.outcome = DownloadOutcome::Completed;
    return result;
}

DownloadResult DownloadResult::skipped(std::string objectName, std::filesystem::path path)
{
    DownloadResult result;
    result.objectName = std::move(objectName);
    result.localFilePath = std::move(path);
    result.error = "Download cancelled due to file conflict";
    result.outcome = DownloadOutcome::Skipped;
    return result;
}

DownloadResult DownloadResult::failed(std::string objectName, std::filesystem::path path,
                                      std::uint64_t bytes, std::string error)
{
    DownloadResult result;
    result.objectName = std::move(objectName);
    result.localFilePath = std::move(path);
    result.bytesDownloaded = bytes;
    result.error = std::move(error);
    result.outcome = DownloadOutcome::Failed;
    return result;
}

DownloadResult DownloadResult::integrityFailed(std::string objectName, std::filesystem::path path,
                                               std::uint64_t bytes, std::string error)
{
    DownloadResult result = failed(std::move(objectName), std::move(path), bytes, std::move(error));
    result.outcome = DownloadOutcome::IntegrityFailed;
    return result;
}

DownloadResult DownloadResult::cancelled(std::string objectName, std::filesystem::path path,
                                         std::uint64_t bytes)
{
    DownloadResult result = failed(std::move(objectName), std::move(path), bytes, "Download was cancelled");
    result.outcome = DownloadOutcome::Cancelled;
    return result;
}
