#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

/**
 * What to do when the destination file already exists.
 */
enum class ConflictMode
{
    Overwrite,
    Skip,
    Rename,
    Ask
};

/**
 * Parse "overwrite", "skip", "rename" or "ask" (case-insensitive).
 * @throws std::invalid_argument for any other name
 */
ConflictMode parseConflictMode(const std::string &name);
std::string toString(ConflictMode mode);

enum class DownloadStage
{
    Starting,
    Downloading,
    Verifying,
    Completed
};

std::string toString(DownloadStage stage);

/**
 * Immutable state of one object transfer.
 * Every update returns a new value; downloadedBytes is always clamped to
 * [0, totalBytes].
 */
class DownloadSession
{
public:
    using TimePoint = std::chrono::system_clock::time_point;

    /**
     * New transfer with nothing downloaded yet.
     */
    static DownloadSession create(std::string objectName,
                                  std::string containerName,
                                  std::filesystem::path localFilePath,
                                  std::uint64_t totalBytes,
                                  std::optional<std::string> expectedChecksum = std::nullopt);

    /**
     * Transfer whose first existingBytes are already on disk.
     */
    static DownloadSession resume(std::string objectName,
                                  std::string containerName,
                                  std::filesystem::path localFilePath,
                                  std::uint64_t totalBytes,
                                  std::uint64_t existingBytes,
                                  std::optional<std::string> expectedChecksum = std::nullopt);

    DownloadSession withProgress(std::uint64_t downloadedBytes) const;
    DownloadSession withRetryIncrement() const;

    const std::string &objectName() const { return objectName_; }
    const std::string &containerName() const { return containerName_; }
    const std::filesystem::path &localFilePath() const { return localFilePath_; }
    std::uint64_t totalBytes() const { return totalBytes_; }
    std::uint64_t downloadedBytes() const { return downloadedBytes_; }
    const std::optional<std::string> &expectedChecksum() const { return expectedChecksum_; }
    int retryCount() const { return retryCount_; }
    TimePoint createdAt() const { return createdAt_; }
    TimePoint lastUpdatedAt() const { return lastUpdatedAt_; }

    /**
     * Byte offset the next attempt starts reading from.
     * Always 0 when resumption is disabled.
     */
    std::uint64_t startOffset(bool resumptionEnabled) const;

    std::uint64_t remainingBytes() const { return totalBytes_ - downloadedBytes_; }
    double progressPercentage() const;

    /**
     * True when some but not all bytes are on disk.
     */
    bool canResume() const { return downloadedBytes_ > 0 && downloadedBytes_ < totalBytes_; }

private:
    DownloadSession() = default;

    std::string objectName_;
    std::string containerName_;
    std::filesystem::path localFilePath_;
    std::uint64_t totalBytes_ = 0;
    std::uint64_t downloadedBytes_ = 0;
    std::optional<std::string> expectedChecksum_;
    int retryCount_ = 0;
    TimePoint createdAt_;
    TimePoint lastUpdatedAt_;
};

/**
 * Per-call download settings.
 */
struct DownloadOptions
{
    int maxRetryAttempts = 3;
    bool enableResumption = true;
    bool verifyChecksum = true;
    ConflictMode conflictMode = ConflictMode::Ask;
    std::optional<std::uint64_t> bandwidthLimitBytesPerSecond; // Unset = unlimited
    bool createDirectories = true;
    std::size_t bufferSize = 8192;

    /**
     * @throws std::invalid_argument on negative retries, zero limit or zero buffer
     */
    void validate() const;
};

struct ProgressSnapshot
{
    std::string objectName;
    std::uint64_t totalBytes = 0;
    std::uint64_t downloadedBytes = 0;
    double percentage = 0.0;
    double bytesPerSecond = 0.0;
    std::optional<double> etaSeconds;
    int retryCount = 0;
    DownloadStage stage = DownloadStage::Starting;

    static ProgressSnapshot fromSession(const DownloadSession &session,
                                        DownloadStage stage,
                                        double bytesPerSecond = 0.0);
};

struct BatchProgress
{
    std::size_t totalObjects = 0;
    std::size_t completedObjects = 0;
    std::string currentObjectName;
    double currentObjectFraction = 0.0; // 0..1
    std::uint64_t totalBytesDownloaded = 0;
};

using ProgressCallback = std::function<void(const ProgressSnapshot &)>;
using BatchProgressCallback = std::function<void(const BatchProgress &)>;

enum class DownloadOutcome
{
    Completed,
    Skipped,
    Failed,
    IntegrityFailed,
    Cancelled
};

std::string toString(DownloadOutcome outcome);

/**
 * Terminal result of one logical download. error is set whenever success is false.
 */
struct DownloadResult
{
    std::string objectName;
    std::filesystem::path localFilePath;
    std::uint64_t bytesDownloaded = 0;
    bool success = false;
    std::optional<std::string> error;
    DownloadOutcome outcome = DownloadOutcome::Failed;

    static DownloadResult completed(std::string objectName, std::filesystem::path path, std::uint64_t bytes);
    static DownloadResult skipped(std::string objectName, std::filesystem::path path);
    static DownloadResult failed(std::string objectName, std::filesystem::path path,
                                 std::uint64_t bytes, std::string error);
    static DownloadResult integrityFailed(std::string objectName, std::filesystem::path path,
                                          std::uint64_t bytes, std::string error);
    static DownloadResult cancelled(std::string objectName, std::filesystem::path path, std::uint64_t bytes);
};

/**
 * Local and remote facts shown to whoever decides a conflict.
 */
struct FileConflictInfo
{
    bool localExists = false;
    std::optional<std::uint64_t> localSize;
    std::optional<std::chrono::system_clock::time_point> localModifiedUtc;
    std::optional<std::string> localChecksum;
    std::uint64_t remoteSize = 0;
    std::optional<std::chrono::system_clock::time_point> remoteModifiedUtc;
    std::optional<std::string> remoteChecksum;
};

struct FileConflictDecision
{
    bool skip = false;
    std::optional<std::filesystem::path> resolvedPath; // Unset when skipping
    ConflictMode chosenMode = ConflictMode::Overwrite;
    bool applyToAll = false;
    bool rememberForSession = false;
};
