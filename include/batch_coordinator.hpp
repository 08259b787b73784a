#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "download_types.hpp"

class BlobDownloader;
class ConflictResolver;
class ObjectLister;
class PathResolver;

/**
 * Downloads all objects matching a pattern, strictly one after another.
 * Names are listed up front; a failed or skipped object does not stop the
 * batch. Cancellation stops before the next object.
 */
class BatchCoordinator
{
public:
    BatchCoordinator(BlobDownloader &downloader,
                     ObjectLister &lister,
                     PathResolver &paths,
                     ConflictResolver &conflicts);

    /**
     * @return One result per listed object that was started
     * @throws std::runtime_error if listing fails
     */
    std::vector<DownloadResult> run(const std::string &pattern,
                                    const std::filesystem::path &localDirectory,
                                    const DownloadOptions &options,
                                    const BatchProgressCallback &progress,
                                    const CancellationToken &cancel,
                                    const ProgressCallback &objectProgress = {});

    /**
     * Literal part of pattern before the first wildcard, if any.
     */
    static std::optional<std::string> listingPrefix(const std::string &pattern);

private:
    BlobDownloader &downloader_;
    ObjectLister &lister_;
    PathResolver &paths_;
    ConflictResolver &conflicts_;
};
