#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "clock.hpp"
#include "conflict_resolver.hpp"
#include "download_types.hpp"
#include "path_resolver.hpp"
#include "remote_object.hpp"
#include "retry_coordinator.hpp"
#include "transfer_executor.hpp"

/**
 * Entry point of the download engine for one container.
 *
 * Every call returns exactly one DownloadResult per object; transfer
 * problems are reported in the result, not thrown. Invalid options throw
 * std::invalid_argument before anything is touched.
 */
class BlobDownloader
{
public:
    /**
     * @param lister Needed only for startBatchDownload
     */
    BlobDownloader(RemoteObjectReader &reader,
                   ConflictResolver &conflicts,
                   PathResolver &paths,
                   Clock &clock,
                   ObjectLister *lister = nullptr);

    BlobDownloader(const BlobDownloader &) = delete;
    BlobDownloader &operator=(const BlobDownloader &) = delete;

    /**
     * Work session batch targets are laid out under. Without one, batch
     * files go directly under the batch directory.
     */
    void setWorkSession(std::optional<WorkSession> session) { workSession_ = std::move(session); }
    const std::optional<WorkSession> &workSession() const { return workSession_; }

    const std::string &containerName() const { return reader_.containerName(); }

    /**
     * Download one object to localPath.
     */
    DownloadResult startDownload(const std::string &objectName,
                                 const std::filesystem::path &localPath,
                                 const DownloadOptions &options,
                                 const ProgressCallback &progress = {},
                                 const CancellationToken &cancel = {});

    /**
     * Download every object whose name matches pattern, one at a time.
     *
     * @throws std::runtime_error if no lister is configured or listing fails
     */
    std::vector<DownloadResult> startBatchDownload(const std::string &pattern,
                                                   const std::filesystem::path &localDirectory,
                                                   const DownloadOptions &options,
                                                   const BatchProgressCallback &progress = {},
                                                   const CancellationToken &cancel = {},
                                                   const ProgressCallback &objectProgress = {});

    /**
     * Continue an interrupted transfer. The session is first checked
     * against the partial file; if it cannot be trusted the object is
     * downloaded again from the start.
     */
    DownloadResult resumeDownload(const DownloadSession &session,
                                  const DownloadOptions &options,
                                  const ProgressCallback &progress = {},
                                  const CancellationToken &cancel = {});

private:
    DownloadResult transfer(DownloadSession session,
                            const DownloadOptions &options,
                            const ProgressCallback &progress,
                            const CancellationToken &cancel);

    DownloadResult finish(const TransferOutcome &outcome,
                          const DownloadOptions &options,
                          const ProgressCallback &progress);

    RemoteObjectReader &reader_;
    ConflictResolver &conflicts_;
    PathResolver &paths_;
    ObjectLister *lister_;
    TransferExecutor executor_;
    RetryCoordinator retry_;
    std::optional<WorkSession> workSession_;
};
