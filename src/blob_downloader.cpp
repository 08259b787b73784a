#include "blob_downloader.hpp"
#include "batch_coordinator.hpp"
#include "errors.hpp"
#include "integrity_verifier.hpp"
#include "logging.hpp"
#include "session_validator.hpp"

#include <stdexcept>

#include <fmt/core.h>

BlobDownloader::BlobDownloader(RemoteObjectReader &reader,
                               ConflictResolver &conflicts,
                               PathResolver &paths,
                               Clock &clock,
                               ObjectLister *lister)
    : reader_(reader),
      conflicts_(conflicts),
      paths_(paths),
      lister_(lister),
      executor_(reader, clock),
      retry_(executor_, clock)
{
}

DownloadResult BlobDownloader::startDownload(const std::string &objectName,
                                             const std::filesystem::path &localPath,
                                             const DownloadOptions &options,
                                             const ProgressCallback &progress,
                                             const CancellationToken &cancel)
{
    options.validate();
    auto logger = engineLogger();

    if (cancel.isCancelled())
    {
        return DownloadResult::cancelled(objectName, localPath, 0);
    }

    ObjectMetadata metadata;
    try
    {
        metadata = reader_.metadata(objectName);
    }
    catch (const TransferError &e)
    {
        logger->error("Cannot read metadata of {}: {}", objectName, e.what());
        return DownloadResult::failed(objectName, localPath, 0,
                                      fmt::format("Failed to read object metadata: {}", e.what()));
    }

    auto starting = DownloadSession::create(objectName, reader_.containerName(), localPath,
                                            metadata.size, metadata.checksum);
    if (progress)
    {
        progress(ProgressSnapshot::fromSession(starting, DownloadStage::Starting));
    }

    // Hashing the local file only pays off when a person will see the result
    bool compareChecksums = options.conflictMode == ConflictMode::Ask && conflicts_.hasInteractiveResolver();
    auto info = ConflictResolver::describe(localPath, metadata, compareChecksums);
    auto decision = conflicts_.resolve(localPath, options.conflictMode, info);
    if (decision.skip || !decision.resolvedPath)
    {
        logger->info("Skipping {}: {} already exists", objectName, localPath.string());
        return DownloadResult::skipped(objectName, localPath);
    }

    const auto &target = *decision.resolvedPath;
    if (options.createDirectories && !paths_.ensureDirectory(target))
    {
        return DownloadResult::failed(objectName, target, 0, "Failed to create directory structure");
    }

    auto session = DownloadSession::create(objectName, reader_.containerName(), target,
                                           metadata.size, metadata.checksum);
    return transfer(std::move(session), options, progress, cancel);
}

std::vector<DownloadResult> BlobDownloader::startBatchDownload(const std::string &pattern,
                                                               const std::filesystem::path &localDirectory,
                                                               const DownloadOptions &options,
                                                               const BatchProgressCallback &progress,
                                                               const CancellationToken &cancel,
                                                               const ProgressCallback &objectProgress)
{
    options.validate();
    if (!lister_)
    {
        throw std::runtime_error("Batch downloads need an object lister");
    }

    BatchCoordinator coordinator(*this, *lister_, paths_, conflicts_);
    return coordinator.run(pattern, localDirectory, options, progress, cancel, objectProgress);
}

DownloadResult BlobDownloader::resumeDownload(const DownloadSession &session,
                                              const DownloadOptions &options,
                                              const ProgressCallback &progress,
                                              const CancellationToken &cancel)
{
    options.validate();
    auto logger = engineLogger();

    if (session.containerName() != reader_.containerName())
    {
        return DownloadResult::failed(session.objectName(), session.localFilePath(), session.downloadedBytes(),
                                      fmt::format("Session belongs to container '{}', not '{}'",
                                                  session.containerName(), reader_.containerName()));
    }
    if (cancel.isCancelled())
    {
        return DownloadResult::cancelled(session.objectName(), session.localFilePath(), session.downloadedBytes());
    }

    DownloadSession current = session;
    if (options.enableResumption)
    {
        auto validated = SessionValidator::validate(session);
        if (validated)
        {
            current = *validated;
        }
        else
        {
            // The object may have changed as well, so describe it again
            try
            {
                auto metadata = reader_.metadata(session.objectName());
                current = DownloadSession::create(session.objectName(), session.containerName(),
                                                  session.localFilePath(), metadata.size, metadata.checksum);
            }
            catch (const TransferError &e)
            {
                logger->error("Cannot read metadata of {}: {}", session.objectName(), e.what());
                return DownloadResult::failed(session.objectName(), session.localFilePath(), 0,
                                              fmt::format("Failed to read object metadata: {}", e.what()));
            }
        }
    }

    if (progress)
    {
        progress(ProgressSnapshot::fromSession(current, DownloadStage::Starting));
    }

    if (options.createDirectories && !paths_.ensureDirectory(current.localFilePath()))
    {
        return DownloadResult::failed(current.objectName(), current.localFilePath(), current.downloadedBytes(),
                                      "Failed to create directory structure");
    }

    logger->info("Resuming {} at byte {} of {}", current.objectName(),
                 current.startOffset(options.enableResumption), current.totalBytes());
    return transfer(std::move(current), options, progress, cancel);
}

DownloadResult BlobDownloader::transfer(DownloadSession session,
                                        const DownloadOptions &options,
                                        const ProgressCallback &progress,
                                        const CancellationToken &cancel)
{
    auto outcome = retry_.run(std::move(session), options, progress, cancel);
    return finish(outcome, options, progress);
}

DownloadResult BlobDownloader::finish(const TransferOutcome &outcome,
                                      const DownloadOptions &options,
                                      const ProgressCallback &progress)
{
    const auto &session = outcome.session;
    const auto &name = session.objectName();
    const auto &path = session.localFilePath();
    const auto bytes = outcome.attempt.bytesOnDisk;

    switch (outcome.attempt.status)
    {
    case AttemptStatus::Cancelled:
        return DownloadResult::cancelled(name, path, bytes);
    case AttemptStatus::PermanentFailure:
    case AttemptStatus::TransientFailure:
        return DownloadResult::failed(name, path, bytes, outcome.attempt.error);
    case AttemptStatus::Succeeded:
        break;
    }

    if (options.verifyChecksum && session.expectedChecksum())
    {
        if (progress)
        {
            progress(ProgressSnapshot::fromSession(session, DownloadStage::Verifying));
        }

        IntegrityStatus status;
        try
        {
            status = IntegrityVerifier::verify(path, session.expectedChecksum());
        }
        catch (const std::runtime_error &e)
        {
            return DownloadResult::integrityFailed(
                name, path, bytes, fmt::format("Download integrity verification failed: {}", e.what()));
        }

        if (status == IntegrityStatus::Mismatch)
        {
            // The file stays on disk for inspection
            return DownloadResult::integrityFailed(name, path, bytes, "Download integrity verification failed");
        }
    }

    if (progress)
    {
        progress(ProgressSnapshot::fromSession(session, DownloadStage::Completed));
    }
    engineLogger()->info("Downloaded {} ({} bytes) to {}", name, bytes, path.string());
    return DownloadResult::completed(name, path, bytes);
}
