#include "batch_coordinator.hpp"
#include "blob_downloader.hpp"
#include "conflict_resolver.hpp"
#include "logging.hpp"
#include "path_resolver.hpp"
#include "remote_object.hpp"

#include <stdexcept>

namespace
{
    // Keeps "apply to all" conflict answers scoped to one batch
    class BatchScope
    {
    public:
        explicit BatchScope(ConflictResolver &conflicts) : conflicts_(conflicts) { conflicts_.beginBatch(); }
        ~BatchScope() { conflicts_.endBatch(); }

        BatchScope(const BatchScope &) = delete;
        BatchScope &operator=(const BatchScope &) = delete;

    private:
        ConflictResolver &conflicts_;
    };
}

BatchCoordinator::BatchCoordinator(BlobDownloader &downloader,
                                   ObjectLister &lister,
                                   PathResolver &paths,
                                   ConflictResolver &conflicts)
    : downloader_(downloader), lister_(lister), paths_(paths), conflicts_(conflicts)
{
}

std::vector<DownloadResult> BatchCoordinator::run(const std::string &pattern,
                                                  const std::filesystem::path &localDirectory,
                                                  const DownloadOptions &options,
                                                  const BatchProgressCallback &progress,
                                                  const CancellationToken &cancel,
                                                  const ProgressCallback &objectProgress)
{
    auto logger = engineLogger();
    auto names = lister_.list(pattern, listingPrefix(pattern));
    logger->info("Pattern '{}' matched {} objects", pattern, names.size());

    WorkSession layout = downloader_.workSession().value_or(WorkSession{"", "", localDirectory});

    BatchScope scope(conflicts_);
    std::vector<DownloadResult> results;
    results.reserve(names.size());

    BatchProgress aggregate;
    aggregate.totalObjects = names.size();

    // Bytes of objects already finished, successful or not
    std::uint64_t finishedBytes = 0;

    auto report = [&]()
    {
        if (progress)
        {
            progress(aggregate);
        }
    };

    for (const auto &name : names)
    {
        if (cancel.isCancelled())
        {
            logger->info("Batch cancelled before {}", name);
            break;
        }

        aggregate.currentObjectName = name;
        aggregate.currentObjectFraction = 0.0;
        aggregate.totalBytesDownloaded = finishedBytes;
        report();

        std::filesystem::path target;
        try
        {
            target = paths_.resolve(layout, downloader_.containerName(), name);
        }
        catch (const std::invalid_argument &e)
        {
            logger->error("Cannot place {}: {}", name, e.what());
            results.push_back(DownloadResult::failed(name, {}, 0, e.what()));
            continue;
        }

        auto onObjectProgress = [&](const ProgressSnapshot &snapshot)
        {
            aggregate.currentObjectFraction = snapshot.totalBytes == 0
                                                  ? 0.0
                                                  : static_cast<double>(snapshot.downloadedBytes) /
                                                        static_cast<double>(snapshot.totalBytes);
            aggregate.totalBytesDownloaded = finishedBytes + snapshot.downloadedBytes;
            report();
            if (objectProgress)
            {
                objectProgress(snapshot);
            }
        };

        auto result = downloader_.startDownload(name, target, options, onObjectProgress, cancel);
        finishedBytes += result.bytesDownloaded;
        if (result.success)
        {
            ++aggregate.completedObjects;
        }
        else
        {
            logger->warn("{}: {} ({})", name, toString(result.outcome), result.error.value_or(""));
        }
        results.push_back(std::move(result));
    }

    aggregate.currentObjectName.clear();
    aggregate.currentObjectFraction = 0.0;
    aggregate.totalBytesDownloaded = finishedBytes;
    report();
    return results;
}

std::optional<std::string> BatchCoordinator::listingPrefix(const std::string &pattern)
{
    std::string prefix = pattern.substr(0, pattern.find_first_of("*?"));
    if (prefix.empty())
    {
        return std::nullopt;
    }
    return prefix;
}
