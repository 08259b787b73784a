#include "transfer_executor.hpp"
#include "chunk_sink.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "progress_reporter.hpp"
#include "rate_limiter.hpp"

#include <memory>
#include <optional>
#include <system_error>
#include <vector>

#include <fmt/core.h>

TransferExecutor::TransferExecutor(RemoteObjectReader &reader, Clock &clock)
    : reader_(reader), clock_(clock)
{
}

AttemptResult TransferExecutor::run(const DownloadSession &session,
                                    const DownloadOptions &options,
                                    const ProgressCallback &progress,
                                    const CancellationToken &cancel)
{
    AttemptResult result;
    try
    {
        copyObject(session, options, progress, cancel);
        result.status = AttemptStatus::Succeeded;
    }
    catch (const TransferCancelled &e)
    {
        result.status = AttemptStatus::Cancelled;
        result.error = e.what();
    }
    catch (const PermanentTransferError &e)
    {
        result.status = AttemptStatus::PermanentFailure;
        result.error = e.what();
    }
    catch (const TransferError &e)
    {
        result.status = AttemptStatus::TransientFailure;
        result.error = e.what();
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        result.status = AttemptStatus::TransientFailure;
        result.error = e.what();
    }

    // The file on disk is the authority on how much was transferred
    result.bytesOnDisk = sizeOnDisk(session.localFilePath());

    if (result.status == AttemptStatus::Succeeded && result.bytesOnDisk != session.totalBytes())
    {
        result.status = AttemptStatus::TransientFailure;
        result.error = fmt::format("File size mismatch: expected {} bytes but got {}",
                                   session.totalBytes(), result.bytesOnDisk);
    }

    if (result.status != AttemptStatus::Succeeded)
    {
        engineLogger()->warn("Attempt {} for {} ended with {} bytes on disk: {}",
                             session.retryCount() + 1, session.objectName(), result.bytesOnDisk, result.error);
    }
    return result;
}

void TransferExecutor::copyObject(const DownloadSession &session,
                                  const DownloadOptions &options,
                                  const ProgressCallback &progress,
                                  const CancellationToken &cancel)
{
    cancel.throwIfCancelled();

    const auto &name = session.objectName();
    const auto startOffset = session.startOffset(options.enableResumption);
    const auto total = session.totalBytes();

    auto logger = engineLogger();
    logger->info("Downloading {} to {} from byte {} of {}",
                 name, session.localFilePath().string(), startOffset, total);

    FileSink file(session.localFilePath(), startOffset);

    ChunkSink *target = &file;
    std::optional<RateLimiter> limiter;
    if (options.bandwidthLimitBytesPerSecond)
    {
        limiter.emplace(file, *options.bandwidthLimitBytesPerSecond, clock_, cancel);
        target = &*limiter;
    }
    ProgressReporter reporter(*target, session, startOffset, clock_, progress);

    if (startOffset < total || total == 0)
    {
        std::unique_ptr<ByteStream> stream = startOffset > 0
                                                 ? reader_.openReadRange(name, startOffset, total - startOffset)
                                                 : reader_.openRead(name);

        std::vector<char> buffer(options.bufferSize);
        while (true)
        {
            cancel.throwIfCancelled();
            std::size_t count = stream->read(buffer.data(), buffer.size());
            if (count == 0)
            {
                break;
            }
            reporter.write(buffer.data(), count);
            logger->trace("{}: wrote {} bytes", name, count);
        }
    }

    file.close();

    if (progress)
    {
        progress(reporter.snapshot());
    }
}

std::uint64_t TransferExecutor::sizeOnDisk(const std::filesystem::path &path)
{
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}
