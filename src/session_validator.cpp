#include "session_validator.hpp"
#include "logging.hpp"

#include <cerrno>
#include <cstring>

#include <sys/stat.h>

std::optional<DownloadSession> SessionValidator::validate(const DownloadSession &session)
{
    auto logger = engineLogger();
    const auto &path = session.localFilePath();

    struct stat info{};
    if (::stat(path.c_str(), &info) != 0)
    {
        if (errno == ENOENT)
        {
            logger->info("No partial file at {}, starting fresh", path.string());
        }
        else
        {
            logger->warn("Cannot read state of {} ({}), starting fresh", path.string(), std::strerror(errno));
        }
        return std::nullopt;
    }

    const auto size = static_cast<std::uint64_t>(info.st_size);
    const auto total = session.totalBytes();

    if (size != session.downloadedBytes())
    {
        if (size < total)
        {
            logger->warn("Partial file {} has {} bytes but session recorded {}, resuming from disk size",
                         path.string(), size, session.downloadedBytes());
            return session.withProgress(size);
        }
        logger->warn("Partial file {} has {} bytes, not smaller than object size {}, starting fresh",
                     path.string(), size, total);
        return std::nullopt;
    }

    auto modified = std::chrono::system_clock::from_time_t(info.st_mtime);
    if (modified > session.lastUpdatedAt() + MODIFICATION_TOLERANCE)
    {
        if (size < total)
        {
            logger->warn("Partial file {} was modified after the last update, re-reading its size",
                         path.string());
            return session.withProgress(size);
        }
        logger->warn("Partial file {} was modified after the last update, starting fresh", path.string());
        return std::nullopt;
    }

    return session;
}
