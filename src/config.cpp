#include "config.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <fmt/core.h>

DownloadOptions makeDownloadOptions(const DownloadConfig &config)
{
    DownloadOptions options;
    options.maxRetryAttempts = config.maxRetries;
    options.enableResumption = !config.noResume;
    options.verifyChecksum = !config.noVerify;
    options.conflictMode = parseConflictMode(config.conflict);
    options.createDirectories = !config.noCreateDirs;
    options.bufferSize = config.bufferSize;

    if (config.bandwidthLimitMiB)
    {
        double limit = *config.bandwidthLimitMiB;
        if (!(limit > 0.0) || !std::isfinite(limit))
        {
            throw std::invalid_argument(
                fmt::format("Bandwidth limit must be a positive number of MiB/s (got {})", limit));
        }
        options.bandwidthLimitBytesPerSecond =
            std::max<std::uint64_t>(1, static_cast<std::uint64_t>(limit * 1024.0 * 1024.0));
    }

    options.validate();
    return options;
}

std::optional<WorkSession> makeWorkSession(const DownloadConfig &config)
{
    if (!config.sessionName || config.sessionName->empty())
    {
        return std::nullopt;
    }
    return WorkSession{*config.sessionName, config.storageAccount, config.sessionRoot};
}

LogConfig makeLogConfig(const DownloadConfig &config)
{
    LogConfig logConfig;
    logConfig.level = config.logLevel;
    logConfig.file = config.logFile;
    logConfig.console = true;
    return logConfig;
}
