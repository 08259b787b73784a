#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "download_types.hpp"
#include "logging.hpp"
#include "path_resolver.hpp"

/**
 * Settings of the blobfetch command line.
 * Populated by CLI11 from arguments and the optional config file.
 */
struct DownloadConfig
{
    // Remote store
    std::string endpoint;                   // e.g. https://account.blob.core.windows.net
    std::string container;
    std::optional<std::string> accessToken; // Sent as "Authorization: Bearer <token>"
    std::optional<std::string> sasToken;    // Appended to object URLs as a query string
    int timeoutSeconds = 300;

    // Transfer behaviour
    int maxRetries = 3;
    std::string conflict = "ask";
    std::optional<double> bandwidthLimitMiB; // MiB per second, unset = unlimited
    bool noVerify = false;
    bool noResume = false;
    bool noCreateDirs = false;
    std::size_t bufferSize = 8192;

    // Work session layout for batch downloads
    std::optional<std::string> sessionName;
    std::string storageAccount;
    std::string sessionRoot = ".";

    // Logging
    std::string logLevel = "warn";
    std::optional<std::string> logFile;

    bool showVersion = false;
};

/**
 * @throws std::invalid_argument for an unknown conflict mode or a non-positive limit
 */
DownloadOptions makeDownloadOptions(const DownloadConfig &config);

/**
 * Work session downloads are rooted under, if a session name is configured.
 */
std::optional<WorkSession> makeWorkSession(const DownloadConfig &config);

LogConfig makeLogConfig(const DownloadConfig &config);
