#include "config.hpp"
#include "test_support.hpp"

#include <stdexcept>

int main()
{
    TestReport report("config");

    DownloadConfig config;
    auto defaults = makeDownloadOptions(config);
    report.check(defaults.maxRetryAttempts == 3 && defaults.conflictMode == ConflictMode::Ask &&
                     defaults.verifyChecksum && defaults.enableResumption && defaults.createDirectories &&
                     !defaults.bandwidthLimitBytesPerSecond,
                 "defaults map to default options");

    config.maxRetries = 5;
    config.conflict = "SKIP";
    config.bandwidthLimitMiB = 1.5;
    config.noVerify = true;
    config.noResume = true;
    config.noCreateDirs = true;
    config.bufferSize = 65536;
    auto options = makeDownloadOptions(config);
    report.check(options.maxRetryAttempts == 5 && options.conflictMode == ConflictMode::Skip, "retries and conflict");
    report.check(options.bandwidthLimitBytesPerSecond == std::optional<std::uint64_t>(1572864), "MiB/s to bytes");
    report.check(!options.verifyChecksum && !options.enableResumption && !options.createDirectories &&
                     options.bufferSize == 65536,
                 "flags are inverted into options");

    auto rejects = [](DownloadConfig bad)
    {
        try
        {
            makeDownloadOptions(bad);
        }
        catch (const std::invalid_argument &)
        {
            return true;
        }
        return false;
    };
    DownloadConfig badConflict;
    badConflict.conflict = "merge";
    DownloadConfig badLimit;
    badLimit.bandwidthLimitMiB = -2.0;
    report.check(rejects(badConflict) && rejects(badLimit), "invalid settings are rejected");

    report.check(!makeWorkSession(DownloadConfig{}), "no work session without a name");
    DownloadConfig withSession;
    withSession.sessionName = "case-7";
    withSession.storageAccount = "acct";
    withSession.sessionRoot = "/data";
    auto session = makeWorkSession(withSession);
    report.check(session && session->name == "case-7" && session->rootDirectory == "/data",
                 "work session from settings");

    DownloadConfig logging;
    logging.logLevel = "debug";
    logging.logFile = "/tmp/blobfetch.log";
    auto logConfig = makeLogConfig(logging);
    report.check(logConfig.level == "debug" && logConfig.file == logging.logFile, "log settings");

    return report.finish();
}
