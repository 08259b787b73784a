#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <system_error>
#include <unistd.h>

#include <fmt/core.h>
#include <CLI/CLI.hpp> // CLI11 main header

#include "blob_downloader.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "conflict_resolver.hpp"
#include "console_conflict_prompt.hpp"
#include "errors.hpp"
#include "http_object_reader.hpp"
#include "logging.hpp"
#include "manifest_lister.hpp"
#include "path_resolver.hpp"
#include "progress_renderer.hpp"

namespace
{
    constexpr const char *VERSION = "blobfetch v1.0";
    constexpr int EXIT_INTEGRITY_FAILED = 2;
    constexpr int EXIT_CANCELLED = 130;

    std::atomic<CancellationSource *> activeCancellation{nullptr};

    void handleInterrupt(int)
    {
        if (CancellationSource *source = activeCancellation.load())
        {
            source->cancel();
        }
    }

    /**
     * Routes SIGINT and SIGTERM to a cancellation source while in scope.
     * Must not outlive the source.
     */
    class InterruptScope
    {
    public:
        explicit InterruptScope(CancellationSource &source)
        {
            activeCancellation.store(&source);
            std::signal(SIGINT, handleInterrupt);
            std::signal(SIGTERM, handleInterrupt);
        }

        ~InterruptScope()
        {
            std::signal(SIGINT, SIG_DFL);
            std::signal(SIGTERM, SIG_DFL);
            activeCancellation.store(nullptr);
        }

        InterruptScope(const InterruptScope &) = delete;
        InterruptScope &operator=(const InterruptScope &) = delete;
    };

    int exitCodeFor(const DownloadResult &result)
    {
        switch (result.outcome)
        {
        case DownloadOutcome::Completed:
        case DownloadOutcome::Skipped:
            return 0;
        case DownloadOutcome::IntegrityFailed:
            return EXIT_INTEGRITY_FAILED;
        case DownloadOutcome::Cancelled:
            return EXIT_CANCELLED;
        case DownloadOutcome::Failed:
            break;
        }
        return 1;
    }

    void printResult(const DownloadResult &result)
    {
        switch (result.outcome)
        {
        case DownloadOutcome::Completed:
            fmt::print("✓ {} -> {} ({})\n", result.objectName, result.localFilePath.string(),
                       ProgressRenderer::formatBytes(result.bytesDownloaded));
            break;
        case DownloadOutcome::Skipped:
            fmt::print("- {} skipped: {}\n", result.objectName, result.error.value_or(""));
            break;
        case DownloadOutcome::Cancelled:
            fmt::print(stderr, "✗ {} cancelled with {} on disk. Run 'blobfetch resume' to continue.\n",
                       result.objectName, ProgressRenderer::formatBytes(result.bytesDownloaded));
            break;
        case DownloadOutcome::IntegrityFailed:
            fmt::print(stderr, "✗ {}: {}\n", result.objectName, result.error.value_or(""));
            fmt::print(stderr, "  File kept at: {}\n", result.localFilePath.string());
            break;
        case DownloadOutcome::Failed:
            fmt::print(stderr, "✗ {}: {}\n", result.objectName, result.error.value_or("unknown error"));
            break;
        }
    }
}

int main(int argc, char *argv[])
{
    // Quick check for --version flag before full parsing
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--version" || arg == "-v")
        {
            fmt::print("{}\n", VERSION);
            fmt::print("Built with:\n");
            fmt::print("  - libcurl: HTTP/HTTPS transfers\n");
            fmt::print("  - OpenSSL: checksum verification\n");
            fmt::print("  - CLI11: Command-line parsing\n");
            fmt::print("  - fmt / spdlog: Formatting and logging\n");
            return 0;
        }
    }

    CLI::App app{"blobfetch - resumable downloads from a blob store"};
    app.set_config("--config", "blobfetch.ini", "Read options from an INI or TOML file");
    app.require_subcommand(1);
    app.fallthrough();

    DownloadConfig config;

    // ====================================================================
    // REMOTE STORE
    // ====================================================================

    app.add_option("--endpoint", config.endpoint, "Blob store base URL")
        ->envname("BLOBFETCH_ENDPOINT")
        ->required()
        ->check([](const std::string &url) -> std::string {
            if (url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0) {
                return "";
            }
            return "Endpoint must start with http:// or https://";
        });
    app.add_option("--container", config.container, "Container holding the objects")
        ->envname("BLOBFETCH_CONTAINER")
        ->required();
    app.add_option("--token", config.accessToken, "Bearer access token")
        ->envname("BLOBFETCH_TOKEN");
    app.add_option("--sas", config.sasToken, "Shared access signature query string")
        ->envname("BLOBFETCH_SAS");
    app.add_option("-t,--timeout", config.timeoutSeconds,
                   "Seconds without progress before an attempt fails")
        ->check(CLI::PositiveNumber)
        ->default_val(300);

    // ====================================================================
    // TRANSFER BEHAVIOUR
    // ====================================================================

    app.add_option("-r,--retry-count,--max-retries", config.maxRetries,
                   "Maximum retry attempts for transient errors")
        ->check(CLI::Range(0, 10))
        ->default_val(3);
    auto *conflictOption = app.add_option("--conflict", config.conflict,
                                          "What to do when the local file exists")
                               ->check(CLI::IsMember({"overwrite", "skip", "rename", "ask"}, CLI::ignore_case))
                               ->default_val("ask");
    auto *overwriteFlag = app.add_flag_callback("--overwrite", [&config]() { config.conflict = "overwrite"; },
                                                "Same as --conflict overwrite");
    auto *skipFlag = app.add_flag_callback("--skip", [&config]() { config.conflict = "skip"; },
                                           "Same as --conflict skip");
    auto *renameFlag = app.add_flag_callback("--rename", [&config]() { config.conflict = "rename"; },
                                             "Same as --conflict rename");
    overwriteFlag->excludes(skipFlag)->excludes(renameFlag)->excludes(conflictOption);
    skipFlag->excludes(renameFlag)->excludes(conflictOption);
    renameFlag->excludes(conflictOption);

    app.add_option("-l,--limit", config.bandwidthLimitMiB, "Bandwidth limit in MiB/s")
        ->check(CLI::PositiveNumber);
    app.add_flag("--no-verify", config.noVerify, "Skip checksum verification");
    app.add_flag("--no-resume", config.noResume, "Always restart interrupted transfers from the beginning");
    app.add_flag("--no-create-dirs", config.noCreateDirs, "Fail instead of creating missing directories");
    app.add_option("--buffer-size", config.bufferSize, "Copy buffer size in bytes")
        ->check(CLI::Range(static_cast<std::size_t>(1), static_cast<std::size_t>(16 * 1024 * 1024)))
        ->default_val(8192);

    // ====================================================================
    // WORK SESSION AND LOGGING
    // ====================================================================

    app.add_option("--session", config.sessionName, "Work session batch files are stored under");
    app.add_option("--account", config.storageAccount, "Storage account name of the work session");
    app.add_option("--session-root", config.sessionRoot, "Directory holding work sessions")
        ->default_val(".");
    app.add_option("--log-level", config.logLevel, "trace, debug, info, warn, error, critical or off")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}))
        ->default_val("warn");
    app.add_option("--log-file", config.logFile, "Also write log lines to this file");

    // Handled by the early scan above; listed here for --help
    app.add_flag("-v,--version", config.showVersion, "Display version information");

    // ====================================================================
    // SUBCOMMANDS
    // ====================================================================

    std::string objectName;
    std::string destination;
    auto *getCommand = app.add_subcommand("get", "Download one object");
    getCommand->add_option("OBJECT", objectName, "Object name in the container")->required();
    getCommand->add_option("DESTINATION", destination, "Local file path (default: object file name)");

    std::string pattern;
    std::string directory = ".";
    std::string manifest;
    auto *batchCommand = app.add_subcommand("batch", "Download all objects matching a pattern");
    batchCommand->add_option("PATTERN", pattern, "Object name pattern using * and ?")->required();
    batchCommand->add_option("DIRECTORY", directory, "Local download directory")->default_val(".");
    batchCommand->add_option("-m,--manifest", manifest, "File listing the container's object names")
        ->required()
        ->check(CLI::ExistingFile);

    std::string resumeFile;
    auto *resumeCommand = app.add_subcommand("resume", "Continue an interrupted download");
    resumeCommand->add_option("OBJECT", objectName, "Object name in the container")->required();
    resumeCommand->add_option("LOCAL_FILE", resumeFile, "Partially downloaded file")->required();

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    // ====================================================================
    // PERFORM DOWNLOAD
    // ====================================================================

    try
    {
        initLogging(makeLogConfig(config));
        DownloadOptions options = makeDownloadOptions(config);

        HttpReaderConfig readerConfig;
        readerConfig.endpoint = config.endpoint;
        readerConfig.container = config.container;
        readerConfig.accessToken = config.accessToken;
        readerConfig.sasToken = config.sasToken;
        readerConfig.timeoutSeconds = config.timeoutSeconds;
        HttpObjectReader reader(readerConfig);

        // Only ask when someone can answer
        ConsoleConflictPrompt prompt(std::cin);
        bool interactive = ::isatty(fileno(stdin)) != 0;
        ConflictResolver conflicts(interactive ? &prompt : nullptr, config.sessionName.value_or(""));

        SessionPathResolver paths;
        SystemClock clock;
        std::optional<ManifestObjectLister> lister;
        if (*batchCommand)
        {
            lister.emplace(manifest);
        }

        BlobDownloader downloader(reader, conflicts, paths, clock, lister ? &*lister : nullptr);
        downloader.setWorkSession(makeWorkSession(config));

        CancellationSource cancellation;
        InterruptScope interruptScope(cancellation);

        ProgressRenderer renderer;
        auto onProgress = [&renderer](const ProgressSnapshot &snapshot) { renderer.render(snapshot); };

        int exitCode = 0;
        if (*getCommand)
        {
            std::filesystem::path target = destination.empty()
                                               ? std::filesystem::path(objectName).filename()
                                               : std::filesystem::path(destination);
            auto result = downloader.startDownload(objectName, target, options, onProgress, cancellation.token());
            renderer.finish();
            printResult(result);
            exitCode = exitCodeFor(result);
        }
        else if (*batchCommand)
        {
            auto results = downloader.startBatchDownload(
                pattern, directory, options,
                [&renderer](const BatchProgress &progress) { renderer.renderBatch(progress); },
                cancellation.token());
            renderer.finish();

            std::size_t succeeded = 0;
            for (const auto &result : results)
            {
                printResult(result);
                if (result.success)
                {
                    ++succeeded;
                }
                else if (exitCode == 0 && result.outcome != DownloadOutcome::Skipped)
                {
                    exitCode = exitCodeFor(result);
                }
            }
            fmt::print("\n{} of {} objects downloaded\n", succeeded, results.size());
            if (cancellation.isCancelled())
            {
                exitCode = EXIT_CANCELLED;
            }
        }
        else if (*resumeCommand)
        {
            ObjectMetadata metadata;
            try
            {
                metadata = reader.metadata(objectName);
            }
            catch (const TransferError &e)
            {
                fmt::print(stderr, "✗ {}\n", e.what());
                return 1;
            }

            std::error_code ec;
            auto onDisk = std::filesystem::file_size(resumeFile, ec);
            auto session = DownloadSession::resume(objectName, reader.containerName(), resumeFile,
                                                   metadata.size, ec ? 0 : static_cast<std::uint64_t>(onDisk),
                                                   metadata.checksum);
            if (session.canResume())
            {
                fmt::print("Found existing partial download ({} already downloaded).\n",
                           ProgressRenderer::formatBytes(session.downloadedBytes()));
            }

            auto result = downloader.resumeDownload(session, options, onProgress, cancellation.token());
            renderer.finish();
            printResult(result);
            exitCode = exitCodeFor(result);
        }

        return exitCode;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        return 1;
    }
}
