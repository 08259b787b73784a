#pragma once

#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

struct LogConfig
{
    std::string level = "warn";      // trace, debug, info, warn, error, critical, off
    std::optional<std::string> file; // Append log lines to this file when set
    bool console = true;             // Log to stderr
};

/**
 * (Re)configure the engine logger. Safe to call more than once.
 * @throws spdlog::spdlog_ex if the log file cannot be opened
 */
void initLogging(const LogConfig &config);

/**
 * Logger used by the engine. Before initLogging() it writes warnings and
 * above to stderr.
 */
std::shared_ptr<spdlog::logger> engineLogger();
