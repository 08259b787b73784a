#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>

#include "download_types.hpp"

/**
 * Draws download progress on the terminal.
 * On a TTY the bar is redrawn in place; when output is piped, a line is
 * printed at most once per second or per percent.
 */
class ProgressRenderer
{
public:
    explicit ProgressRenderer(std::FILE *output = stdout);

    void render(const ProgressSnapshot &snapshot);
    void renderBatch(const BatchProgress &progress);

    /**
     * End the current bar line.
     */
    void finish();

    /**
     * Format bytes into human-readable string (e.g., "52.30 MB")
     */
    static std::string formatBytes(std::uint64_t bytes);

    /**
     * Format duration into human-readable string (e.g., "2m 30s")
     */
    static std::string formatDuration(long seconds);

    static std::string formatSpeed(double bytesPerSecond);

    /**
     * 50 character bar, e.g. "[=====>    ]"
     */
    static std::string makeBar(double percentage);

private:
    bool shouldPrint(double percentage, bool isFinal);

    std::FILE *output_;
    bool isTerminalOutput_;
    bool lineOpen_ = false;
    double lastPrintedPercentage_ = -1.0;
    std::chrono::steady_clock::time_point lastPrintedTime_;
};
