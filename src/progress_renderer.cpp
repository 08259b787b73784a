#include "progress_renderer.hpp"

#include <algorithm>

#include <fmt/core.h>
#include <unistd.h>

ProgressRenderer::ProgressRenderer(std::FILE *output)
    : output_(output), isTerminalOutput_(::isatty(fileno(output)) != 0)
{
}

void ProgressRenderer::render(const ProgressSnapshot &snapshot)
{
    bool isFinal = snapshot.stage == DownloadStage::Completed;

    switch (snapshot.stage)
    {
    case DownloadStage::Starting:
        finish();
        fmt::print(output_, "{} ({})\n", snapshot.objectName, formatBytes(snapshot.totalBytes));
        return;
    case DownloadStage::Verifying:
        finish();
        fmt::print(output_, "Verifying checksum...\n");
        return;
    case DownloadStage::Downloading:
    case DownloadStage::Completed:
        break;
    }

    if (snapshot.retryCount > 0 && snapshot.bytesPerSecond == 0.0 && !isFinal)
    {
        finish();
        fmt::print(output_, "Retry {} from {}...\n", snapshot.retryCount, formatBytes(snapshot.downloadedBytes));
        return;
    }

    if (!shouldPrint(snapshot.percentage, isFinal))
    {
        return;
    }

    long eta = snapshot.etaSeconds ? static_cast<long>(*snapshot.etaSeconds) : -1;
    auto line = fmt::format("{} {:.1f}% | {} / {} | {} | ETA: {}",
                            makeBar(snapshot.percentage),
                            snapshot.percentage,
                            formatBytes(snapshot.downloadedBytes),
                            formatBytes(snapshot.totalBytes),
                            formatSpeed(snapshot.bytesPerSecond),
                            formatDuration(eta));

    if (isTerminalOutput_)
    {
        fmt::print(output_, "\r{}\033[K", line);
        std::fflush(output_);
        lineOpen_ = true;
    }
    else
    {
        fmt::print(output_, "{}\n", line);
    }

    if (isFinal)
    {
        finish();
    }
}

void ProgressRenderer::renderBatch(const BatchProgress &progress)
{
    double overall = progress.totalObjects == 0
                         ? 100.0
                         : (static_cast<double>(progress.completedObjects) + progress.currentObjectFraction) /
                               static_cast<double>(progress.totalObjects) * 100.0;
    bool isFinal = progress.currentObjectName.empty();

    if (!shouldPrint(overall, isFinal))
    {
        return;
    }

    auto line = fmt::format("{} {}/{} objects | {} | {}",
                            makeBar(overall),
                            progress.completedObjects,
                            progress.totalObjects,
                            formatBytes(progress.totalBytesDownloaded),
                            isFinal ? std::string("done") : progress.currentObjectName);

    if (isTerminalOutput_)
    {
        fmt::print(output_, "\r{}\033[K", line);
        std::fflush(output_);
        lineOpen_ = true;
    }
    else
    {
        fmt::print(output_, "{}\n", line);
    }
}

void ProgressRenderer::finish()
{
    if (lineOpen_)
    {
        fmt::print(output_, "\n");
        lineOpen_ = false;
    }
    lastPrintedPercentage_ = -1.0;
}

bool ProgressRenderer::shouldPrint(double percentage, bool isFinal)
{
    if (isFinal || isTerminalOutput_)
    {
        return true;
    }

    // Piped output: print less frequently
    auto now = std::chrono::steady_clock::now();
    bool percentMoved = lastPrintedPercentage_ < 0.0 || percentage >= lastPrintedPercentage_ + 1.0;
    if (!percentMoved && now - lastPrintedTime_ < std::chrono::seconds(1))
    {
        return false;
    }
    lastPrintedPercentage_ = percentage;
    lastPrintedTime_ = now;
    return true;
}

std::string ProgressRenderer::formatBytes(std::uint64_t bytes)
{
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    auto value = static_cast<double>(bytes);
    if (value >= GB)
    {
        return fmt::format("{:.2f} GB", value / GB);
    }
    else if (value >= MB)
    {
        return fmt::format("{:.2f} MB", value / MB);
    }
    else if (value >= KB)
    {
        return fmt::format("{:.2f} KB", value / KB);
    }
    return fmt::format("{} B", bytes);
}

std::string ProgressRenderer::formatDuration(long seconds)
{
    if (seconds < 0)
    {
        return "unknown";
    }
    else if (seconds < 60)
    {
        return fmt::format("{}s", seconds);
    }
    else if (seconds < 3600)
    {
        return fmt::format("{}m {}s", seconds / 60, seconds % 60);
    }
    return fmt::format("{}h {}m", seconds / 3600, (seconds % 3600) / 60);
}

std::string ProgressRenderer::formatSpeed(double bytesPerSecond)
{
    if (bytesPerSecond >= 1024 * 1024)
    {
        return fmt::format("{:.2f} MB/s", bytesPerSecond / (1024.0 * 1024.0));
    }
    else if (bytesPerSecond >= 1024)
    {
        return fmt::format("{:.2f} KB/s", bytesPerSecond / 1024.0);
    }
    return fmt::format("{:.0f} B/s", bytesPerSecond);
}

std::string ProgressRenderer::makeBar(double percentage)
{
    constexpr int barWidth = 50;
    int filled = static_cast<int>(std::clamp(percentage, 0.0, 100.0) / 100.0 * barWidth);

    std::string bar = "[";
    for (int i = 0; i < barWidth; ++i)
    {
        if (i < filled)
        {
            bar += "=";
        }
        else if (i == filled)
        {
            bar += ">";
        }
        else
        {
            bar += " ";
        }
    }
    bar += "]";
    return bar;
}
