#include "console_conflict_prompt.hpp"
#include "progress_renderer.hpp"

#include <cctype>
#include <ctime>
#include <string>

#include <fmt/core.h>

namespace
{
    std::string formatTime(const std::optional<std::chrono::system_clock::time_point> &time)
    {
        if (!time)
        {
            return "unknown";
        }
        std::time_t seconds = std::chrono::system_clock::to_time_t(*time);
        std::tm utc{};
        gmtime_r(&seconds, &utc);
        char buffer[32];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S UTC", &utc);
        return buffer;
    }

    std::string trim(const std::string &text)
    {
        auto begin = text.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos)
        {
            return {};
        }
        auto end = text.find_last_not_of(" \t\r\n");
        return text.substr(begin, end - begin + 1);
    }
}

ConsoleConflictPrompt::ConsoleConflictPrompt(std::istream &input, std::FILE *output)
    : input_(input), output_(output)
{
}

ConflictPromptResult ConsoleConflictPrompt::prompt(const std::filesystem::path &desiredPath,
                                                   const FileConflictInfo &info)
{
    fmt::print(output_, "\nFile already exists: {}\n", desiredPath.string());
    fmt::print(output_, "  Local:  {} | modified {}{}\n",
               info.localSize ? ProgressRenderer::formatBytes(*info.localSize) : "unknown size",
               formatTime(info.localModifiedUtc),
               info.localChecksum ? fmt::format(" | {}", *info.localChecksum) : "");
    fmt::print(output_, "  Remote: {} | modified {}{}\n",
               ProgressRenderer::formatBytes(info.remoteSize),
               formatTime(info.remoteModifiedUtc),
               info.remoteChecksum ? fmt::format(" | {}", *info.remoteChecksum) : "");
    if (info.localChecksum && info.remoteChecksum && *info.localChecksum == *info.remoteChecksum)
    {
        fmt::print(output_, "  Contents are identical.\n");
    }

    std::string line;
    while (true)
    {
        fmt::print(output_, "[o]verwrite, [s]kip, [r]ename (uppercase = all, '!' = remember): ");
        std::fflush(output_);

        if (!std::getline(input_, line))
        {
            fmt::print(output_, "\n");
            return ConflictPromptResult{ConflictMode::Skip, false, false};
        }

        if (auto answer = parseAnswer(line))
        {
            return *answer;
        }
        fmt::print(output_, "Please answer o, s or r.\n");
    }
}

std::optional<ConflictPromptResult> ConsoleConflictPrompt::parseAnswer(const std::string &line)
{
    std::string answer = trim(line);
    ConflictPromptResult result;

    if (!answer.empty() && answer.back() == '!')
    {
        result.rememberForSession = true;
        answer.pop_back();
    }
    if (answer.size() != 1)
    {
        return std::nullopt;
    }

    char choice = answer[0];
    result.applyToAll = std::isupper(static_cast<unsigned char>(choice)) != 0;
    switch (std::tolower(static_cast<unsigned char>(choice)))
    {
    case 'o':
        result.decision = ConflictMode::Overwrite;
        break;
    case 's':
        result.decision = ConflictMode::Skip;
        break;
    case 'r':
        result.decision = ConflictMode::Rename;
        break;
    default:
        return std::nullopt;
    }
    return result;
}
