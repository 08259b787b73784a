#include "conflict_resolver.hpp"
#include "checksum.hpp"
#include "logging.hpp"

#include <regex>
#include <system_error>

#include <fmt/core.h>
#include <sys/stat.h>

ConflictResolver::ConflictResolver(InteractiveConflictResolver *interactive, std::string sessionName)
    : interactive_(interactive), sessionName_(std::move(sessionName))
{
}

FileConflictDecision ConflictResolver::resolve(const std::filesystem::path &desiredPath,
                                               ConflictMode mode,
                                               const FileConflictInfo &info)
{
    if (!info.localExists)
    {
        FileConflictDecision decision;
        decision.resolvedPath = desiredPath;
        decision.chosenMode = mode;
        return decision;
    }

    if (mode != ConflictMode::Ask)
    {
        return applyMode(desiredPath, mode);
    }

    auto remembered = rememberedChoices_.find(sessionName_);
    if (remembered != rememberedChoices_.end())
    {
        engineLogger()->debug("Using remembered conflict choice '{}' for {}",
                              toString(remembered->second), desiredPath.string());
        return applyMode(desiredPath, remembered->second);
    }

    if (batchChoice_)
    {
        return applyMode(desiredPath, *batchChoice_);
    }

    if (!interactive_)
    {
        engineLogger()->info("{} exists and nobody can be asked, renaming", desiredPath.string());
        return applyMode(desiredPath, ConflictMode::Rename);
    }

    auto answer = interactive_->prompt(desiredPath, info);
    auto chosen = answer.decision == ConflictMode::Ask ? ConflictMode::Rename : answer.decision;

    if (answer.rememberForSession)
    {
        rememberedChoices_[sessionName_] = chosen;
    }
    if (answer.applyToAll && inBatch_)
    {
        batchChoice_ = chosen;
    }

    auto decision = applyMode(desiredPath, chosen);
    decision.applyToAll = answer.applyToAll;
    decision.rememberForSession = answer.rememberForSession;
    return decision;
}

FileConflictDecision ConflictResolver::applyMode(const std::filesystem::path &desiredPath, ConflictMode mode) const
{
    FileConflictDecision decision;
    decision.chosenMode = mode;

    switch (mode)
    {
    case ConflictMode::Skip:
        decision.skip = true;
        break;
    case ConflictMode::Rename:
    case ConflictMode::Ask:
        decision.chosenMode = ConflictMode::Rename;
        decision.resolvedPath = makeUniquePath(desiredPath);
        break;
    case ConflictMode::Overwrite:
        decision.resolvedPath = desiredPath;
        break;
    }
    return decision;
}

FileConflictInfo ConflictResolver::describe(const std::filesystem::path &localPath,
                                            const ObjectMetadata &remote,
                                            bool compareChecksums)
{
    FileConflictInfo info;
    info.remoteSize = remote.size;
    info.remoteModifiedUtc = remote.lastModified;
    info.remoteChecksum = remote.checksum;

    struct stat local{};
    if (::stat(localPath.c_str(), &local) != 0)
    {
        return info;
    }

    info.localExists = true;
    info.localSize = static_cast<std::uint64_t>(local.st_size);
    info.localModifiedUtc = std::chrono::system_clock::from_time_t(local.st_mtime);

    if (compareChecksums && remote.checksum)
    {
        try
        {
            info.localChecksum = ChecksumVerifier::computeLike(localPath, *remote.checksum);
        }
        catch (const std::runtime_error &e)
        {
            engineLogger()->warn("Could not hash existing file {}: {}", localPath.string(), e.what());
        }
    }
    return info;
}

std::filesystem::path ConflictResolver::makeUniquePath(const std::filesystem::path &desiredPath)
{
    static const std::regex counterSuffix(R"( \((\d+)\)$)");

    const auto directory = desiredPath.parent_path();
    const auto extension = desiredPath.extension().string();
    const auto baseName = std::regex_replace(desiredPath.stem().string(), counterSuffix, "");

    for (unsigned counter = 1;; ++counter)
    {
        auto candidate = directory / fmt::format("{} ({}){}", baseName, counter, extension);
        std::error_code ec;
        if (!std::filesystem::exists(candidate, ec))
        {
            return candidate;
        }
    }
}

void ConflictResolver::beginBatch()
{
    inBatch_ = true;
    batchChoice_.reset();
}

void ConflictResolver::endBatch()
{
    inBatch_ = false;
    batchChoice_.reset();
}
