#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "download_types.hpp"
#include "remote_object.hpp"

struct ConflictPromptResult
{
    ConflictMode decision = ConflictMode::Skip; // Ask is treated as Rename
    bool applyToAll = false;                    // Use for the rest of the current batch
    bool rememberForSession = false;            // Use for the rest of the work session
};

/**
 * Asks a person what to do about an existing destination file.
 */
class InteractiveConflictResolver
{
public:
    virtual ~InteractiveConflictResolver() = default;

    virtual ConflictPromptResult prompt(const std::filesystem::path &desiredPath,
                                        const FileConflictInfo &info) = 0;
};

/**
 * Decides whether and where to write when the destination already exists.
 *
 * Ask consults, in order: a choice remembered for the current work session,
 * an "apply to all" choice made earlier in the current batch, then the
 * interactive resolver. Without an interactive resolver Ask behaves like
 * Rename so nothing is overwritten silently. Remembered choices live in
 * memory only.
 */
class ConflictResolver
{
public:
    explicit ConflictResolver(InteractiveConflictResolver *interactive = nullptr,
                              std::string sessionName = {});

    FileConflictDecision resolve(const std::filesystem::path &desiredPath,
                                 ConflictMode mode,
                                 const FileConflictInfo &info);

    /**
     * Collect local file facts next to the remote metadata.
     *
     * @param compareChecksums Hash the local file in the remote checksum's algorithm
     */
    static FileConflictInfo describe(const std::filesystem::path &localPath,
                                     const ObjectMetadata &remote,
                                     bool compareChecksums);

    /**
     * First "<stem> (n)<ext>" next to desiredPath that does not exist.
     * An existing " (n)" suffix on the stem is replaced, not nested.
     */
    static std::filesystem::path makeUniquePath(const std::filesystem::path &desiredPath);

    void setSessionName(std::string sessionName) { sessionName_ = std::move(sessionName); }
    bool hasInteractiveResolver() const { return interactive_ != nullptr; }

    /**
     * "Apply to all" answers only last between beginBatch() and endBatch().
     */
    void beginBatch();
    void endBatch();

private:
    FileConflictDecision applyMode(const std::filesystem::path &desiredPath, ConflictMode mode) const;

    InteractiveConflictResolver *interactive_;
    std::string sessionName_;
    std::map<std::string, ConflictMode> rememberedChoices_;
    bool inBatch_ = false;
    std::optional<ConflictMode> batchChoice_;
};
