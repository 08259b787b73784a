#pragma once

#include <cstdio>
#include <istream>

#include "conflict_resolver.hpp"

/**
 * Terminal prompt for file conflicts.
 * Answers: o = overwrite, s = skip, r = rename. An uppercase letter applies
 * the answer to the rest of the batch; a trailing '!' remembers it for the
 * work session. End of input counts as skip.
 */
class ConsoleConflictPrompt : public InteractiveConflictResolver
{
public:
    explicit ConsoleConflictPrompt(std::istream &input, std::FILE *output = stdout);

    ConflictPromptResult prompt(const std::filesystem::path &desiredPath,
                                const FileConflictInfo &info) override;

    /**
     * Parse one answer line.
     * @return std::nullopt if the line is not a valid answer
     */
    static std::optional<ConflictPromptResult> parseAnswer(const std::string &line);

private:
    std::istream &input_;
    std::FILE *output_;
};
