#include "conflict_resolver.hpp"
#include "console_conflict_prompt.hpp"
#include "test_support.hpp"

#include <sstream>

namespace
{
    class ScriptedPrompt : public InteractiveConflictResolver
    {
    public:
        ConflictPromptResult prompt(const std::filesystem::path &, const FileConflictInfo &) override
        {
            ++calls;
            return answer;
        }

        ConflictPromptResult answer;
        int calls = 0;
    };

    FileConflictInfo existing()
    {
        FileConflictInfo info;
        info.localExists = true;
        info.localSize = 3;
        info.remoteSize = 10;
        return info;
    }
}

int main()
{
    TestReport report("conflict resolver");
    TempDir dir("conflicts");

    auto target = dir / "a.txt";
    FileConflictInfo absent;

    {
        ConflictResolver resolver;
        auto decision = resolver.resolve(target, ConflictMode::Skip, absent);
        report.check(!decision.skip && decision.resolvedPath == target, "no local file writes to desired path");
    }

    writeFile(target, "old");

    {
        ConflictResolver resolver;
        auto overwrite = resolver.resolve(target, ConflictMode::Overwrite, existing());
        report.check(!overwrite.skip && overwrite.resolvedPath == target, "overwrite keeps the path");

        auto skip = resolver.resolve(target, ConflictMode::Skip, existing());
        report.check(skip.skip && !skip.resolvedPath, "skip yields no path");

        auto rename = resolver.resolve(target, ConflictMode::Rename, existing());
        report.check(rename.resolvedPath == dir / "a (1).txt", "rename appends (1)");

        auto ask = resolver.resolve(target, ConflictMode::Ask, existing());
        report.check(ask.resolvedPath == dir / "a (1).txt" && ask.chosenMode == ConflictMode::Rename,
                     "ask without a prompt renames");
    }

    writeFile(dir / "a (1).txt", "older");
    report.check(ConflictResolver::makeUniquePath(dir / "a (1).txt") == dir / "a (2).txt",
                 "existing suffix is replaced, not nested");
    report.check(ConflictResolver::makeUniquePath(target) == dir / "a (2).txt", "counter skips taken names");
    writeFile(dir / "README", "x");
    report.check(ConflictResolver::makeUniquePath(dir / "README") == dir / "README (1)", "names without extension");

    {
        ScriptedPrompt prompt;
        prompt.answer = {ConflictMode::Overwrite, false, true};
        ConflictResolver resolver(&prompt, "session-a");

        auto first = resolver.resolve(target, ConflictMode::Ask, existing());
        report.check(first.resolvedPath == target && first.rememberForSession && prompt.calls == 1,
                     "prompt answer is applied");

        prompt.answer = {ConflictMode::Skip, false, false};
        auto second = resolver.resolve(target, ConflictMode::Ask, existing());
        report.check(prompt.calls == 1 && second.resolvedPath == target, "remembered choice skips the prompt");

        resolver.setSessionName("session-b");
        auto other = resolver.resolve(target, ConflictMode::Ask, existing());
        report.check(prompt.calls == 2 && other.skip, "choices are remembered per session");
    }

    {
        ScriptedPrompt prompt;
        prompt.answer = {ConflictMode::Skip, true, false};
        ConflictResolver resolver(&prompt);

        resolver.beginBatch();
        resolver.resolve(target, ConflictMode::Ask, existing());
        auto again = resolver.resolve(target, ConflictMode::Ask, existing());
        report.check(prompt.calls == 1 && again.skip, "apply-to-all holds for the batch");
        resolver.endBatch();

        resolver.resolve(target, ConflictMode::Ask, existing());
        report.check(prompt.calls == 2, "apply-to-all ends with the batch");
    }

    {
        ObjectMetadata remote;
        remote.size = 10;
        remote.checksum = md5Checksum("old");
        auto info = ConflictResolver::describe(target, remote, true);
        report.check(info.localExists && info.localSize == std::optional<std::uint64_t>(3), "describe reads local size");
        report.check(info.localChecksum == remote.checksum, "describe hashes in the remote algorithm");
        report.check(!ConflictResolver::describe(dir / "nothing.txt", remote, true).localExists,
                     "describe of missing file");
    }

    {
        auto overwriteAll = ConsoleConflictPrompt::parseAnswer("O");
        report.check(overwriteAll && overwriteAll->decision == ConflictMode::Overwrite && overwriteAll->applyToAll,
                     "uppercase answer applies to all");
        auto remember = ConsoleConflictPrompt::parseAnswer(" r! ");
        report.check(remember && remember->decision == ConflictMode::Rename && remember->rememberForSession &&
                         !remember->applyToAll,
                     "trailing ! remembers");
        report.check(!ConsoleConflictPrompt::parseAnswer("maybe"), "invalid answer");

        std::istringstream input("x\ns\n");
        std::FILE *sink = std::tmpfile();
        ConsoleConflictPrompt console(input, sink ? sink : stdout);
        auto answer = console.prompt(target, existing());
        report.check(answer.decision == ConflictMode::Skip, "console re-asks until valid");

        std::istringstream closed("");
        ConsoleConflictPrompt eof(closed, sink ? sink : stdout);
        report.check(eof.prompt(target, existing()).decision == ConflictMode::Skip, "end of input skips");
        if (sink)
        {
            std::fclose(sink);
        }
    }

    return report.finish();
}
