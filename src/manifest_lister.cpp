#include "manifest_lister.hpp"
#include "logging.hpp"

#include <cctype>
#include <fstream>
#include <stdexcept>

#include <fmt/core.h>
#include <fnmatch.h>

ManifestObjectLister::ManifestObjectLister(std::filesystem::path manifestPath)
    : manifestPath_(std::move(manifestPath))
{
}

std::vector<std::string> ManifestObjectLister::list(const std::string &pattern,
                                                    const std::optional<std::string> &prefix)
{
    std::ifstream manifest(manifestPath_);
    if (!manifest)
    {
        throw std::runtime_error(
            fmt::format("Cannot open object manifest: {}", manifestPath_.string()));
    }

    std::vector<std::string> names;
    std::string line;
    while (std::getline(manifest, line))
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (line.empty() || line.front() == '#')
        {
            continue;
        }
        if (prefix && !hasPrefix(line, *prefix))
        {
            continue;
        }
        if (globMatches(pattern, line))
        {
            names.push_back(line);
        }
    }
    if (manifest.bad())
    {
        throw std::runtime_error(
            fmt::format("Error while reading object manifest: {}", manifestPath_.string()));
    }

    engineLogger()->debug("Manifest {} lists {} objects matching '{}'",
                          manifestPath_.string(), names.size(), pattern);
    return names;
}

bool ManifestObjectLister::globMatches(const std::string &pattern, const std::string &name)
{
    // Without FNM_PATHNAME '*' crosses '/' boundaries
    return ::fnmatch(pattern.c_str(), name.c_str(), FNM_CASEFOLD | FNM_NOESCAPE) == 0;
}

bool ManifestObjectLister::hasPrefix(const std::string &name, const std::string &prefix)
{
    if (prefix.size() > name.size())
    {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(name[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i])))
        {
            return false;
        }
    }
    return true;
}
