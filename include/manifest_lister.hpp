#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "remote_object.hpp"

/**
 * ObjectLister over a text file with one object name per line.
 * Blank lines and lines starting with '#' are ignored.
 */
class ManifestObjectLister : public ObjectLister
{
public:
    explicit ManifestObjectLister(std::filesystem::path manifestPath);

    /**
     * @throws std::runtime_error if the manifest cannot be read
     */
    std::vector<std::string> list(const std::string &pattern,
                                  const std::optional<std::string> &prefix) override;

    /**
     * Case-insensitive glob match of the whole name. '*' also matches '/'.
     */
    static bool globMatches(const std::string &pattern, const std::string &name);

    /**
     * Case-insensitive prefix test.
     */
    static bool hasPrefix(const std::string &name, const std::string &prefix);

private:
    std::filesystem::path manifestPath_;
};
