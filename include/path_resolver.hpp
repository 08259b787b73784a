#pragma once

#include <filesystem>
#include <string>

/**
 * Local working context downloads are rooted under.
 */
struct WorkSession
{
    std::string name;
    std::string storageAccount;
    std::filesystem::path rootDirectory;
};

class PathResolver
{
public:
    virtual ~PathResolver() = default;

    virtual std::filesystem::path resolve(const WorkSession &session,
                                          const std::string &containerName,
                                          const std::string &objectName) const = 0;

    /**
     * Create the parent directory of filePath if needed.
     * @return false if the directory could not be created
     */
    virtual bool ensureDirectory(const std::filesystem::path &filePath) const = 0;
};

/**
 * Lays files out as <root>/<session>/<container>/<object path>.
 * Empty session or container names are left out; object names containing
 * '/' become nested directories.
 */
class SessionPathResolver : public PathResolver
{
public:
    /**
     * @throws std::invalid_argument if the object name escapes the root ("..")
     */
    std::filesystem::path resolve(const WorkSession &session,
                                  const std::string &containerName,
                                  const std::string &objectName) const override;

    bool ensureDirectory(const std::filesystem::path &filePath) const override;

    /**
     * Replace characters that are invalid in file names with '_'.
     */
    static std::string sanitizeComponent(const std::string &component);
};
