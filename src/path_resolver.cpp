#include "path_resolver.hpp"
#include "logging.hpp"

#include <cctype>
#include <cstring>
#include <stdexcept>
#include <system_error>

#include <fmt/core.h>

std::filesystem::path SessionPathResolver::resolve(const WorkSession &session,
                                                   const std::string &containerName,
                                                   const std::string &objectName) const
{
    std::filesystem::path result = session.rootDirectory;
    if (!session.name.empty())
    {
        result /= sanitizeComponent(session.name);
    }
    if (!containerName.empty())
    {
        result /= sanitizeComponent(containerName);
    }

    bool addedSegment = false;
    std::size_t start = 0;
    while (start <= objectName.size())
    {
        std::size_t slash = objectName.find('/', start);
        if (slash == std::string::npos)
        {
            slash = objectName.size();
        }

        std::string segment = objectName.substr(start, slash - start);
        if (segment == "..")
        {
            throw std::invalid_argument(
                fmt::format("Object name '{}' escapes the download directory", objectName));
        }
        if (!segment.empty() && segment != ".")
        {
            result /= sanitizeComponent(segment);
            addedSegment = true;
        }
        start = slash + 1;
    }

    if (!addedSegment)
    {
        throw std::invalid_argument(fmt::format("Object name '{}' has no file name", objectName));
    }
    return result;
}

bool SessionPathResolver::ensureDirectory(const std::filesystem::path &filePath) const
{
    auto directory = filePath.parent_path();
    if (directory.empty())
    {
        return true;
    }

    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec)
    {
        engineLogger()->error("Failed to create directory {}: {}", directory.string(), ec.message());
        return false;
    }
    return true;
}

std::string SessionPathResolver::sanitizeComponent(const std::string &component)
{
    static constexpr const char *INVALID_CHARS = "<>:\"\\|?*";

    std::string result;
    result.reserve(component.size());
    for (char ch : component)
    {
        auto byte = static_cast<unsigned char>(ch);
        if (std::iscntrl(byte) || std::strchr(INVALID_CHARS, ch) != nullptr || ch == '/')
        {
            result += '_';
        }
        else
        {
            result += ch;
        }
    }

    if (result.empty() || result == "." || result == "..")
    {
        result = "_";
    }
    return result;
}
