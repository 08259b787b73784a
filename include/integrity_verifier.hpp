#pragma once

#include <filesystem>
#include <optional>
#include <string>

enum class IntegrityStatus
{
    Verified,
    NoChecksum, // Nothing published to compare against; treated as a pass
    Mismatch
};

class IntegrityVerifier
{
public:
    /**
     * Compare the local file against the published checksum.
     *
     * @throws std::runtime_error if the checksum is malformed or the file cannot be hashed
     */
    static IntegrityStatus verify(const std::filesystem::path &localFile,
                                  const std::optional<std::string> &expectedChecksum);
};
