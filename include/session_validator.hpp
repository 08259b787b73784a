#pragma once

#include <chrono>
#include <optional>

#include "download_types.hpp"

/**
 * Reconciles a session with the partial file on disk before resuming.
 */
class SessionValidator
{
public:
    // Files modified later than lastUpdatedAt + this were touched by something else
    static constexpr std::chrono::minutes MODIFICATION_TOLERANCE{1};

    /**
     * @return The session to resume (possibly repaired to the on-disk size),
     *         or std::nullopt when the transfer must start fresh
     */
    static std::optional<DownloadSession> validate(const DownloadSession &session);
};
