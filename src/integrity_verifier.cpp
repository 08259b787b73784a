#include "integrity_verifier.hpp"
#include "checksum.hpp"
#include "logging.hpp"

IntegrityStatus IntegrityVerifier::verify(const std::filesystem::path &localFile,
                                          const std::optional<std::string> &expectedChecksum)
{
    if (!expectedChecksum || expectedChecksum->empty())
    {
        return IntegrityStatus::NoChecksum;
    }

    if (ChecksumVerifier::verify(localFile, *expectedChecksum))
    {
        engineLogger()->debug("Checksum of {} matches {}", localFile.string(), *expectedChecksum);
        return IntegrityStatus::Verified;
    }

    engineLogger()->error("Checksum mismatch for {}: expected {}", localFile.string(), *expectedChecksum);
    return IntegrityStatus::Mismatch;
}
