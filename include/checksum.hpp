#pragma once

#include <string>
#include <vector>
#include <filesystem>

/**
 * File digests and published-checksum handling.
 * Checksums are written as "algorithm:hexhash" (md5, sha1, sha256).
 */
class ChecksumVerifier
{
public:
    enum class Algorithm
    {
        SHA256,
        MD5,
        SHA1
    };

    /**
     * Compute the digest of a file, reading it in chunks.
     *
     * @return Lowercase hex digest
     * @throws std::runtime_error if the file cannot be read or hashing fails
     */
    static std::string computeDigest(const std::filesystem::path &filePath, Algorithm algorithm);

    /**
     * Compute a file's checksum in the same algorithm as a reference checksum.
     *
     * @param likeChecksum Checksum whose algorithm is reused, e.g. "md5:..."
     * @return Checksum string in "algorithm:hexhash" form
     */
    static std::string computeLike(const std::filesystem::path &filePath, const std::string &likeChecksum);

    /**
     * Verify a file matches an expected checksum.
     *
     * @param expectedChecksum Expected hash in format "algorithm:hexhash"
     * @return true if checksums match byte-for-byte
     * @throws std::runtime_error if format is invalid or the file cannot be read
     */
    static bool verify(const std::filesystem::path &filePath,
                       const std::string &expectedChecksum);

    /**
     * Parse "algorithm:hexhash" into algorithm and normalized hex.
     *
     * @throws std::runtime_error if format, algorithm or length is invalid
     */
    static std::pair<Algorithm, std::string> parseChecksum(const std::string &checksumStr);

    /**
     * Convert a base64 Content-MD5 header value to "md5:hexhash".
     *
     * @throws std::runtime_error if the value is not a base64 encoded 16 byte digest
     */
    static std::string fromContentMd5(const std::string &base64Digest);

    static std::string algorithmName(Algorithm algorithm);

private:
    static std::string toHex(const std::vector<unsigned char> &data);

    /**
     * Lowercase hex, whitespace and ':'/'-' separators dropped.
     */
    static std::string normalizeHex(const std::string &hex);

    // Chunk size for file reading (1 MB)
    static constexpr size_t CHUNK_SIZE = 1024 * 1024;
};
