#include "checksum.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <fmt/core.h>

#include <openssl/evp.h>

namespace
{
    const EVP_MD *digestFor(ChecksumVerifier::Algorithm algorithm)
    {
        switch (algorithm)
        {
        case ChecksumVerifier::Algorithm::SHA256:
            return EVP_sha256();
        case ChecksumVerifier::Algorithm::MD5:
            return EVP_md5();
        case ChecksumVerifier::Algorithm::SHA1:
            return EVP_sha1();
        }
        return nullptr;
    }

    size_t hexLength(ChecksumVerifier::Algorithm algorithm)
    {
        switch (algorithm)
        {
        case ChecksumVerifier::Algorithm::SHA256:
            return 64; // 256 bits / 4 bits per hex digit
        case ChecksumVerifier::Algorithm::MD5:
            return 32;
        case ChecksumVerifier::Algorithm::SHA1:
            return 40;
        }
        return 0;
    }
}

std::string ChecksumVerifier::computeDigest(const std::filesystem::path &filePath, Algorithm algorithm)
{
    std::ifstream file(filePath, std::ios::binary);
    if (!file)
    {
        throw std::runtime_error(
            fmt::format("Cannot open file for checksum: {}", filePath.string()));
    }

    auto contextDeleter = [](EVP_MD_CTX *ctx)
    {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    };
    std::unique_ptr<EVP_MD_CTX, decltype(contextDeleter)> context(EVP_MD_CTX_new(), contextDeleter);
    if (!context)
    {
        throw std::runtime_error("Failed to create OpenSSL context");
    }

    const std::string name = algorithmName(algorithm);
    if (EVP_DigestInit_ex(context.get(), digestFor(algorithm), nullptr) != 1)
    {
        throw std::runtime_error(fmt::format("Failed to initialize {} digest", name));
    }

    std::vector<char> buffer(CHUNK_SIZE);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0)
    {
        size_t bytesRead = static_cast<size_t>(file.gcount());
        if (EVP_DigestUpdate(context.get(), buffer.data(), bytesRead) != 1)
        {
            throw std::runtime_error(fmt::format("Failed to update {} digest", name));
        }
    }
    if (file.bad())
    {
        throw std::runtime_error(fmt::format("Read error while hashing {}", filePath.string()));
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLength = 0;
    if (EVP_DigestFinal_ex(context.get(), hash, &hashLength) != 1)
    {
        throw std::runtime_error(fmt::format("Failed to finalize {} digest", name));
    }

    return toHex(std::vector<unsigned char>(hash, hash + hashLength));
}

std::string ChecksumVerifier::computeLike(const std::filesystem::path &filePath, const std::string &likeChecksum)
{
    auto algorithm = parseChecksum(likeChecksum).first;
    return algorithmName(algorithm) + ":" + computeDigest(filePath, algorithm);
}

bool ChecksumVerifier::verify(const std::filesystem::path &filePath,
                               const std::string &expectedChecksum)
{
    auto [algorithm, expectedHash] = parseChecksum(expectedChecksum);
    return computeDigest(filePath, algorithm) == expectedHash;
}

std::pair<ChecksumVerifier::Algorithm, std::string>
ChecksumVerifier::parseChecksum(const std::string &checksumString)
{
    size_t colonPos = checksumString.find(':');
    if (colonPos == std::string::npos)
    {
        throw std::runtime_error(
            "Invalid checksum format. Expected 'algorithm:hexhash'");
    }

    std::string algorithmStr = checksumString.substr(0, colonPos);
    std::transform(algorithmStr.begin(), algorithmStr.end(), algorithmStr.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    Algorithm algorithm;
    if (algorithmStr == "sha256")
    {
        algorithm = Algorithm::SHA256;
    }
    else if (algorithmStr == "md5")
    {
        algorithm = Algorithm::MD5;
    }
    else if (algorithmStr == "sha1")
    {
        algorithm = Algorithm::SHA1;
    }
    else
    {
        throw std::runtime_error(
            fmt::format("Unsupported algorithm: '{}'", algorithmStr));
    }

    std::string normalizedHex = normalizeHex(checksumString.substr(colonPos + 1));
    size_t expectedLength = hexLength(algorithm);
    if (normalizedHex.length() != expectedLength)
    {
        throw std::runtime_error(
            fmt::format("Invalid {} hash length. Expected {} hex characters, got {}",
                        algorithmStr, expectedLength, normalizedHex.length()));
    }

    return {algorithm, normalizedHex};
}

std::string ChecksumVerifier::fromContentMd5(const std::string &base64Digest)
{
    // 16 digest bytes encode to 24 base64 characters ("==" padded)
    if (base64Digest.size() != 24)
    {
        throw std::runtime_error(
            fmt::format("Invalid Content-MD5 value '{}'", base64Digest));
    }

    std::vector<unsigned char> encoded(base64Digest.begin(), base64Digest.end());
    unsigned char decoded[18];
    int decodedLength = EVP_DecodeBlock(decoded, encoded.data(), static_cast<int>(encoded.size()));
    if (decodedLength < 16)
    {
        throw std::runtime_error(
            fmt::format("Invalid Content-MD5 value '{}'", base64Digest));
    }

    // EVP_DecodeBlock counts padding as zero bytes; the digest is the first 16
    return "md5:" + toHex(std::vector<unsigned char>(decoded, decoded + 16));
}

std::string ChecksumVerifier::algorithmName(Algorithm algorithm)
{
    switch (algorithm)
    {
    case Algorithm::SHA256:
        return "sha256";
    case Algorithm::MD5:
        return "md5";
    case Algorithm::SHA1:
        return "sha1";
    }
    return "unknown";
}

std::string ChecksumVerifier::toHex(const std::vector<unsigned char> &data)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (unsigned char byte : data)
    {
        oss << std::setw(2) << static_cast<unsigned int>(byte);
    }

    return oss.str();
}

std::string ChecksumVerifier::normalizeHex(const std::string &hex)
{
    std::string result;
    result.reserve(hex.length());

    for (char ch : hex)
    {
        auto byte = static_cast<unsigned char>(ch);
        if (std::isspace(byte) || ch == ':' || ch == '-')
        {
            continue;
        }

        if (std::isxdigit(byte))
        {
            result += static_cast<char>(std::tolower(byte));
        }
        else
        {
            throw std::runtime_error(
                fmt::format("Invalid character in checksum: '{}'", ch));
        }
    }

    return result;
}
