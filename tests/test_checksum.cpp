#include "checksum.hpp"
#include "integrity_verifier.hpp"
#include "test_support.hpp"

#include <stdexcept>

int main()
{
    TestReport report("checksum");
    TempDir dir("checksum");
    auto file = dir / "test.txt";
    writeFile(file, "hello world\n");

    try
    {
        // Well-known digests of "hello world\n"
        const std::string sha256 = "a948904f2f0f479b8f8197694b30184b0d2ed1c1cd2a1ec0fb85d299a192a447";
        const std::string md5 = "6f5902ac237024bdd0c176cb93063dc4";
        const std::string sha1 = "22596363b3de40b06f981fb85d82312e8c0ed511";

        std::string hash = ChecksumVerifier::computeDigest(file, ChecksumVerifier::Algorithm::SHA256);
        fmt::print("Computed SHA-256: {}\n", hash);
        report.check(hash == sha256, "SHA-256 digest of known content");
        report.check(ChecksumVerifier::computeDigest(file, ChecksumVerifier::Algorithm::MD5) == md5,
                     "MD5 digest of known content");
        report.check(ChecksumVerifier::computeDigest(file, ChecksumVerifier::Algorithm::SHA1) == sha1,
                     "SHA-1 digest of known content");

        report.check(ChecksumVerifier::verify(file, "sha256:" + sha256), "verify accepts correct SHA-256");
        report.check(ChecksumVerifier::verify(file, "MD5:6F5902AC237024BDD0C176CB93063DC4"),
                     "verify is case-insensitive");
        report.check(!ChecksumVerifier::verify(file, "md5:00000000000000000000000000000000"),
                     "verify rejects wrong hash");

        auto [algo, hexHash] = ChecksumVerifier::parseChecksum("sha1:22596363-b3de40b0 6f981fb85d82312e8c0ed511");
        report.check(algo == ChecksumVerifier::Algorithm::SHA1 && hexHash == sha1,
                     "parseChecksum strips separators");

        // md5("hello world\n") as a Content-MD5 header value
        report.check(ChecksumVerifier::fromContentMd5("b1kCrCNwJL3QwXbLkwY9xA==") == "md5:" + md5,
                     "Content-MD5 converts to md5 hex");
        report.check(ChecksumVerifier::computeLike(file, "md5:" + md5) == "md5:" + md5,
                     "computeLike reuses the reference algorithm");

        report.check(IntegrityVerifier::verify(file, std::nullopt) == IntegrityStatus::NoChecksum,
                     "missing checksum passes as NoChecksum");
        report.check(IntegrityVerifier::verify(file, "md5:" + md5) == IntegrityStatus::Verified,
                     "matching checksum is Verified");
        report.check(IntegrityVerifier::verify(file, "sha1:0000000000000000000000000000000000000000") ==
                         IntegrityStatus::Mismatch,
                     "wrong checksum is Mismatch");
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }

    auto throws = [](auto &&callable)
    {
        try
        {
            callable();
        }
        catch (const std::runtime_error &)
        {
            return true;
        }
        return false;
    };
    report.check(throws([] { ChecksumVerifier::parseChecksum("abc123"); }), "missing algorithm is rejected");
    report.check(throws([] { ChecksumVerifier::parseChecksum("crc32:abcd1234"); }), "unknown algorithm is rejected");
    report.check(throws([] { ChecksumVerifier::parseChecksum("md5:abcd"); }), "short hash is rejected");
    report.check(throws([] { ChecksumVerifier::parseChecksum("md5:zz5902ac237024bdd0c176cb93063dc4"); }),
                 "non-hex characters are rejected");
    report.check(throws([] { ChecksumVerifier::fromContentMd5("not-base64"); }), "bad Content-MD5 is rejected");
    report.check(throws([&] { ChecksumVerifier::computeDigest(dir / "missing.bin", ChecksumVerifier::Algorithm::MD5); }),
                 "hashing a missing file throws");

    return report.finish();
}
