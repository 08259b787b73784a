#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <curl/curl.h>

#include "remote_object.hpp"

struct HttpReaderConfig
{
    std::string endpoint;                   // Base URL, e.g. https://account.blob.core.windows.net
    std::string container;
    std::optional<std::string> accessToken; // Bearer token
    std::optional<std::string> sasToken;    // Query string without the leading '?'
    int timeoutSeconds = 300;
    long connectTimeoutSeconds = 30;
};

/**
 * RemoteObjectReader for blob stores reachable over HTTP(S) using libcurl.
 * Objects live at <endpoint>/<container>/<object name>.
 *
 * Failures are thrown as TransientTransferError or PermanentTransferError
 * depending on the CURL error and HTTP status.
 */
class HttpObjectReader : public RemoteObjectReader
{
public:
    /**
     * @throws std::invalid_argument if endpoint or container is empty
     */
    explicit HttpObjectReader(HttpReaderConfig config);

    HttpObjectReader(const HttpObjectReader &) = delete;
    HttpObjectReader &operator=(const HttpObjectReader &) = delete;

    const std::string &containerName() const override { return config_.container; }

    /**
     * HEAD request: Content-Length, Content-MD5 and Last-Modified.
     */
    ObjectMetadata metadata(const std::string &objectName) override;

    std::unique_ptr<ByteStream> openRead(const std::string &objectName) override;

    std::unique_ptr<ByteStream> openReadRange(const std::string &objectName,
                                              std::uint64_t offset,
                                              std::uint64_t length) override;

    /**
     * Full URL of an object, with each path segment percent-encoded.
     */
    std::string objectUrl(const std::string &objectName) const;

    /**
     * Headers sent with every request. The service version is always present;
     * bearer-token authorization is rejected without it.
     */
    std::vector<std::string> requestHeaders() const;

    static constexpr const char *SERVICE_VERSION = "2021-08-06";

    /**
     * Error classification for retry logic.
     * Transient errors are temporary (network issues) and worth retrying.
     * Permanent errors are unrecoverable (404, invalid URL) and should fail immediately.
     */
    enum class ErrorType
    {
        Transient,
        Permanent,
        Unknown // Uncertain - treated as transient
    };

    static ErrorType classifyError(CURLcode code, long httpCode);

    /**
     * Throw the TransferError subclass matching the classification.
     */
    [[noreturn]] static void throwTransferError(CURLcode code, long httpCode, const std::string &context);

private:
    using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
    using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

    CurlHandle makeHandle(const std::string &objectName, HeaderList &headers) const;
    std::unique_ptr<ByteStream> openStream(const std::string &objectName,
                                           std::uint64_t offset,
                                           std::optional<std::uint64_t> length);

    HttpReaderConfig config_;
};
