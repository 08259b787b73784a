#include "http_object_reader.hpp"
#include "checksum.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <ctime>
#include <map>
#include <mutex>
#include <stdexcept>

#include <fmt/core.h>

namespace
{
    constexpr const char *USER_AGENT = "blobfetch/1.0";
    constexpr long POLL_TIMEOUT_MS = 1000;

    std::once_flag curlInitFlag;

    void ensureCurlInitialized()
    {
        std::call_once(curlInitFlag, []()
        {
            if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
            {
                throw std::runtime_error("Failed to initialize libcurl");
            }
        });
    }

    std::string getHttpStatusText(long code)
    {
        switch (code)
        {
        case 400:
            return "Bad Request";
        case 401:
            return "Unauthorized";
        case 403:
            return "Forbidden";
        case 404:
            return "Not Found";
        case 408:
            return "Request Timeout";
        case 409:
            return "Conflict";
        case 416:
            return "Range Not Satisfiable";
        case 429:
            return "Too Many Requests";
        case 500:
            return "Internal Server Error";
        case 502:
            return "Bad Gateway";
        case 503:
            return "Service Unavailable";
        case 504:
            return "Gateway Timeout";
        default:
            return "Unknown Status";
        }
    }

    std::string trimmed(const std::string &text)
    {
        auto begin = text.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos)
        {
            return {};
        }
        auto end = text.find_last_not_of(" \t\r\n");
        return text.substr(begin, end - begin + 1);
    }

    std::string escapeSegment(const std::string &segment)
    {
        std::unique_ptr<char, decltype(&curl_free)> escaped(
            curl_easy_escape(nullptr, segment.c_str(), static_cast<int>(segment.size())), curl_free);
        if (!escaped)
        {
            throw PermanentTransferError(fmt::format("Cannot URL-encode '{}'", segment));
        }
        return escaped.get();
    }

    // Collects response headers of a HEAD request, keys lowercased
    size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userdata)
    {
        auto *headers = static_cast<std::map<std::string, std::string> *>(userdata);
        size_t total = size * nitems;
        std::string line(buffer, total);

        auto colon = line.find(':');
        if (colon != std::string::npos)
        {
            std::string key = trimmed(line.substr(0, colon));
            std::transform(key.begin(), key.end(), key.begin(),
                           [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
            (*headers)[key] = trimmed(line.substr(colon + 1));
        }
        else if (line.rfind("HTTP/", 0) == 0)
        {
            // Status line of a redirected response starts a new header block
            headers->clear();
        }
        return total;
    }

    /**
     * Pull-style body of one GET request, driven through a curl multi handle
     * so the caller decides when more data is fetched.
     */
    class CurlByteStream : public ByteStream
    {
    public:
        using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
        using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

        CurlByteStream(CurlHandle easy, HeaderList headers, std::string objectName, std::uint64_t rangeOffset)
            : easy_(std::move(easy)),
              headers_(std::move(headers)),
              multi_(curl_multi_init(), curl_multi_cleanup),
              objectName_(std::move(objectName)),
              rangeOffset_(rangeOffset)
        {
            if (!multi_)
            {
                throw TransientTransferError("Failed to create CURL multi handle");
            }

            curl_easy_setopt(easy_.get(), CURLOPT_WRITEFUNCTION, &CurlByteStream::writeCallback);
            curl_easy_setopt(easy_.get(), CURLOPT_WRITEDATA, this);

            CURLMcode rc = curl_multi_add_handle(multi_.get(), easy_.get());
            if (rc != CURLM_OK)
            {
                throw TransientTransferError(
                    fmt::format("Cannot start download of {}: {}", objectName_, curl_multi_strerror(rc)));
            }
            attached_ = true;
        }

        ~CurlByteStream() override
        {
            if (attached_)
            {
                curl_multi_remove_handle(multi_.get(), easy_.get());
            }
        }

        CurlByteStream(const CurlByteStream &) = delete;
        CurlByteStream &operator=(const CurlByteStream &) = delete;

        std::size_t read(char *buffer, std::size_t size) override
        {
            while (consumed_ == pending_.size() && !finished_)
            {
                pump();
            }

            std::size_t count = std::min(size, pending_.size() - consumed_);
            std::memcpy(buffer, pending_.data() + consumed_, count);
            consumed_ += count;
            if (consumed_ == pending_.size())
            {
                pending_.clear();
                consumed_ = 0;
            }
            return count;
        }

    private:
        void pump()
        {
            int running = 0;
            CURLMcode rc = curl_multi_perform(multi_.get(), &running);
            if (rc != CURLM_OK)
            {
                throw TransientTransferError(
                    fmt::format("Download of {} failed: {}", objectName_, curl_multi_strerror(rc)));
            }
            if (running == 0)
            {
                completeTransfer();
                return;
            }

            rc = curl_multi_poll(multi_.get(), nullptr, 0, POLL_TIMEOUT_MS, nullptr);
            if (rc != CURLM_OK)
            {
                throw TransientTransferError(
                    fmt::format("Download of {} failed: {}", objectName_, curl_multi_strerror(rc)));
            }
        }

        void completeTransfer()
        {
            finished_ = true;

            CURLcode result = CURLE_OK;
            int queued = 0;
            while (CURLMsg *message = curl_multi_info_read(multi_.get(), &queued))
            {
                if (message->msg == CURLMSG_DONE)
                {
                    result = message->data.result;
                }
            }

            long httpCode = 0;
            curl_easy_getinfo(easy_.get(), CURLINFO_RESPONSE_CODE, &httpCode);
            if (result != CURLE_OK)
            {
                HttpObjectReader::throwTransferError(result, httpCode,
                                                     fmt::format("Download of {} failed", objectName_));
            }
            if (skipRemaining_ > 0)
            {
                throw TransientTransferError(
                    fmt::format("Response for {} ended before byte {}", objectName_, rangeOffset_));
            }
        }

        static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
        {
            auto *stream = static_cast<CurlByteStream *>(userdata);
            size_t total = size * nmemb;

            if (!stream->statusChecked_)
            {
                stream->statusChecked_ = true;
                long httpCode = 0;
                curl_easy_getinfo(stream->easy_.get(), CURLINFO_RESPONSE_CODE, &httpCode);
                if (stream->rangeOffset_ > 0 && httpCode == 200)
                {
                    // Server ignored the Range header and sends the whole object
                    engineLogger()->warn("Server does not support ranges for {}, skipping first {} bytes",
                                         stream->objectName_, stream->rangeOffset_);
                    stream->skipRemaining_ = stream->rangeOffset_;
                }
            }

            auto skip = static_cast<size_t>(std::min<std::uint64_t>(stream->skipRemaining_, total));
            stream->skipRemaining_ -= skip;
            stream->pending_.append(ptr + skip, total - skip);
            return total;
        }

        CurlHandle easy_;
        HeaderList headers_; // Must outlive the transfer
        std::unique_ptr<CURLM, decltype(&curl_multi_cleanup)> multi_;
        std::string objectName_;
        std::uint64_t rangeOffset_;
        std::uint64_t skipRemaining_ = 0;
        bool statusChecked_ = false;
        bool attached_ = false;
        bool finished_ = false;
        std::string pending_;
        std::size_t consumed_ = 0;
    };
}

HttpObjectReader::HttpObjectReader(HttpReaderConfig config) : config_(std::move(config))
{
    if (config_.endpoint.empty())
    {
        throw std::invalid_argument("Endpoint must not be empty");
    }
    if (config_.container.empty())
    {
        throw std::invalid_argument("Container must not be empty");
    }
    if (config_.endpoint.rfind("http://", 0) != 0 && config_.endpoint.rfind("https://", 0) != 0)
    {
        throw std::invalid_argument("Endpoint must start with http:// or https://");
    }
    while (config_.endpoint.size() > 1 && config_.endpoint.back() == '/')
    {
        config_.endpoint.pop_back();
    }
    if (config_.sasToken && !config_.sasToken->empty() && config_.sasToken->front() == '?')
    {
        config_.sasToken->erase(0, 1);
    }
    ensureCurlInitialized();
}

ObjectMetadata HttpObjectReader::metadata(const std::string &objectName)
{
    HeaderList headers(nullptr, curl_slist_free_all);
    auto handle = makeHandle(objectName, headers);
    CURL *curl = handle.get();

    std::map<std::string, std::string> responseHeaders;
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L); // HEAD request
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &responseHeaders);
    curl_easy_setopt(curl, CURLOPT_FILETIME, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(config_.timeoutSeconds));

    CURLcode res = curl_easy_perform(curl);
    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
    if (res != CURLE_OK)
    {
        throwTransferError(res, httpCode, fmt::format("HEAD {}", objectName));
    }

    curl_off_t contentLength = -1;
    curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &contentLength);
    if (contentLength < 0)
    {
        throw PermanentTransferError(fmt::format("Server did not report the size of {}", objectName));
    }

    ObjectMetadata metadata;
    metadata.size = static_cast<std::uint64_t>(contentLength);

    for (const char *header : {"content-md5", "x-ms-blob-content-md5"})
    {
        auto found = responseHeaders.find(header);
        if (found == responseHeaders.end() || found->second.empty())
        {
            continue;
        }
        try
        {
            metadata.checksum = ChecksumVerifier::fromContentMd5(found->second);
        }
        catch (const std::runtime_error &e)
        {
            engineLogger()->warn("Ignoring checksum of {}: {}", objectName, e.what());
        }
        break;
    }

    curl_off_t fileTime = -1;
    curl_easy_getinfo(curl, CURLINFO_FILETIME_T, &fileTime);
    if (fileTime >= 0)
    {
        metadata.lastModified = std::chrono::system_clock::from_time_t(static_cast<std::time_t>(fileTime));
    }

    engineLogger()->debug("{}: {} bytes, checksum {}", objectName, metadata.size,
                          metadata.checksum.value_or("none"));
    return metadata;
}

std::unique_ptr<ByteStream> HttpObjectReader::openRead(const std::string &objectName)
{
    return openStream(objectName, 0, std::nullopt);
}

std::unique_ptr<ByteStream> HttpObjectReader::openReadRange(const std::string &objectName,
                                                            std::uint64_t offset,
                                                            std::uint64_t length)
{
    if (length == 0)
    {
        throw std::invalid_argument("Range length must be greater than zero");
    }
    return openStream(objectName, offset, length);
}

std::unique_ptr<ByteStream> HttpObjectReader::openStream(const std::string &objectName,
                                                         std::uint64_t offset,
                                                         std::optional<std::uint64_t> length)
{
    HeaderList headers(nullptr, curl_slist_free_all);
    auto handle = makeHandle(objectName, headers);
    CURL *curl = handle.get();

    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);

    // A stalled connection fails the attempt; a slow but moving one does not
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(config_.timeoutSeconds));

    if (length)
    {
        std::string range = fmt::format("{}-{}", offset, offset + *length - 1);
        curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
    }

    return std::make_unique<CurlByteStream>(std::move(handle), std::move(headers), objectName,
                                            length ? offset : 0);
}

HttpObjectReader::CurlHandle HttpObjectReader::makeHandle(const std::string &objectName, HeaderList &headers) const
{
    CurlHandle handle(curl_easy_init(), curl_easy_cleanup);
    if (!handle)
    {
        throw TransientTransferError("Failed to initialize CURL (out of memory or library error)");
    }
    CURL *curl = handle.get();

    std::string url = objectUrl(objectName);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);

    // HTTPS settings
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, config_.connectTimeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L); // HTTP >= 400 becomes CURLE_HTTP_RETURNED_ERROR
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    for (const auto &header : requestHeaders())
    {
        curl_slist *list = curl_slist_append(headers.get(), header.c_str());
        if (!list)
        {
            throw TransientTransferError("Failed to build request headers");
        }
        headers.release();
        headers.reset(list);
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    return handle;
}

std::string HttpObjectReader::objectUrl(const std::string &objectName) const
{
    std::string url = fmt::format("{}/{}", config_.endpoint, escapeSegment(config_.container));

    std::size_t start = 0;
    while (start <= objectName.size())
    {
        std::size_t slash = objectName.find('/', start);
        if (slash == std::string::npos)
        {
            slash = objectName.size();
        }
        url += "/" + escapeSegment(objectName.substr(start, slash - start));
        start = slash + 1;
    }

    if (config_.sasToken && !config_.sasToken->empty())
    {
        url += "?" + *config_.sasToken;
    }
    return url;
}

std::vector<std::string> HttpObjectReader::requestHeaders() const
{
    std::vector<std::string> headers{fmt::format("x-ms-version: {}", SERVICE_VERSION)};
    if (config_.accessToken)
    {
        headers.push_back(fmt::format("Authorization: Bearer {}", *config_.accessToken));
    }
    return headers;
}

HttpObjectReader::ErrorType HttpObjectReader::classifyError(CURLcode code, long httpCode)
{
    if (httpCode == 408 || httpCode == 429)
    {
        // Request timeout and throttling clear up on their own
        return ErrorType::Transient;
    }
    if (httpCode >= 400 && httpCode < 500)
    {
        return ErrorType::Permanent;
    }
    if (httpCode >= 500 && httpCode < 600)
    {
        return ErrorType::Transient;
    }

    switch (code)
    {
    // Transient network errors - worth retrying
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_PARTIAL_FILE:
    case CURLE_RECV_ERROR:
    case CURLE_SEND_ERROR:
    case CURLE_GOT_NOTHING:
        return ErrorType::Transient;

    // Permanent errors - retrying won't help
    case CURLE_URL_MALFORMAT:
    case CURLE_UNSUPPORTED_PROTOCOL:
    case CURLE_OUT_OF_MEMORY:
    case CURLE_SSL_CERTPROBLEM:
    case CURLE_SSL_CIPHER:
    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_LOGIN_DENIED:
        return ErrorType::Permanent;

    default:
        return ErrorType::Unknown;
    }
}

void HttpObjectReader::throwTransferError(CURLcode code, long httpCode, const std::string &context)
{
    std::string message = httpCode >= 400
                              ? fmt::format("{}: HTTP error {}: {}", context, httpCode, getHttpStatusText(httpCode))
                              : fmt::format("{}: {}", context, curl_easy_strerror(code));

    if (classifyError(code, httpCode) == ErrorType::Permanent)
    {
        throw PermanentTransferError(message);
    }
    throw TransientTransferError(message);
}
