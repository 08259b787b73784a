#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * Pull-style byte source for one remote read.
 */
class ByteStream
{
public:
    virtual ~ByteStream() = default;

    /**
     * Read up to size bytes into buffer.
     *
     * @return Number of bytes read, 0 at end of stream
     * @throws TransferError (or a subclass) on network failure
     */
    virtual std::size_t read(char *buffer, std::size_t size) = 0;
};

struct ObjectMetadata
{
    std::uint64_t size = 0;
    std::optional<std::string> checksum; // "algorithm:hex", e.g. "md5:..."
    std::optional<std::chrono::system_clock::time_point> lastModified;
};

/**
 * Reads objects from one container of the remote store.
 * Constructed once per account and container and passed to the engine.
 */
class RemoteObjectReader
{
public:
    virtual ~RemoteObjectReader() = default;

    virtual const std::string &containerName() const = 0;

    /**
     * @throws TransferError if the object cannot be described
     */
    virtual ObjectMetadata metadata(const std::string &objectName) = 0;

    virtual std::unique_ptr<ByteStream> openRead(const std::string &objectName) = 0;

    /**
     * Open bytes [offset, offset + length) of the object.
     */
    virtual std::unique_ptr<ByteStream> openReadRange(const std::string &objectName,
                                                      std::uint64_t offset,
                                                      std::uint64_t length) = 0;
};

/**
 * Enumerates object names of a container.
 */
class ObjectLister
{
public:
    virtual ~ObjectLister() = default;

    /**
     * @param pattern Glob with '*' and '?', matched case-insensitively against full names
     * @param prefix Optional name prefix narrowing the listing
     * @throws std::runtime_error if listing fails
     */
    virtual std::vector<std::string> list(const std::string &pattern,
                                          const std::optional<std::string> &prefix) = 0;
};
