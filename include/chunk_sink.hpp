#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>

/**
 * Destination for downloaded bytes. RateLimiter and ProgressReporter wrap
 * another sink and forward every chunk to it.
 */
class ChunkSink
{
public:
    virtual ~ChunkSink() = default;

    /**
     * @throws TransferError if the chunk could not be stored
     */
    virtual void write(const char *data, std::size_t size) = 0;
};

/**
 * Writes to the local file of a transfer.
 * startOffset 0 creates or truncates the file; a positive offset keeps the
 * first startOffset bytes and continues writing after them.
 */
class FileSink : public ChunkSink
{
public:
    /**
     * @throws TransientTransferError if the file cannot be opened or is
     *         shorter than startOffset
     */
    FileSink(const std::filesystem::path &path, std::uint64_t startOffset);

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const char *data, std::size_t size) override;

    /**
     * Flush and close. Writing after close() is an error.
     * @throws TransientTransferError if buffered data could not be flushed
     */
    void close();

private:
    std::filesystem::path path_;
    std::fstream file_;
};
