#include "chunk_sink.hpp"
#include "errors.hpp"

#include <system_error>

#include <fmt/core.h>

FileSink::FileSink(const std::filesystem::path &path, std::uint64_t startOffset) : path_(path)
{
    if (startOffset == 0)
    {
        file_.open(path_, std::ios::binary | std::ios::out | std::ios::trunc);
        if (!file_)
        {
            throw TransientTransferError(
                fmt::format("Cannot open file for writing: {}", path_.string()));
        }
        return;
    }

    std::error_code ec;
    auto existingSize = std::filesystem::file_size(path_, ec);
    if (ec)
    {
        throw TransientTransferError(
            fmt::format("Cannot resume {}: {}", path_.string(), ec.message()));
    }
    if (existingSize < startOffset)
    {
        throw TransientTransferError(
            fmt::format("Partial file {} has {} bytes, expected at least {}",
                        path_.string(), existingSize, startOffset));
    }
    if (existingSize > startOffset)
    {
        // Anything past the resume point is unverified and gets rewritten
        std::filesystem::resize_file(path_, startOffset, ec);
        if (ec)
        {
            throw TransientTransferError(
                fmt::format("Cannot truncate {}: {}", path_.string(), ec.message()));
        }
    }

    file_.open(path_, std::ios::binary | std::ios::in | std::ios::out);
    if (!file_)
    {
        throw TransientTransferError(
            fmt::format("Cannot open file for resuming: {}", path_.string()));
    }
    file_.seekp(static_cast<std::streamoff>(startOffset));
    if (!file_)
    {
        throw TransientTransferError(
            fmt::format("Cannot seek to byte {} in {}", startOffset, path_.string()));
    }
}

void FileSink::write(const char *data, std::size_t size)
{
    file_.write(data, static_cast<std::streamsize>(size));
    if (!file_.good())
    {
        throw TransientTransferError(
            fmt::format("Failed to write {} bytes to {}", size, path_.string()));
    }
}

void FileSink::close()
{
    if (!file_.is_open())
    {
        return;
    }
    file_.flush();
    bool flushed = file_.good();
    file_.close();
    if (!flushed || file_.fail())
    {
        throw TransientTransferError(fmt::format("Failed to flush {}", path_.string()));
    }
}
