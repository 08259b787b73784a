#pragma once

#include <stdexcept>
#include <string>

/**
 * Base class for failures raised inside a single transfer attempt.
 * Reader implementations and sinks throw these; the engine converts them
 * into attempt outcomes and never lets them escape a download call.
 */
class TransferError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * Network or local I/O failure that may succeed on another attempt
 * (timeouts, dropped connections, 5xx responses, short writes).
 */
class TransientTransferError : public TransferError
{
public:
    using TransferError::TransferError;
};

/**
 * Failure that retrying cannot fix (404, 403, malformed URL, bad TLS setup).
 * Does not consume retry budget.
 */
class PermanentTransferError : public TransferError
{
public:
    using TransferError::TransferError;
};

/**
 * Raised at a cancellation checkpoint once cancellation was requested.
 */
class TransferCancelled : public TransferError
{
public:
    TransferCancelled() : TransferError("Download was cancelled") {}
};
