#pragma once

#include <atomic>
#include <memory>

/**
 * Read side of a cooperative cancellation flag.
 * A default-constructed token is never cancelled.
 */
class CancellationToken
{
public:
    CancellationToken() = default;

    bool isCancelled() const;

    /**
     * @throws TransferCancelled if cancellation was requested
     */
    void throwIfCancelled() const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag);

    std::shared_ptr<const std::atomic<bool>> flag_;
};

/**
 * Owner of a cancellation flag. cancel() is a single atomic store and may be
 * called from a signal handler.
 */
class CancellationSource
{
public:
    CancellationSource();

    CancellationToken token() const;
    void cancel() noexcept { flag_->store(true); }
    bool isCancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};
