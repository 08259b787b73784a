#include "cancellation.hpp"
#include "errors.hpp"

CancellationToken::CancellationToken(std::shared_ptr<const std::atomic<bool>> flag)
    : flag_(std::move(flag))
{
}

bool CancellationToken::isCancelled() const
{
    return flag_ && flag_->load();
}

void CancellationToken::throwIfCancelled() const
{
    if (isCancelled())
    {
        throw TransferCancelled();
    }
}

CancellationSource::CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false))
{
}

CancellationToken CancellationSource::token() const
{
    return CancellationToken(flag_);
}
