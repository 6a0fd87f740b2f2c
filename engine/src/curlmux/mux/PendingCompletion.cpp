#include <curlmux/mux/PendingCompletion.hpp>

#include <curlmux/core/Logger.hpp>
#include <curlmux/mux/Errors.hpp>

namespace curlmux::mux
{

bool PendingCompletion::resolve(TransferResult result)
{
    if (result_.has_value())
    {
        SLOG_WARN("PendingCompletion", "ResolveIgnored", "status={} incoming={}",
                  toString(result_->status), toString(result.status));
        return false;
    }

    result_ = std::move(result);

    std::vector<Continuation> waiters;
    waiters.swap(waiters_);
    for (auto &cont : waiters)
    {
        scheduler_.post(std::move(cont));
    }
    return true;
}

void PendingCompletion::onSettled(Continuation cont)
{
    if (!cont)
    {
        return;
    }
    if (result_.has_value())
    {
        scheduler_.post(std::move(cont));
        return;
    }
    waiters_.push_back(std::move(cont));
}

const TransferResult &PendingCompletion::result() const
{
    if (!result_.has_value())
    {
        throw StateError("transfer has not settled yet");
    }
    return *result_;
}

const PendingCompletion &TransferFuture::stateOrThrow_() const
{
    if (!state_)
    {
        throw StateError("TransferFuture has no shared state");
    }
    return *state_;
}

const TransferResult &TransferFuture::result() const
{
    return stateOrThrow_().result();
}

TransferHandle *TransferFuture::get() const
{
    const TransferResult &r = result();
    switch (r.status)
    {
    case TransferResult::Status::Completed:
        return r.handle;
    case TransferResult::Status::Stopped:
        return nullptr;
    case TransferResult::Status::Failed:
        throw TransferError(r.code, r.message);
    case TransferResult::Status::Cancelled:
        throw TransferCancelled{};
    }
    return nullptr;
}

void TransferFuture::then(std::function<void(const TransferFuture &)> cont) const
{
    if (!cont)
    {
        return;
    }
    (void)stateOrThrow_();

    // continuation 이 future 를 복사해 들고 있으므로 공유 상태는 실행 시점까지 살아 있다
    TransferFuture self = *this;
    state_->onSettled([self, cont = std::move(cont)]() { cont(self); });
}

} // namespace curlmux::mux
