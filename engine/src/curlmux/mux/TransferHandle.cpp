#include <curlmux/mux/TransferHandle.hpp>

#include <curlmux/core/Logger.hpp>
#include <curlmux/mux/Errors.hpp>
#include <curlmux/mux/Multiplexer.hpp>

#include <string>

namespace curlmux::mux
{

const char *toString(TransferState s) noexcept
{
    switch (s)
    {
    case TransferState::Idle:
        return "idle";
    case TransferState::Submitted:
        return "submitted";
    case TransferState::Completed:
        return "completed";
    case TransferState::Failed:
        return "failed";
    case TransferState::Stopped:
        return "stopped";
    case TransferState::Cancelled:
        return "cancelled";
    case TransferState::Closed:
        return "closed";
    }
    return "unknown";
}

TransferHandle::TransferHandle(Multiplexer &mux) : mux_(mux), transfer_(mux.engine().createTransfer())
{
    SLOG_TRACE("TransferHandle", "Created", "handle={}", static_cast<const void *>(this));
}

TransferHandle::~TransferHandle()
{
    close();
}

TransferState TransferHandle::state() const noexcept
{
    if (closed_)
    {
        return TransferState::Closed;
    }
    if (!pending_)
    {
        return TransferState::Idle;
    }
    if (!pending_->settled())
    {
        return TransferState::Submitted;
    }

    switch (pending_->result().status)
    {
    case TransferResult::Status::Completed:
        return TransferState::Completed;
    case TransferResult::Status::Failed:
        return TransferState::Failed;
    case TransferResult::Status::Stopped:
        return TransferState::Stopped;
    case TransferResult::Status::Cancelled:
        return TransferState::Cancelled;
    }
    return TransferState::Stopped;
}

TransferFuture TransferHandle::perform()
{
    const TransferState s = state();
    if (s != TransferState::Idle)
    {
        throw StateError(std::string("TransferHandle::perform in state ") + toString(s));
    }
    return mux_.perform(*this);
}

void TransferHandle::stop()
{
    if (!inFlight())
    {
        return;
    }
    mux_.stop(*this);
}

void TransferHandle::cancel()
{
    if (!inFlight())
    {
        return;
    }
    mux_.cancel(*this);
}

void TransferHandle::close() noexcept
{
    if (closed_)
    {
        return;
    }

    if (inFlight())
    {
        try
        {
            mux_.stop(*this);
        }
        catch (const std::exception &e)
        {
            // 엔진에서 떼어내지 못했으면 easy handle 을 해제할 수 없다
            SLOG_ERROR("TransferHandle", "CloseStopFailed", "handle={} what='{}'",
                       static_cast<const void *>(this), e.what());
            return;
        }
    }

    transfer_.reset();
    closed_ = true;
    SLOG_TRACE("TransferHandle", "Closed", "handle={}", static_cast<const void *>(this));
}

void TransferHandle::reset()
{
    const TransferState s = state();
    if (s == TransferState::Idle)
    {
        return;
    }
    if (s == TransferState::Submitted || s == TransferState::Closed)
    {
        throw StateError(std::string("TransferHandle::reset in state ") + toString(s));
    }
    pending_.reset();
}

void TransferHandle::requireConfigurable_(const char *api) const
{
    const TransferState s = state();
    if (s == TransferState::Submitted || s == TransferState::Closed)
    {
        throw StateError(std::string("TransferHandle::") + api + " in state " + toString(s));
    }
}

void TransferHandle::setOption(int option, long long value)
{
    requireConfigurable_("setOption");
    transfer_->setOption(option, value);
}

void TransferHandle::setOption(int option, const std::string &value)
{
    requireConfigurable_("setOption");
    transfer_->setOption(option, value);
}

void TransferHandle::addHeader(std::string_view line)
{
    requireConfigurable_("addHeader");
    transfer_->addHeader(line);
}

long TransferHandle::responseCode() const
{
    return transfer().responseCode();
}

const std::string &TransferHandle::responseBody() const
{
    return transfer().responseBody();
}

std::string TransferHandle::effectiveUrl() const
{
    return transfer().effectiveUrl();
}

engine::IEasyTransfer &TransferHandle::transfer()
{
    if (!transfer_)
    {
        throw StateError("TransferHandle is closed");
    }
    return *transfer_;
}

const engine::IEasyTransfer &TransferHandle::transfer() const
{
    if (!transfer_)
    {
        throw StateError("TransferHandle is closed");
    }
    return *transfer_;
}

} // namespace curlmux::mux
