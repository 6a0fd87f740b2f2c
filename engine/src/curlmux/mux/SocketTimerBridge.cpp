#include <curlmux/mux/SocketTimerBridge.hpp>

#include <curlmux/core/Logger.hpp>
#include <curlmux/mux/Multiplexer.hpp>

#include <cerrno>
#include <string>
#include <system_error>

namespace curlmux::mux
{

namespace
{
[[noreturn]] void throwSchedulerError(const char *what, int socket)
{
    const int err = errno;
    SLOG_ERROR("SocketTimerBridge", "RegisterFailed", "api={} fd={} errno={}", what, socket, err);
    throw std::system_error(err, std::generic_category(),
                            std::string("SocketTimerBridge: ") + what + " failed for fd " +
                                std::to_string(socket));
}
} // namespace

void SocketTimerBridge::onSocketWatch(int socket, engine::WatchMask mask)
{
    SLOG_DEBUG("SocketTimerBridge", "Watch", "fd={} mask={}", socket, engine::toString(mask));

    if (mask == engine::WatchMask::Remove)
    {
        unwatch_(socket);
        return;
    }

    if (engine::wantsRead(mask))
    {
        if (!scheduler_.onReadable(socket,
                                   [this, socket]() { mux_.step(socket, engine::Direction::In); }))
        {
            throwSchedulerError("onReadable", socket);
        }
        watched_.insert(socket);
    }
    else
    {
        (void)scheduler_.removeReadable(socket);
    }

    if (engine::wantsWrite(mask))
    {
        if (!scheduler_.onWritable(socket,
                                   [this, socket]() { mux_.step(socket, engine::Direction::Out); }))
        {
            throwSchedulerError("onWritable", socket);
        }
        watched_.insert(socket);
    }
    else
    {
        (void)scheduler_.removeWritable(socket);
    }

    if (mask == engine::WatchMask::None)
    {
        watched_.erase(socket);
        return;
    }

    if (!scheduler_.onFailure(socket,
                              [this, socket]() { mux_.step(socket, engine::Direction::Err); }))
    {
        throwSchedulerError("onFailure", socket);
    }
}

void SocketTimerBridge::onTimerArm(long timeoutMs)
{
    cancelTimer_();

    if (timeoutMs < 0)
    {
        SLOG_TRACE("SocketTimerBridge", "TimerDisarmed", "timeout_ms={}", timeoutMs);
        return;
    }

    timerId_ = scheduler_.armTimer(net::IReactorScheduler::Duration{timeoutMs}, [this]() {
        // 만료된 타이머는 이미 스케줄러에서 빠졌다. step 안에서 엔진이 새로 걸 수 있다.
        timerId_ = 0;
        mux_.step(engine::kTimeoutSocket, engine::Direction::None);
    });
    SLOG_TRACE("SocketTimerBridge", "TimerArmed", "id={} timeout_ms={}", timerId_, timeoutMs);
}

void SocketTimerBridge::cancelTimer_() noexcept
{
    if (timerId_ == 0)
    {
        return;
    }
    (void)scheduler_.cancelTimer(timerId_);
    SLOG_TRACE("SocketTimerBridge", "TimerCancelled", "id={}", timerId_);
    timerId_ = 0;
}

void SocketTimerBridge::unwatch_(int socket) noexcept
{
    (void)scheduler_.removeReadable(socket);
    (void)scheduler_.removeWritable(socket);
    watched_.erase(socket);
}

void SocketTimerBridge::releaseAll() noexcept
{
    cancelTimer_();

    if (!watched_.empty())
    {
        SLOG_DEBUG("SocketTimerBridge", "ReleaseLeftovers", "fds={}", watched_.size());
    }
    std::unordered_set<int> leftovers;
    leftovers.swap(watched_);
    for (int socket : leftovers)
    {
        unwatch_(socket);
    }
}

} // namespace curlmux::mux
