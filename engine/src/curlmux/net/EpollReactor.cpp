#include <curlmux/net/EpollReactor.hpp>

#include <curlmux/core/Logger.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <unistd.h>

namespace curlmux::net
{

namespace
{
bool ctl(int epollFd, int op, int fd, std::uint32_t events) noexcept
{
    ::epoll_event ev{};
    ev.events = events;
    ev.data.fd = fd;
    return ::epoll_ctl(epollFd, op, fd, op == EPOLL_CTL_DEL ? nullptr : &ev) == 0;
}
} // namespace

EpollReactor::EpollReactor(int maxEvents)
{
    if (maxEvents <= 0)
    {
        maxEvents = 64;
    }

    epollFd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epollFd_ < 0)
    {
        throw std::system_error(errno, std::generic_category(),
                                "EpollReactor: epoll_create1 failed");
    }

    eventBuffer_.resize(static_cast<std::size_t>(maxEvents));

    SLOG_DEBUG("EpollReactor", "Created", "fd={} max_events={}", epollFd_, maxEvents);
}

EpollReactor::~EpollReactor() noexcept
{
    if (epollFd_ >= 0)
    {
        ::close(epollFd_);
        SLOG_DEBUG("EpollReactor", "Closed", "fd={}", epollFd_);
        epollFd_ = -1;
    }
}

bool EpollReactor::registerFd(Fd fd, std::uint32_t events) noexcept
{
    if (fd < 0)
    {
        errno = EBADF;
        SLOG_ERROR("EpollReactor", "RegisterFdFailed", "reason=InvalidFd fd={}", fd);
        return false;
    }

    if (!ctl(epollFd_, EPOLL_CTL_ADD, fd, events))
    {
        const int err = errno;
        SLOG_ERROR("EpollReactor", "CtlAddFailed", "fd={} errno={} msg='{}'", fd, err,
                   std::strerror(err));
        errno = err;
        return false;
    }

    SLOG_TRACE("EpollReactor", "Registered", "fd={} events=0x{:x}", fd, events);
    return true;
}

bool EpollReactor::modifyFd(Fd fd, std::uint32_t events) noexcept
{
    if (fd < 0)
    {
        errno = EBADF;
        SLOG_ERROR("EpollReactor", "ModifyFdFailed", "reason=InvalidFd fd={}", fd);
        return false;
    }

    if (!ctl(epollFd_, EPOLL_CTL_MOD, fd, events))
    {
        // ENOENT 는 호출자(EventLoop)가 ADD 로 재시도하므로 여기서는 DEBUG 로만 남긴다
        const int err = errno;
        SLOG_DEBUG("EpollReactor", "CtlModFailed", "fd={} errno={} msg='{}'", fd, err,
                   std::strerror(err));
        errno = err;
        return false;
    }

    SLOG_TRACE("EpollReactor", "Modified", "fd={} events=0x{:x}", fd, events);
    return true;
}

bool EpollReactor::unregisterFd(Fd fd) noexcept
{
    if (fd < 0)
    {
        errno = EBADF;
        SLOG_ERROR("EpollReactor", "UnregisterFdFailed", "reason=InvalidFd fd={}", fd);
        return false;
    }

    if (!ctl(epollFd_, EPOLL_CTL_DEL, fd, 0))
    {
        const int err = errno;
        if (err == ENOENT || err == EBADF)
        {
            // libcurl 이 소켓을 먼저 닫은 경우: epoll 이 이미 자동 제거했다
            SLOG_WARN("EpollReactor", "CtlDelFailed", "fd={} errno={} msg='{}'", fd, err,
                      std::strerror(err));
        }
        else
        {
            SLOG_ERROR("EpollReactor", "CtlDelFailed", "fd={} errno={} msg='{}'", fd, err,
                       std::strerror(err));
        }
        errno = err;
        return false;
    }

    SLOG_TRACE("EpollReactor", "Unregistered", "fd={}", fd);
    return true;
}

int EpollReactor::wait(std::span<ReadyEvent> out, int timeoutMs) noexcept
{
    if (out.empty())
    {
        return 0;
    }

    const int maxPollEvents =
        static_cast<int>(std::min(out.size(), eventBuffer_.size()));

    const int n = ::epoll_wait(epollFd_, eventBuffer_.data(), maxPollEvents, timeoutMs);
    if (n < 0)
    {
        const int err = errno;
        if (err == EINTR)
        {
            SLOG_DEBUG("EpollReactor", "WaitInterrupted", "reason=EINTR");
        }
        else
        {
            SLOG_ERROR("EpollReactor", "WaitFailed", "errno={} msg='{}'", err,
                       std::strerror(err));
        }
        errno = err;
        return -1;
    }

    for (int i = 0; i < n; ++i)
    {
        out[static_cast<std::size_t>(i)].fd = eventBuffer_[static_cast<std::size_t>(i)].data.fd;
        out[static_cast<std::size_t>(i)].events = eventBuffer_[static_cast<std::size_t>(i)].events;
    }

    return n;
}

} // namespace curlmux::net
