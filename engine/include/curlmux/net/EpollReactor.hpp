#pragma once

#include <cstdint>
#include <initializer_list>
#include <span>
#include <vector>

#include <sys/epoll.h>

#include <curlmux/util/NonCopyable.hpp>

namespace curlmux::net
{

/// epoll 인스턴스 하나를 감싸는 얇은 래퍼입니다.
///
/// - fd 별 콜백/방향 관리는 EventLoop 가 하고, 여기서는 epoll_ctl/epoll_wait 만 다룹니다.
/// - level-triggered 로만 사용합니다. libcurl 의 socket_action 은 한 번 호출에 소켓을
///   끝까지 비우지 않을 수 있으므로 edge-triggered 는 이벤트 유실로 이어집니다.
class EpollReactor : private curlmux::util::NonCopyable
{
  public:
    using Fd = int;

    enum class Event : std::uint32_t
    {
        None = 0,
        Read = EPOLLIN,
        Write = EPOLLOUT,
        ReadHangup = EPOLLRDHUP,
        Error = EPOLLERR,
        Hangup = EPOLLHUP,
    };

    struct ReadyEvent
    {
        Fd fd{-1};
        std::uint32_t events{0}; ///< EPOLLIN | EPOLLOUT | EPOLLERR ... 의 비트 OR
    };

    /// @param maxEvents wait() 한 번에 꺼낼 최대 이벤트 수. 0 이하면 64.
    explicit EpollReactor(int maxEvents = 64);

    ~EpollReactor() noexcept;

    EpollReactor(EpollReactor &&) = delete;
    EpollReactor &operator=(EpollReactor &&) = delete;

    static constexpr std::uint32_t makeEventMask(std::initializer_list<Event> events) noexcept
    {
        std::uint32_t mask = 0;
        for (auto e : events)
        {
            mask |= static_cast<std::uint32_t>(e);
        }
        return mask;
    }

    /// EPOLL_CTL_ADD. 실패 시 false (errno 보존)
    bool registerFd(Fd fd, std::uint32_t events) noexcept;

    /// EPOLL_CTL_MOD. 실패 시 false (errno 보존)
    bool modifyFd(Fd fd, std::uint32_t events) noexcept;

    /// EPOLL_CTL_DEL. 이미 닫힌 fd(ENOENT/EBADF)는 WARN 만 남기고 false.
    bool unregisterFd(Fd fd) noexcept;

    /// epoll_wait thin wrapper.
    ///
    /// @return 준비된 이벤트 수(0 이면 타임아웃), 오류면 -1 (EINTR 포함, errno 확인)
    int wait(std::span<ReadyEvent> out, int timeoutMs) noexcept;

  private:
    Fd epollFd_{-1};
    std::vector<::epoll_event> eventBuffer_;
};

} // namespace curlmux::net
