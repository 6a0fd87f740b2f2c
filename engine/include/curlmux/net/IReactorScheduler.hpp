#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace curlmux::net
{

/// Multiplexer/SocketTimerBridge 가 의존하는 단일 스레드 협력 스케줄러 인터페이스입니다.
///
/// 규약:
/// - 모든 메서드와 모든 콜백은 스케줄러 owner thread 에서만 호출/실행된다.
/// - onReadable/onWritable 은 같은 fd/방향에 다시 호출되면 콜백을 교체한다(멱등 재등록).
/// - removeReadable/removeWritable 은 등록되지 않은 방향이면 아무 일도 하지 않고 false.
/// - 등록 실패(epoll_ctl 실패 등)는 false 로 보고하고 errno 를 보존한다.
/// - post() 로 넣은 작업은 현재 콜 스택이 아니라 다음 턴에 실행된다.
class IReactorScheduler
{
  public:
    using ReadyCallback = std::function<void()>;
    using Task = std::function<void()>;
    using TimerCallback = std::function<void()>;
    using TimerId = std::uint64_t;
    using Duration = std::chrono::milliseconds;

    virtual ~IReactorScheduler() = default;

    virtual bool onReadable(int fd, ReadyCallback cb) = 0;
    virtual bool onWritable(int fd, ReadyCallback cb) = 0;
    virtual bool removeReadable(int fd) noexcept = 0;
    virtual bool removeWritable(int fd) noexcept = 0;

    /// fd 에 소켓 오류(EPOLLERR)가 오면 방향 콜백 대신 cb 를 부른다.
    /// 방향 watch 가 없는 fd 면 false(ENOENT). 방향 watch 가 모두 지워지면 함께 사라진다.
    virtual bool onFailure(int fd, ReadyCallback cb) = 0;

    /// delay 뒤 한 번 실행될 타이머. 반환값은 0 이 아니다.
    virtual TimerId armTimer(Duration delay, TimerCallback cb) = 0;

    /// 아직 실행되지 않은 타이머를 취소한다. 이미 실행/취소되었으면 false.
    virtual bool cancelTimer(TimerId id) noexcept = 0;

    virtual void post(Task task) = 0;
};

} // namespace curlmux::net
