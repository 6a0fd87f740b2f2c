#pragma once

#include <curlmux/engine/IEngineCallbacks.hpp>
#include <curlmux/net/IReactorScheduler.hpp>
#include <curlmux/util/NonCopyable.hpp>

#include <cstddef>
#include <unordered_set>

namespace curlmux::mux
{

class Multiplexer;

/// 엔진의 watch/timer 요청을 스케줄러 등록으로 옮기는 브리지입니다.
///
/// - 소켓마다 엔진의 최신 비트마스크를 그대로 반영한다: 켜진 방향은 (재)등록,
///   꺼진 방향은 해제, Remove 는 양방향 해제.
/// - 타이머는 Multiplexer 당 하나. 새 요청은 항상 기존 타이머를 먼저 취소한다.
/// - 스케줄러 등록 실패는 std::system_error(errno) 로 던진다.
/// - watch 중인 소켓 집합은 releaseAll() 에서 남은 등록을 걷어내는 용도로만 유지한다.
class SocketTimerBridge final : public engine::IEngineCallbacks, private curlmux::util::NonCopyable
{
  public:
    SocketTimerBridge(net::IReactorScheduler &scheduler, Multiplexer &mux) noexcept
        : scheduler_(scheduler), mux_(mux)
    {
    }

    ~SocketTimerBridge() override { releaseAll(); }

    void onSocketWatch(int socket, engine::WatchMask mask) override;
    void onTimerArm(long timeoutMs) override;

    [[nodiscard]] bool timerArmed() const noexcept { return timerId_ != 0; }
    [[nodiscard]] net::IReactorScheduler::TimerId timerId() const noexcept { return timerId_; }
    [[nodiscard]] std::size_t watchedSockets() const noexcept { return watched_.size(); }

    /// 남은 타이머/소켓 등록을 모두 해제합니다. (Multiplexer::close 마지막 단계)
    void releaseAll() noexcept;

  private:
    net::IReactorScheduler &scheduler_;
    Multiplexer &mux_;
    net::IReactorScheduler::TimerId timerId_{0};
    std::unordered_set<int> watched_;

    void cancelTimer_() noexcept;
    void unwatch_(int socket) noexcept;
};

} // namespace curlmux::mux
