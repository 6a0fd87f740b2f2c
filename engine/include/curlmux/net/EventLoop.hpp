#pragma once

#include <curlmux/core/Options.hpp>
#include <curlmux/core/TaskQueue.hpp>
#include <curlmux/core/TimerWheel.hpp>
#include <curlmux/net/EpollReactor.hpp>
#include <curlmux/net/FdContext.hpp>
#include <curlmux/net/IReactorScheduler.hpp>
#include <curlmux/util/NonCopyable.hpp>

#include <cstdint>
#include <functional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace curlmux::net
{

/// 단일 스레드 협력 스케줄러: epoll(fd 준비) + TimerWheel(타이머) + TaskQueue(다음 턴 작업).
///
/// - 생성한 스레드가 owner thread 가 된다. 다른 스레드에서 API 를 호출하면 FATAL 로그 후 abort.
/// - fd 는 읽기/쓰기 방향별로 독립적으로 watch 한다(IReactorScheduler 규약).
/// - 한 턴(runOnce): 작업 drain → 만료 타이머 실행 → epoll_wait → 준비 콜백 → 타이머 → 작업 drain.
class EventLoop final : public IReactorScheduler, private curlmux::util::NonCopyable
{
  public:
    using Duration = core::TimerWheel::Duration;

    explicit EventLoop(const core::EventLoopOptions &options = {});
    ~EventLoop() override;

    EventLoop(EventLoop &&) = delete;
    EventLoop &operator=(EventLoop &&) = delete;

    /// owner thread 를 현재 스레드로 다시 지정하고 로그 태그를 "loop" 로 설정합니다.
    /// (다른 스레드에서 생성한 뒤 루프 스레드로 넘기는 경우에만 필요)
    void bindToCurrentThread() noexcept;
    [[nodiscard]] bool isInOwnerThread() const noexcept;

    // ===== IReactorScheduler =====
    bool onReadable(int fd, ReadyCallback cb) override;
    bool onWritable(int fd, ReadyCallback cb) override;
    bool removeReadable(int fd) noexcept override;
    bool removeWritable(int fd) noexcept override;
    bool onFailure(int fd, ReadyCallback cb) override;
    TimerId armTimer(Duration delay, TimerCallback cb) override;
    bool cancelTimer(TimerId id) noexcept override;
    void post(Task task) override;

    /// 한 턴을 실행합니다.
    ///
    /// @param maxWaitMs epoll_wait 최대 대기(ms). 음수면 타이머/idlePollCap 기준으로 계산.
    void runOnce(int maxWaitMs = -1);

    /// stop() 이 호출되거나 처리할 일(fd/타이머/작업)이 모두 사라질 때까지 실행합니다.
    void run();

    /// done() 이 true 가 될 때까지 실행합니다.
    ///
    /// @return done() 이 true 가 되면 true. 할 일이 없어 진행이 불가능해지거나
    ///         stop() 이 호출되면 false.
    bool runUntil(const std::function<bool()> &done);

    /// run()/runUntil() 을 다음 턴 경계에서 빠져나오게 합니다.
    void stop() noexcept { stopRequested_ = true; }
    [[nodiscard]] bool stopRequested() const noexcept { return stopRequested_; }

    /// watch 중인 fd, 살아 있는 타이머, 대기 작업 중 하나라도 있으면 true
    [[nodiscard]] bool hasPendingWork() const noexcept;

    [[nodiscard]] bool isReading(int fd) const noexcept;
    [[nodiscard]] bool isWriting(int fd) const noexcept;
    [[nodiscard]] std::size_t watchedFdCount() const noexcept { return fdContexts_.size(); }
    [[nodiscard]] std::size_t pendingTimers() const noexcept { return timerWheel_.pendingTimers(); }
    [[nodiscard]] std::size_t pendingTasks() const noexcept { return taskQueue_.size(); }

    [[nodiscard]] core::TimerWheel &timerWheel() noexcept { return timerWheel_; }
    [[nodiscard]] EpollReactor &reactor() noexcept { return reactor_; }

  private:
    enum class Direction
    {
        Read,
        Write
    };

    EpollReactor reactor_;
    core::TaskQueue taskQueue_;
    core::TimerWheel timerWheel_;
    std::chrono::milliseconds idlePollCap_;

    std::vector<EpollReactor::ReadyEvent> readyEvents_;

    // fd → {read cb, write cb, mask} 단일 레지스트리
    std::unordered_map<int, FdContext> fdContexts_;
    std::uint64_t nextGeneration_{1};

    std::thread::id ownerThread_{};
    bool stopRequested_{false};

    void assertInOwnerThread_(const char *apiName) const noexcept;

    bool setWatch_(int fd, Direction dir, ReadyCallback cb);
    bool clearWatch_(int fd, Direction dir) noexcept;
    [[nodiscard]] static std::uint32_t maskFor_(const FdContext &ctx) noexcept;

    void drainTasks_();
    void dispatch_(const EpollReactor::ReadyEvent &ev);
    [[nodiscard]] int computePollTimeoutMs_(int maxWaitMs) const noexcept;
};

} // namespace curlmux::net
