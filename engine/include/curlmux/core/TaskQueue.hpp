#pragma once

#include <cstddef>
#include <deque>
#include <functional>

#include <curlmux/util/NonCopyable.hpp>

namespace curlmux::core
{

/// EventLoop 의 "다음 턴" 작업 큐입니다.
///
/// - owner thread 전용입니다(잠금 없음). 루프는 단일 스레드 협력 스케줄링만 지원합니다.
/// - PendingCompletion 의 continuation 이 여기로 들어오므로, resolve 하는 쪽 콜 스택에서
///   대기자가 동기적으로 재개되는 일은 없습니다.
class TaskQueue : private curlmux::util::NonCopyable
{
  public:
    using Task = std::function<void()>;

    TaskQueue() = default;
    ~TaskQueue() = default;

    TaskQueue(TaskQueue &&) = delete;
    TaskQueue &operator=(TaskQueue &&) = delete;

    void push(Task &&task);

    bool tryPop(Task &outTask);

    /// 호출 시점에 들어 있던 작업만 실행합니다.
    ///
    /// - 실행 중 push 된 작업은 다음 drain 으로 미뤄집니다(한 턴에 무한히 돌지 않도록).
    /// - 작업이 던진 예외는 onError 로 넘기고 나머지 작업을 계속 실행합니다.
    /// @return 실행한 작업 수
    std::size_t drainSnapshot(const std::function<void(const char *what)> &onError);

    [[nodiscard]] std::size_t size() const noexcept { return queue_.size(); }
    [[nodiscard]] bool empty() const noexcept { return queue_.empty(); }

  private:
    std::deque<Task> queue_;
};

} // namespace curlmux::core
