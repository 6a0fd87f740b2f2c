#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_set>
#include <vector>

#include <curlmux/util/NonCopyable.hpp>

namespace curlmux::core {

/// coarse-grained 타이머 휠 구현입니다.
///
/// - 단일 스레드(EventLoop owner thread)에서만 사용합니다.
/// - 시간은 고정된 tick 해상도로 양자화됩니다.
///   - addTimer() 의 delay 는 tick 단위로 올림(ceil)되며, 0 이어도 최소 1 tick 뒤에 실행됩니다.
/// - one-shot 타이머만 지원합니다.
/// - cancelTimer(id) 로 아직 실행되지 않은 타이머를 취소할 수 있습니다.
///   취소된 타이머는 슬롯에서 즉시 빠지지 않고, 해당 tick 에 도달했을 때 콜백 없이 버려집니다.
class TimerWheel : private curlmux::util::NonCopyable {
  public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::milliseconds;
    using Callback = std::function<void()>;
    using TimerId = std::uint64_t;

    /// 유효하지 않은 TimerId (addTimer 는 절대 0 을 반환하지 않습니다)
    static constexpr TimerId kInvalidTimerId = 0;

    /// @param tickResolution 각 tick 이 의미하는 시간. 0보다 커야 합니다.
    /// @param slotCount 휠 슬롯 개수. 0이면 std::invalid_argument.
    explicit TimerWheel(Duration tickResolution, std::size_t slotCount);

    ~TimerWheel() = default;

    [[nodiscard]] Duration tickResolution() const noexcept { return tickResolution_; }
    [[nodiscard]] std::size_t slotCount() const noexcept { return slotCount_; }
    [[nodiscard]] std::uint64_t currentTick() const noexcept { return currentTick_; }

    /// 스케줄되어 있고 취소되지 않은 타이머 개수
    [[nodiscard]] std::size_t pendingTimers() const noexcept { return live_.size(); }

    /// delay 이후에 한 번 실행될 타이머를 등록합니다.
    ///
    /// - 콜백 안에서 addTimer()/cancelTimer() 를 다시 호출해도 안전합니다.
    TimerId addTimer(Duration delay, Callback callback);

    /// 아직 실행되지 않은 타이머를 취소합니다.
    ///
    /// @return 취소했으면 true. 이미 실행되었거나 모르는 id 면 false.
    bool cancelTimer(TimerId id) noexcept;

    /// 논리 tick 하나를 진행하고 만료된 타이머를 실행합니다. (주로 테스트용)
    void tick();

    /// 마지막 tick 이후 경과한 실제 시간만큼 tick 을 진행합니다.
    void tick(Clock::time_point now);

    /// 가장 가까운 만료까지 남은 tick 수. 대기 중인 타이머가 없으면 0.
    [[nodiscard]] std::uint64_t ticksUntilNextExpiry() const noexcept;

  private:
    struct Timer {
        TimerId id{};
        std::uint64_t expirationTick{};
        Callback callback;
    };

    Duration tickResolution_;
    std::size_t slotCount_{0};
    std::vector<std::vector<Timer>> slots_;

    Clock::time_point lastTickTime_{};
    std::uint64_t currentTick_{0};
    TimerId nextId_{1};

    // 실행/취소되지 않은 타이머 id 집합. cancelTimer 는 여기서만 지운다.
    std::unordered_set<TimerId> live_;

    [[nodiscard]] std::uint64_t durationToTicks(Duration delay) const noexcept;
    [[nodiscard]] TimerId nextTimerId() noexcept;
    void processCurrentTick();
};

} // namespace curlmux::core
