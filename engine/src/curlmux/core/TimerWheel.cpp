#include <curlmux/core/TimerWheel.hpp>

#include <limits>
#include <stdexcept>
#include <utility>

namespace curlmux::core
{

TimerWheel::TimerWheel(Duration tickResolution, std::size_t slotCount)
    : tickResolution_(tickResolution), slotCount_(slotCount), slots_(slotCount),
      lastTickTime_(Clock::now())
{
    if (tickResolution_ <= Duration::zero())
    {
        throw std::invalid_argument("TimerWheel tickResolution must be > 0");
    }
    if (slotCount_ == 0)
    {
        throw std::invalid_argument("TimerWheel slotCount must be > 0");
    }
}

TimerWheel::TimerId TimerWheel::addTimer(Duration delay, Callback callback)
{
    if (!callback)
    {
        throw std::invalid_argument("TimerWheel::addTimer requires a valid callback");
    }

    const auto ticks = durationToTicks(delay);
    const std::uint64_t delayTicks = (ticks == 0) ? 1 : ticks;

    const auto expirationTick = currentTick_ + delayTicks;
    const auto slotIndex = static_cast<std::size_t>(expirationTick % slotCount_);

    const TimerId id = nextTimerId();
    slots_[slotIndex].push_back(Timer{id, expirationTick, std::move(callback)});
    live_.insert(id);

    return id;
}

bool TimerWheel::cancelTimer(TimerId id) noexcept
{
    if (id == kInvalidTimerId)
    {
        return false;
    }
    // 슬롯 벡터는 건드리지 않는다. processCurrentTick 이 live_ 를 보고 버린다.
    return live_.erase(id) != 0;
}

void TimerWheel::tick()
{
    ++currentTick_;
    processCurrentTick();
}

void TimerWheel::tick(Clock::time_point now)
{
    if (now <= lastTickTime_)
    {
        return;
    }

    const auto elapsedMs = std::chrono::duration_cast<Duration>(now - lastTickTime_);
    if (elapsedMs < tickResolution_)
    {
        return;
    }

    const auto totalMs = static_cast<std::uint64_t>(elapsedMs.count());
    const auto tickMs = static_cast<std::uint64_t>(tickResolution_.count());
    const auto ticksToAdvance = totalMs / tickMs;

    for (std::uint64_t i = 0; i < ticksToAdvance; ++i)
    {
        tick();
    }

    // 누적 오차를 줄이기 위해 실제 진행한 tick 만큼만 기준 시각을 옮긴다
    lastTickTime_ += tickResolution_ * static_cast<std::int64_t>(ticksToAdvance);
}

std::uint64_t TimerWheel::ticksUntilNextExpiry() const noexcept
{
    if (live_.empty())
    {
        return 0;
    }

    std::uint64_t best = std::numeric_limits<std::uint64_t>::max();
    for (const auto &bucket : slots_)
    {
        for (const auto &timer : bucket)
        {
            if (live_.count(timer.id) == 0)
            {
                continue;
            }
            const auto remaining =
                (timer.expirationTick > currentTick_) ? timer.expirationTick - currentTick_ : 0;
            if (remaining < best)
            {
                best = remaining;
            }
        }
    }
    return best == std::numeric_limits<std::uint64_t>::max() ? 0 : best;
}

std::uint64_t TimerWheel::durationToTicks(Duration delay) const noexcept
{
    if (delay <= Duration::zero())
    {
        return 0;
    }

    const auto delayMs = static_cast<std::uint64_t>(delay.count());
    const auto tickMs = static_cast<std::uint64_t>(tickResolution_.count());
    return (delayMs + tickMs - 1) / tickMs;
}

TimerWheel::TimerId TimerWheel::nextTimerId() noexcept
{
    TimerId id = nextId_;
    ++nextId_;
    if (nextId_ == kInvalidTimerId)
    {
        nextId_ = 1;
    }
    return id;
}

void TimerWheel::processCurrentTick()
{
    const auto slotIndex = static_cast<std::size_t>(currentTick_ % slotCount_);
    auto &bucket = slots_[slotIndex];

    if (bucket.empty())
    {
        return;
    }

    // 콜백이 addTimer() 로 같은 슬롯에 넣어도 이번 tick 목록이 깨지지 않도록 분리한다.
    std::vector<Timer> current;
    current.swap(bucket);

    for (auto &timer : current)
    {
        if (live_.count(timer.id) == 0)
        {
            // 취소된 타이머
            continue;
        }

        if (timer.expirationTick <= currentTick_)
        {
            live_.erase(timer.id);
            if (timer.callback)
            {
                timer.callback();
            }
        }
        else
        {
            const auto idx = static_cast<std::size_t>(timer.expirationTick % slotCount_);
            slots_[idx].push_back(std::move(timer));
        }
    }
}

} // namespace curlmux::core
