#pragma once

#include <chrono>
#include <cstddef>

#include <curlmux/core/Defaults.hpp>
#include <curlmux/core/TimerWheel.hpp>

namespace curlmux::core
{

struct TimerOptions
{
    TimerWheel::Duration tickResolution{
        TimerWheel::Duration{static_cast<TimerWheel::Duration::rep>(defaults::kTickResolutionMs)}};
    std::size_t slotCount{defaults::kTimerSlots};
};

struct EventLoopOptions
{
    TimerOptions timer{};
    int maxEpollEvents{defaults::kMaxEpollEvents};

    /// fd 만 watch 중이고 타이머/작업이 없을 때 epoll_wait 의 최대 대기 시간.
    /// SignalHandler 플래그 같은 외부 상태를 주기적으로 관측하기 위한 상한이다.
    std::chrono::milliseconds idlePollCap{100};
};

} // namespace curlmux::core
