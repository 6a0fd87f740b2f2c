#include <curlmux/core/TimerWheel.hpp>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <stdexcept>

using curlmux::core::TimerWheel;

namespace {

/// 단일 타이머가 올림된 tick 에서 한 번만 실행되는지 확인합니다.
bool test_single_timer_basic() {
    using namespace std::chrono_literals;

    TimerWheel wheel(10ms, 8);

    bool fired = false;
    wheel.addTimer(25ms, [&]() { fired = true; });

    // 25ms -> 10ms tick 기준 3 tick
    for (int i = 0; i < 2; ++i) {
        wheel.tick();
        if (fired) {
            std::cerr << "[single] timer fired too early at tick " << (i + 1) << "\n";
            return false;
        }
    }

    wheel.tick();
    if (!fired) {
        std::cerr << "[single] timer did not fire at expected tick\n";
        return false;
    }

    fired = false;
    wheel.tick();
    if (fired) {
        std::cerr << "[single] timer fired more than once\n";
        return false;
    }

    if (wheel.pendingTimers() != 0) {
        std::cerr << "[single] pendingTimers=" << wheel.pendingTimers() << " after expiry\n";
        return false;
    }

    return true;
}

/// 0ms 타이머도 현재 tick 이 아니라 다음 tick 에서 실행됩니다.
bool test_zero_delay_runs_next_tick() {
    using namespace std::chrono_literals;

    TimerWheel wheel(1ms, 16);

    int fired = 0;
    wheel.addTimer(0ms, [&]() { ++fired; });

    if (fired != 0 || wheel.ticksUntilNextExpiry() != 1) {
        std::cerr << "[zero] expected one tick of delay, got " << wheel.ticksUntilNextExpiry()
                  << "\n";
        return false;
    }

    wheel.tick();
    if (fired != 1) {
        std::cerr << "[zero] zero-delay timer did not fire on the next tick\n";
        return false;
    }
    return true;
}

bool test_multiple_timers_order() {
    using namespace std::chrono_literals;

    TimerWheel wheel(10ms, 16);

    std::uint64_t currentTick = 0;
    std::uint64_t tickA = 0;
    std::uint64_t tickB = 0;
    std::uint64_t tickC = 0;

    wheel.addTimer(10ms, [&]() { tickA = currentTick; });
    wheel.addTimer(35ms, [&]() { tickB = currentTick; });
    wheel.addTimer(70ms, [&]() { tickC = currentTick; });

    for (int i = 0; i < 10; ++i) {
        ++currentTick;
        wheel.tick();
    }

    if (tickA != 1 || tickB != 4 || tickC != 7) {
        std::cerr << "[multi] fired at A=" << tickA << " B=" << tickB << " C=" << tickC
                  << " (expected 1/4/7)\n";
        return false;
    }

    return true;
}

/// slotCount 보다 긴 delay 가 wrap-around 후에도 정확한 tick 에 실행되는지 확인합니다.
bool test_wrap_around() {
    using namespace std::chrono_literals;

    TimerWheel wheel(10ms, 4);

    std::uint64_t currentTick = 0;
    int firedShort = 0;
    int firedLong = 0;
    std::uint64_t longAt = 0;

    wheel.addTimer(20ms, [&]() { ++firedShort; });
    wheel.addTimer(90ms, [&]() {
        ++firedLong;
        longAt = currentTick;
    });

    for (int i = 0; i < 12; ++i) {
        ++currentTick;
        wheel.tick();
    }

    if (firedShort != 1 || firedLong != 1 || longAt != 9) {
        std::cerr << "[wrap] short=" << firedShort << " long=" << firedLong << " at " << longAt
                  << " (expected 1/1 at 9)\n";
        return false;
    }

    return true;
}

/// 취소된 타이머는 실행되지 않고, 두 번째 취소와 만료 후 취소는 false 입니다.
bool test_cancel() {
    using namespace std::chrono_literals;

    TimerWheel wheel(10ms, 8);

    int firedA = 0;
    int firedB = 0;
    const auto a = wheel.addTimer(20ms, [&]() { ++firedA; });
    const auto b = wheel.addTimer(20ms, [&]() { ++firedB; });

    if (!wheel.cancelTimer(a) || wheel.cancelTimer(a)) {
        std::cerr << "[cancel] cancel result mismatch\n";
        return false;
    }
    if (wheel.cancelTimer(TimerWheel::kInvalidTimerId)) {
        std::cerr << "[cancel] invalid id must not cancel anything\n";
        return false;
    }
    if (wheel.pendingTimers() != 1) {
        std::cerr << "[cancel] pendingTimers=" << wheel.pendingTimers() << " (expected 1)\n";
        return false;
    }

    wheel.tick();
    wheel.tick();

    if (firedA != 0 || firedB != 1) {
        std::cerr << "[cancel] A=" << firedA << " B=" << firedB << " (expected 0/1)\n";
        return false;
    }
    if (wheel.cancelTimer(b)) {
        std::cerr << "[cancel] expired timer reported as cancelled\n";
        return false;
    }
    return true;
}

/// 콜백 안에서 새 타이머를 걸고 다른 타이머를 취소해도 안전합니다.
bool test_rearm_from_callback() {
    using namespace std::chrono_literals;

    TimerWheel wheel(10ms, 4);

    int chained = 0;
    int victim = 0;
    TimerWheel::TimerId victimId = TimerWheel::kInvalidTimerId;

    wheel.addTimer(10ms, [&]() {
        wheel.cancelTimer(victimId);
        wheel.addTimer(10ms, [&]() { ++chained; });
    });
    victimId = wheel.addTimer(20ms, [&]() { ++victim; });

    for (int i = 0; i < 4; ++i) {
        wheel.tick();
    }

    if (chained != 1 || victim != 0) {
        std::cerr << "[rearm] chained=" << chained << " victim=" << victim << " (expected 1/0)\n";
        return false;
    }
    return true;
}

/// 가장 가까운 만료까지의 tick 수는 취소된 타이머를 무시합니다.
bool test_ticks_until_next_expiry() {
    using namespace std::chrono_literals;

    TimerWheel wheel(10ms, 8);

    if (wheel.ticksUntilNextExpiry() != 0) {
        std::cerr << "[next] empty wheel must report 0\n";
        return false;
    }

    const auto soon = wheel.addTimer(30ms, []() {});
    wheel.addTimer(100ms, []() {});

    if (wheel.ticksUntilNextExpiry() != 3) {
        std::cerr << "[next] got " << wheel.ticksUntilNextExpiry() << " (expected 3)\n";
        return false;
    }

    wheel.cancelTimer(soon);
    if (wheel.ticksUntilNextExpiry() != 10) {
        std::cerr << "[next] after cancel got " << wheel.ticksUntilNextExpiry()
                  << " (expected 10)\n";
        return false;
    }

    wheel.tick();
    if (wheel.ticksUntilNextExpiry() != 9) {
        std::cerr << "[next] after one tick got " << wheel.ticksUntilNextExpiry()
                  << " (expected 9)\n";
        return false;
    }
    return true;
}

/// 실제 시간 기반 tick(now) 은 경과한 tick 수만큼만 진행합니다.
bool test_tick_with_clock() {
    using namespace std::chrono_literals;

    TimerWheel wheel(10ms, 8);
    const auto start = TimerWheel::Clock::now();

    int fired = 0;
    wheel.addTimer(20ms, [&]() { ++fired; });

    wheel.tick(start + 25ms);
    const auto afterFirst = wheel.currentTick();

    // 과거 시각은 무시
    wheel.tick(start);

    if (fired != 1 || wheel.currentTick() != afterFirst || afterFirst < 2) {
        std::cerr << "[clock] fired=" << fired << " tick=" << wheel.currentTick() << "\n";
        return false;
    }
    return true;
}

bool test_invalid_arguments() {
    using namespace std::chrono_literals;

    bool threwSlots = false;
    try {
        TimerWheel wheel(10ms, 0);
    } catch (const std::invalid_argument &) {
        threwSlots = true;
    }

    bool threwTick = false;
    try {
        TimerWheel wheel(0ms, 8);
    } catch (const std::invalid_argument &) {
        threwTick = true;
    }

    bool threwCallback = false;
    TimerWheel wheel(10ms, 8);
    try {
        wheel.addTimer(10ms, TimerWheel::Callback{});
    } catch (const std::invalid_argument &) {
        threwCallback = true;
    }

    if (!threwSlots || !threwTick || !threwCallback) {
        std::cerr << "[args] slots=" << threwSlots << " tick=" << threwTick
                  << " callback=" << threwCallback << "\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;

    ok = ok && test_single_timer_basic();
    ok = ok && test_zero_delay_runs_next_tick();
    ok = ok && test_multiple_timers_order();
    ok = ok && test_wrap_around();
    ok = ok && test_cancel();
    ok = ok && test_rearm_from_callback();
    ok = ok && test_ticks_until_next_expiry();
    ok = ok && test_tick_with_clock();
    ok = ok && test_invalid_arguments();

    if (!ok) {
        std::cerr << "TimerWheel tests FAILED\n";
        return 1;
    }

    std::cout << "TimerWheel tests PASSED\n";
    return 0;
}
