#include "FakeMultiEngine.hpp"
#include "RecordingScheduler.hpp"

#include <curlmux/mux/Multiplexer.hpp>
#include <curlmux/mux/TransferHandle.hpp>

#include <iostream>
#include <string>
#include <system_error>
#include <vector>

using curlmux::engine::Direction;
using curlmux::engine::WatchMask;
using curlmux::mux::Multiplexer;
using curlmux::mux::TransferHandle;
using curlmux::test::FakeMultiEngine;
using curlmux::test::RecordingScheduler;

namespace
{

struct Fixture
{
    RecordingScheduler sched;
    FakeMultiEngine *fake{nullptr};
    Multiplexer mux{sched, curlmux::test::fakeEngineFactory(fake)};
};

bool check(bool cond, const char *tag, const char *what)
{
    if (!cond)
    {
        std::cerr << "[" << tag << "] " << what << "\n";
    }
    return cond;
}

void dumpOps(const RecordingScheduler &sched)
{
    for (const auto &op : sched.ops)
    {
        std::cerr << "  op " << op << "\n";
    }
}

/// 새 타이머 요청은 기존 타이머를 먼저 취소하고, 동시에 두 개가 걸리지 않는다.
bool test_rearm_cancels_before_arming()
{
    Fixture fx;
    fx.fake->callbacks.onTimerArm(10);
    fx.fake->callbacks.onTimerArm(20);
    fx.fake->callbacks.onTimerArm(0);

    const std::vector<std::string> expected = {"arm:1:10", "cancel:1", "arm:2:20", "cancel:2",
                                               "arm:3:0"};
    bool ok = check(fx.sched.ops == expected, "rearm", "unexpected timer op sequence");
    if (!ok)
    {
        dumpOps(fx.sched);
    }
    ok = ok && check(fx.sched.timers.size() == 1, "rearm", "more than one live timer");
    ok = ok && check(fx.mux.bridge().timerId() == 3, "rearm", "bridge lost the latest timer id");
    return ok;
}

/// -1 은 해제만 한다. 걸린 타이머가 없을 때의 해제도 안전해야 한다.
bool test_disarm_sentinel()
{
    Fixture fx;

    fx.fake->callbacks.onTimerArm(curlmux::engine::kDisarmTimer);
    bool ok = check(fx.sched.ops.empty(), "disarm", "disarm without timer touched the scheduler");

    fx.fake->callbacks.onTimerArm(50);
    fx.fake->callbacks.onTimerArm(curlmux::engine::kDisarmTimer);

    ok = ok && check(fx.sched.timers.empty(), "disarm", "timer still armed");
    ok = ok && check(!fx.mux.bridge().timerArmed(), "disarm", "bridge still reports a timer");
    ok = ok && check(fx.sched.countOps("arm:") == 1 && fx.sched.countOps("cancel:") == 1,
                     "disarm", "expected exactly one arm and one cancel");
    return ok;
}

/// 타이머 만료는 kTimeoutSocket 으로 step 하고, 저장된 id 를 비운다.
bool test_timer_fire_steps_timeout_socket()
{
    Fixture fx;

    // step 도중 엔진이 다음 타이머를 다시 요청하는 흔한 패턴
    fx.fake->onStep = [&](int, Direction) {
        fx.fake->callbacks.onTimerArm(5);
        fx.fake->onStep = nullptr;
    };

    fx.fake->callbacks.onTimerArm(0);
    const auto firstId = fx.mux.bridge().timerId();
    bool ok = check(fx.sched.fireTimer(firstId), "fire", "timer was not armed");

    ok = ok && check(fx.fake->steps.size() == 1, "fire", "expected one step");
    ok = ok && check(fx.fake->steps[0].first == curlmux::engine::kTimeoutSocket &&
                         fx.fake->steps[0].second == Direction::None,
                     "fire", "timer step must use the timeout pseudo-socket");
    ok = ok && check(fx.sched.countOps("cancel:") == 0, "fire", "fired timer must not be cancelled");
    ok = ok && check(fx.mux.bridge().timerArmed() && fx.mux.bridge().timerId() != firstId, "fire",
                     "re-armed timer not recorded");
    return ok;
}

/// Remove 는 읽기/쓰기 양방향 등록을 모두 해제한다.
bool test_remove_deregisters_both_directions()
{
    Fixture fx;
    fx.fake->callbacks.onSocketWatch(7, WatchMask::InOut);

    bool ok = check(fx.sched.readers.count(7) == 1 && fx.sched.writers.count(7) == 1, "remove",
                    "InOut did not register both directions");

    fx.fake->callbacks.onSocketWatch(7, WatchMask::Remove);
    ok = ok && check(fx.sched.readers.empty() && fx.sched.writers.empty(), "remove",
                     "Remove left a registration behind");
    ok = ok && check(fx.mux.bridge().watchedSockets() == 0, "remove", "socket still tracked");
    return ok;
}

/// 스케줄러 등록은 항상 엔진의 최신 비트마스크를 따른다.
bool test_mask_changes_are_mirrored()
{
    Fixture fx;
    auto &cb = fx.fake->callbacks;

    cb.onSocketWatch(8, WatchMask::InOut);
    cb.onSocketWatch(8, WatchMask::In);
    bool ok = check(fx.sched.readers.count(8) == 1 && fx.sched.writers.count(8) == 0, "mask",
                    "In after InOut must drop the writer");

    cb.onSocketWatch(8, WatchMask::Out);
    ok = ok && check(fx.sched.readers.count(8) == 0 && fx.sched.writers.count(8) == 1, "mask",
                     "Out after In must swap directions");

    // 같은 마스크가 다시 와도 쓰기 등록 한 건만 더해지고 watch 는 하나로 유지된다
    const std::size_t writerRegsBefore = fx.sched.countOps("write+:8");
    cb.onSocketWatch(8, WatchMask::Out);
    ok = ok && check(fx.sched.writers.size() == 1 &&
                         fx.sched.countOps("write+:8") == writerRegsBefore + 1,
                     "mask", "same mask must re-register idempotently");
    return ok;
}

/// 소켓 오류는 Direction::Err 로 step 하고, Remove 뒤에는 오류 콜백도 남지 않는다.
bool test_socket_failure_steps_with_error()
{
    Fixture fx;
    fx.fake->callbacks.onSocketWatch(12, WatchMask::In);

    bool ok = check(fx.sched.fireFailure(12), "failure", "no failure callback registered");
    ok = ok && check(fx.fake->steps.size() == 1 &&
                         fx.fake->steps[0] == std::make_pair(12, Direction::Err),
                     "failure", "socket error must step with Direction::Err");

    fx.fake->callbacks.onSocketWatch(12, WatchMask::Remove);
    ok = ok && check(fx.sched.failures.empty(), "failure", "failure callback outlived the watch");
    return ok;
}

/// 준비 콜백은 방향에 맞는 Direction 으로 step 한다.
bool test_readiness_routes_direction()
{
    Fixture fx;
    fx.fake->callbacks.onSocketWatch(11, WatchMask::InOut);

    fx.sched.fireWritable(11);
    fx.sched.fireReadable(11);

    bool ok = check(fx.fake->steps.size() == 2, "route", "expected two steps");
    ok = ok && check(fx.fake->steps[0] == std::make_pair(11, Direction::Out), "route",
                     "writable must step with Direction::Out");
    ok = ok && check(fx.fake->steps[1] == std::make_pair(11, Direction::In), "route",
                     "readable must step with Direction::In");
    return ok;
}

/// 스케줄러 등록 실패는 system_error 로 제출 호출 밖까지 전달되고 제출은 되돌려진다.
bool test_registration_failure_propagates()
{
    Fixture fx;
    fx.fake->onAdd = [&](TransferHandle &) { fx.fake->callbacks.onSocketWatch(5, WatchMask::In); };
    fx.sched.failRegistrations = true;

    TransferHandle h(fx.mux);
    bool threw = false;
    try
    {
        (void)h.perform();
    }
    catch (const std::system_error &e)
    {
        threw = e.code().value() != 0;
    }

    bool ok = check(threw, "regfail", "system_error not propagated");
    ok = ok && check(fx.mux.inFlightCount() == 0, "regfail", "submission not rolled back");
    return ok;
}

/// close 는 남아 있는 타이머와 소켓 등록을 모두 걷어낸다.
bool test_close_releases_leftovers()
{
    Fixture fx;
    fx.fake->callbacks.onSocketWatch(9, WatchMask::In);
    fx.fake->callbacks.onSocketWatch(10, WatchMask::Out);
    fx.fake->callbacks.onTimerArm(100);

    fx.mux.close();

    bool ok = check(fx.sched.readers.empty() && fx.sched.writers.empty(), "release",
                    "socket registrations survived close");
    ok = ok && check(fx.sched.timers.empty(), "release", "timer survived close");
    return ok;
}

} // namespace

int main()
{
    bool ok = true;

    ok = ok && test_rearm_cancels_before_arming();
    ok = ok && test_disarm_sentinel();
    ok = ok && test_timer_fire_steps_timeout_socket();
    ok = ok && test_remove_deregisters_both_directions();
    ok = ok && test_mask_changes_are_mirrored();
    ok = ok && test_socket_failure_steps_with_error();
    ok = ok && test_readiness_routes_direction();
    ok = ok && test_registration_failure_propagates();
    ok = ok && test_close_releases_leftovers();

    if (!ok)
    {
        std::cerr << "SocketTimerBridge tests FAILED\n";
        return 1;
    }

    std::cout << "SocketTimerBridge tests PASSED\n";
    return 0;
}
