#include "RecordingScheduler.hpp"

#include <curlmux/mux/Errors.hpp>
#include <curlmux/mux/PendingCompletion.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using curlmux::mux::PendingCompletion;
using curlmux::mux::StateError;
using curlmux::mux::TransferCancelled;
using curlmux::mux::TransferError;
using curlmux::mux::TransferFuture;
using curlmux::mux::TransferHandle;
using curlmux::mux::TransferResult;
using curlmux::test::RecordingScheduler;

namespace
{

bool check(bool cond, const char *tag, const char *what)
{
    if (!cond)
    {
        std::cerr << "[" << tag << "] " << what << "\n";
    }
    return cond;
}

// 결과에 실린 포인터만 비교하므로 실제 객체일 필요는 없다
TransferHandle *fakeHandle()
{
    static int token = 0;
    return reinterpret_cast<TransferHandle *>(&token);
}

/// continuation 은 resolve 하는 콜 스택이 아니라 다음 턴에 실행된다.
bool test_continuation_is_deferred()
{
    RecordingScheduler sched;
    auto state = std::make_shared<PendingCompletion>(sched);
    TransferFuture f(state);

    std::vector<std::string> order;
    f.then([&](const TransferFuture &) { order.push_back("cont"); });

    state->resolve(TransferResult::completed(fakeHandle()));
    order.push_back("after-resolve");

    bool ok = check(order.size() == 1 && order[0] == "after-resolve", "defer",
                    "continuation ran synchronously");
    ok = ok && check(sched.tasks.size() == 1, "defer", "continuation was not posted");

    sched.runTasks();
    ok = ok && check(order.size() == 2 && order[1] == "cont", "defer", "continuation never ran");
    return ok;
}

/// 두 번째 resolve 는 무시되고 처음 결과가 유지된다.
bool test_single_resolution()
{
    RecordingScheduler sched;
    auto state = std::make_shared<PendingCompletion>(sched);
    TransferFuture f(state);

    int calls = 0;
    f.then([&](const TransferFuture &) { ++calls; });

    bool ok = check(state->resolve(TransferResult::stopped()), "single", "first resolve refused");
    ok = ok && check(!state->resolve(TransferResult::failed(28, "timeout")), "single",
                     "second resolve accepted");
    ok = ok && check(!state->resolve(TransferResult::cancelled()), "single",
                     "third resolve accepted");

    sched.runTasks();
    ok = ok && check(calls == 1, "single", "continuation must run exactly once");
    ok = ok && check(f.result().status == TransferResult::Status::Stopped, "single",
                     "first result was overwritten");
    ok = ok && check(f.get() == nullptr, "single", "stopped future must yield nullptr");
    return ok;
}

bool test_get_before_settle_throws()
{
    RecordingScheduler sched;
    TransferFuture f(std::make_shared<PendingCompletion>(sched));

    bool threw = false;
    try
    {
        (void)f.get();
    }
    catch (const StateError &)
    {
        threw = true;
    }

    bool ok = check(threw, "unsettled", "get before settle must throw StateError");
    ok = ok && check(f.valid() && !f.ready(), "unsettled", "valid/ready mismatch");
    return ok;
}

/// 이미 해소된 future 에 붙인 continuation 도 바로 실행되지 않고 post 된다.
bool test_then_after_settle_is_posted()
{
    RecordingScheduler sched;
    auto state = std::make_shared<PendingCompletion>(sched);
    state->resolve(TransferResult::completed(fakeHandle()));

    TransferHandle *seen = nullptr;
    TransferFuture(state).then([&](const TransferFuture &f) { seen = f.get(); });

    bool ok = check(seen == nullptr && sched.tasks.size() == 1, "late-then",
                    "late continuation must be posted, not run inline");
    sched.runTasks();
    ok = ok && check(seen == fakeHandle(), "late-then", "late continuation saw wrong handle");
    return ok;
}

bool test_failure_and_cancel_channels()
{
    RecordingScheduler sched;

    auto failedState = std::make_shared<PendingCompletion>(sched);
    failedState->resolve(TransferResult::failed(6, "Could not resolve host"));
    TransferFuture failed(failedState);

    int code = 0;
    std::string message;
    try
    {
        (void)failed.get();
    }
    catch (const TransferError &e)
    {
        code = e.code();
        message = e.message();
    }
    bool ok = check(code == 6 && message == "Could not resolve host", "channels",
                    "TransferError must carry the engine code and message");

    auto cancelledState = std::make_shared<PendingCompletion>(sched);
    cancelledState->resolve(TransferResult::cancelled());
    TransferFuture cancelled(cancelledState);

    bool sawCancel = false;
    bool sawError = false;
    try
    {
        (void)cancelled.get();
    }
    catch (const TransferError &)
    {
        sawError = true;
    }
    catch (const TransferCancelled &)
    {
        sawCancel = true;
    }
    ok = ok && check(sawCancel && !sawError, "channels", "cancel must not look like an error");
    return ok;
}

/// 공유 상태가 없는 future 는 모든 접근에서 StateError
bool test_invalid_future()
{
    TransferFuture f;

    bool ok = check(!f.valid() && !f.ready(), "invalid", "default future must be invalid");

    bool threwGet = false;
    try
    {
        (void)f.get();
    }
    catch (const StateError &)
    {
        threwGet = true;
    }

    bool threwThen = false;
    try
    {
        f.then([](const TransferFuture &) {});
    }
    catch (const StateError &)
    {
        threwThen = true;
    }

    ok = ok && check(threwGet && threwThen, "invalid", "invalid future must throw StateError");
    return ok;
}

/// 여러 continuation 은 등록 순서대로 실행된다.
bool test_multiple_waiters_keep_order()
{
    RecordingScheduler sched;
    auto state = std::make_shared<PendingCompletion>(sched);
    TransferFuture f(state);

    std::vector<int> order;
    for (int i = 0; i < 3; ++i)
    {
        f.then([&order, i](const TransferFuture &) { order.push_back(i); });
    }

    state->resolve(TransferResult::stopped());
    sched.runTasks();

    return check(order == std::vector<int>{0, 1, 2}, "order", "continuations out of order");
}

} // namespace

int main()
{
    bool ok = true;

    ok = ok && test_continuation_is_deferred();
    ok = ok && test_single_resolution();
    ok = ok && test_get_before_settle_throws();
    ok = ok && test_then_after_settle_is_posted();
    ok = ok && test_failure_and_cancel_channels();
    ok = ok && test_invalid_future();
    ok = ok && test_multiple_waiters_keep_order();

    if (!ok)
    {
        std::cerr << "PendingCompletion tests FAILED\n";
        return 1;
    }

    std::cout << "PendingCompletion tests PASSED\n";
    return 0;
}
