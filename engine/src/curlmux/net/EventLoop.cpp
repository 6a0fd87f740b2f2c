#include <curlmux/net/EventLoop.hpp>

#include <curlmux/core/Logger.hpp>
#include <curlmux/core/ThreadContext.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <utility>

namespace curlmux::net
{

EventLoop::EventLoop(const core::EventLoopOptions &options)
    : reactor_(options.maxEpollEvents), taskQueue_{},
      timerWheel_(options.timer.tickResolution, options.timer.slotCount),
      idlePollCap_(options.idlePollCap), ownerThread_(std::this_thread::get_id())
{
    const int maxEvents = options.maxEpollEvents > 0 ? options.maxEpollEvents : 64;
    readyEvents_.resize(static_cast<std::size_t>(maxEvents));

    if (idlePollCap_ <= std::chrono::milliseconds::zero())
    {
        idlePollCap_ = std::chrono::milliseconds{100};
    }

    SLOG_INFO("EventLoop", "Created", "tick_ms={} timer_slots={} max_epoll_events={} idle_cap_ms={}",
              timerWheel_.tickResolution().count(), timerWheel_.slotCount(), maxEvents,
              idlePollCap_.count());
}

EventLoop::~EventLoop()
{
    if (!fdContexts_.empty())
    {
        SLOG_WARN("EventLoop", "DestroyedWithWatches", "fds={}", fdContexts_.size());
    }
    SLOG_INFO("EventLoop", "Destroyed", "pending_tasks={} pending_timers={}", taskQueue_.size(),
              timerWheel_.pendingTimers());
}

void EventLoop::bindToCurrentThread() noexcept
{
    ownerThread_ = std::this_thread::get_id();
    core::ThreadContext::setCurrentThreadTag("loop");
    SLOG_INFO("EventLoop", "Bound", "api=bindToCurrentThread");
}

bool EventLoop::isInOwnerThread() const noexcept
{
    return std::this_thread::get_id() == ownerThread_;
}

void EventLoop::assertInOwnerThread_(const char *apiName) const noexcept
{
    if (std::this_thread::get_id() != ownerThread_)
    {
        SLOG_FATAL("EventLoop", "ApiWrongThread", "api='{}' tid={}",
                   apiName ? apiName : "(unknown)", core::tid());
        core::getLogger().flush();
        std::abort();
    }
}

std::uint32_t EventLoop::maskFor_(const FdContext &ctx) noexcept
{
    std::uint32_t mask = 0;
    if (ctx.onReadable)
    {
        mask |= EpollReactor::makeEventMask({EpollReactor::Event::Read});
    }
    if (ctx.onWritable)
    {
        mask |= EpollReactor::makeEventMask({EpollReactor::Event::Write});
    }
    return mask;
}

bool EventLoop::setWatch_(int fd, Direction dir, ReadyCallback cb)
{
    if (fd < 0)
    {
        errno = EBADF;
        SLOG_ERROR("EventLoop", "WatchInvalidFd", "fd={}", fd);
        return false;
    }
    if (!cb)
    {
        errno = EINVAL;
        SLOG_ERROR("EventLoop", "WatchNullCallback", "fd={}", fd);
        return false;
    }

    const char *dirName = (dir == Direction::Read) ? "read" : "write";

    auto it = fdContexts_.find(fd);
    if (it == fdContexts_.end())
    {
        FdContext ctx{};
        ctx.fd = fd;
        (dir == Direction::Read ? ctx.onReadable : ctx.onWritable) = std::move(cb);
        ctx.registeredEvents = maskFor_(ctx);
        ctx.generation = nextGeneration_++;

        if (!reactor_.registerFd(fd, ctx.registeredEvents))
        {
            return false;
        }

        SLOG_DEBUG("EventLoop", "WatchAdded", "fd={} dir={} events=0x{:x} gen={}", fd, dirName,
                   ctx.registeredEvents, ctx.generation);
        fdContexts_.emplace(fd, std::move(ctx));
        return true;
    }

    FdContext &ctx = it->second;
    auto &slot = (dir == Direction::Read) ? ctx.onReadable : ctx.onWritable;
    ReadyCallback previous = std::move(slot);
    slot = std::move(cb);

    // mask 가 같아도 MOD 를 다시 건다. 재사용된 fd 번호면 여기서 ENOENT 로 드러난다.
    const std::uint32_t mask = maskFor_(ctx);
    if (!reactor_.modifyFd(fd, mask))
    {
        // 레지스트리에는 남아 있지만 커널 epoll 에서는 이미 빠진 fd:
        // libcurl 이 POLL_REMOVE 없이 소켓을 닫았고, 같은 번호가 재사용된 경우다.
        if (errno == ENOENT && reactor_.registerFd(fd, mask))
        {
            SLOG_DEBUG("EventLoop", "WatchReRegistered", "fd={} dir={} events=0x{:x}", fd,
                       dirName, mask);
        }
        else
        {
            const int err = errno;
            slot = std::move(previous);
            errno = err;
            return false;
        }
    }

    ctx.registeredEvents = mask;
    SLOG_DEBUG("EventLoop", "WatchUpdated", "fd={} dir={} events=0x{:x}", fd, dirName, mask);
    return true;
}

bool EventLoop::clearWatch_(int fd, Direction dir) noexcept
{
    auto it = fdContexts_.find(fd);
    if (it == fdContexts_.end())
    {
        return false;
    }

    FdContext &ctx = it->second;
    auto &slot = (dir == Direction::Read) ? ctx.onReadable : ctx.onWritable;
    if (!slot)
    {
        return false;
    }
    slot = nullptr;

    const std::uint32_t mask = maskFor_(ctx);
    if (mask == 0)
    {
        // 실패(ENOENT/EBADF)는 reactor 가 로그로 남긴다. 레지스트리는 어쨌든 지운다.
        (void)reactor_.unregisterFd(fd);
        fdContexts_.erase(it);
        SLOG_DEBUG("EventLoop", "WatchRemoved", "fd={}", fd);
        return true;
    }

    if (!reactor_.modifyFd(fd, mask))
    {
        SLOG_WARN("EventLoop", "WatchNarrowFailed", "fd={} events=0x{:x} errno={}", fd, mask,
                  errno);
    }
    ctx.registeredEvents = mask;
    SLOG_DEBUG("EventLoop", "WatchNarrowed", "fd={} events=0x{:x}", fd, mask);
    return true;
}

bool EventLoop::onReadable(int fd, ReadyCallback cb)
{
    assertInOwnerThread_("onReadable");
    return setWatch_(fd, Direction::Read, std::move(cb));
}

bool EventLoop::onWritable(int fd, ReadyCallback cb)
{
    assertInOwnerThread_("onWritable");
    return setWatch_(fd, Direction::Write, std::move(cb));
}

bool EventLoop::removeReadable(int fd) noexcept
{
    assertInOwnerThread_("removeReadable");
    return clearWatch_(fd, Direction::Read);
}

bool EventLoop::removeWritable(int fd) noexcept
{
    assertInOwnerThread_("removeWritable");
    return clearWatch_(fd, Direction::Write);
}

bool EventLoop::onFailure(int fd, ReadyCallback cb)
{
    assertInOwnerThread_("onFailure");
    if (!cb)
    {
        errno = EINVAL;
        SLOG_ERROR("EventLoop", "WatchNullCallback", "fd={} dir=failure", fd);
        return false;
    }

    auto it = fdContexts_.find(fd);
    if (it == fdContexts_.end())
    {
        errno = ENOENT;
        return false;
    }
    it->second.onFailure = std::move(cb);
    return true;
}

bool EventLoop::isReading(int fd) const noexcept
{
    auto it = fdContexts_.find(fd);
    return it != fdContexts_.end() && static_cast<bool>(it->second.onReadable);
}

bool EventLoop::isWriting(int fd) const noexcept
{
    auto it = fdContexts_.find(fd);
    return it != fdContexts_.end() && static_cast<bool>(it->second.onWritable);
}

EventLoop::TimerId EventLoop::armTimer(Duration delay, TimerCallback cb)
{
    assertInOwnerThread_("armTimer");
    if (!cb)
    {
        throw std::invalid_argument("EventLoop::armTimer requires a valid callback");
    }

    // 타이머 콜백 예외가 휠의 같은 tick 목록을 끊지 않도록 여기서 잡는다
    auto guarded = [cb = std::move(cb)]() {
        try
        {
            cb();
        }
        catch (const std::exception &e)
        {
            SLOG_ERROR("EventLoop", "TimerException", "what='{}'", e.what());
        }
    };
    const auto id = timerWheel_.addTimer(delay, std::move(guarded));
    SLOG_TRACE("EventLoop", "TimerArmed", "id={} delay_ms={}", id, delay.count());
    return id;
}

bool EventLoop::cancelTimer(TimerId id) noexcept
{
    assertInOwnerThread_("cancelTimer");
    const bool cancelled = timerWheel_.cancelTimer(id);
    SLOG_TRACE("EventLoop", "TimerCancelled", "id={} found={}", id, cancelled);
    return cancelled;
}

void EventLoop::post(Task task)
{
    assertInOwnerThread_("post");
    if (!task)
    {
        SLOG_WARN("EventLoop", "PostIgnored", "reason=EmptyTask");
        return;
    }
    taskQueue_.push(std::move(task));
}

bool EventLoop::hasPendingWork() const noexcept
{
    return !taskQueue_.empty() || timerWheel_.pendingTimers() != 0 || !fdContexts_.empty();
}

int EventLoop::computePollTimeoutMs_(int maxWaitMs) const noexcept
{
    if (!taskQueue_.empty())
    {
        return 0;
    }

    long long timeoutMs = idlePollCap_.count();
    if (timerWheel_.pendingTimers() != 0)
    {
        const auto ticks = timerWheel_.ticksUntilNextExpiry();
        const auto tickMs = timerWheel_.tickResolution().count();
        const auto untilExpiry = static_cast<long long>(ticks) * tickMs;
        timeoutMs = std::min(timeoutMs, untilExpiry);
    }
    if (maxWaitMs >= 0)
    {
        timeoutMs = std::min<long long>(timeoutMs, maxWaitMs);
    }

    timeoutMs = std::clamp<long long>(timeoutMs, 0, std::numeric_limits<int>::max());
    return static_cast<int>(timeoutMs);
}

void EventLoop::drainTasks_()
{
    (void)taskQueue_.drainSnapshot([](const char *what) {
        SLOG_ERROR("EventLoop", "TaskException", "what='{}'", what ? what : "");
    });
}

void EventLoop::dispatch_(const EpollReactor::ReadyEvent &ev)
{
    constexpr std::uint32_t kFailureBits = EPOLLERR | EPOLLHUP;

    auto it = fdContexts_.find(ev.fd);
    if (it == fdContexts_.end())
    {
        // 같은 배치 안에서 앞선 콜백이 이 fd 의 watch 를 지운 경우
        SLOG_TRACE("EventLoop", "EventWithoutContext", "fd={} events=0x{:x}", ev.fd, ev.events);
        return;
    }

    const std::uint64_t generation = it->second.generation;

    // 오류 콜백이 있으면 EPOLLERR 는 그쪽으로만 보낸다. EPOLLHUP 만 온 경우(상대가 닫음)는
    // 남은 데이터를 읽어야 하므로 방향 콜백으로 전달한다.
    if ((ev.events & EPOLLERR) != 0U && it->second.onFailure)
    {
        ReadyCallback cb = it->second.onFailure;
        SLOG_TRACE("EventLoop", "DispatchFailure", "fd={} events=0x{:x}", ev.fd, ev.events);
        cb();
        return;
    }

    if ((ev.events & (EPOLLIN | kFailureBits)) != 0U && it->second.onReadable)
    {
        // 콜백이 자기 자신을 지울 수 있으므로 복사본으로 호출한다
        ReadyCallback cb = it->second.onReadable;
        SLOG_TRACE("EventLoop", "DispatchRead", "fd={} events=0x{:x}", ev.fd, ev.events);
        cb();
    }

    it = fdContexts_.find(ev.fd);
    if (it == fdContexts_.end() || it->second.generation != generation)
    {
        return;
    }

    if ((ev.events & (EPOLLOUT | kFailureBits)) != 0U && it->second.onWritable)
    {
        ReadyCallback cb = it->second.onWritable;
        SLOG_TRACE("EventLoop", "DispatchWrite", "fd={} events=0x{:x}", ev.fd, ev.events);
        cb();
    }
}

void EventLoop::runOnce(int maxWaitMs)
{
    assertInOwnerThread_("runOnce");

    drainTasks_();
    timerWheel_.tick(core::TimerWheel::Clock::now());

    if (fdContexts_.empty() && timerWheel_.pendingTimers() == 0)
    {
        drainTasks_();
        return;
    }

    const int timeoutMs = computePollTimeoutMs_(maxWaitMs);
    const int n = reactor_.wait(readyEvents_, timeoutMs);
    if (n > 0)
    {
        for (int i = 0; i < n; ++i)
        {
            const auto ev = readyEvents_[static_cast<std::size_t>(i)];
            try
            {
                dispatch_(ev);
            }
            catch (const std::exception &e)
            {
                SLOG_ERROR("EventLoop", "HandlerException", "fd={} what='{}'", ev.fd, e.what());
            }
        }
    }
    else if (n < 0 && errno != EINTR)
    {
        SLOG_WARN("EventLoop", "PollError", "errno={} msg='{}'", errno, std::strerror(errno));
    }

    timerWheel_.tick(core::TimerWheel::Clock::now());
    drainTasks_();
}

void EventLoop::run()
{
    stopRequested_ = false;
    while (!stopRequested_ && hasPendingWork())
    {
        runOnce();
    }
}

bool EventLoop::runUntil(const std::function<bool()> &done)
{
    stopRequested_ = false;
    while (!done())
    {
        if (stopRequested_ || !hasPendingWork())
        {
            return false;
        }
        runOnce();
    }
    return true;
}

} // namespace curlmux::net
