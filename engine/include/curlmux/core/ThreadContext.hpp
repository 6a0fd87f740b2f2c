#pragma once

#include <array>
#include <cstdio>
#include <string_view>

#if defined(__linux__)
#include <sys/syscall.h> // SYS_gettid
#include <unistd.h>      // syscall
#endif

namespace curlmux::core
{

/// 로그 prefix 에 찍을 스레드 태그/tid 를 thread_local 로 캐시합니다.
///
/// - 기본 태그는 "main" 입니다.
/// - EventLoop::bindToCurrentThread() 가 루프 스레드 태그("loop")를 설정합니다.
/// - Logger 의 백그라운드 writer 스레드는 태그를 설정하지 않습니다(로그 호출 시점에 캡처).
class ThreadContext
{
  public:
    static void setCurrentThreadTag(std::string_view tag) noexcept
    {
        auto &buf = tagBuf_();
        const auto n = tag.size() < buf.size() - 1 ? tag.size() : buf.size() - 1;
        for (std::size_t i = 0; i < n; ++i)
        {
            buf[i] = tag[i];
        }
        buf[n] = '\0';
        (void)currentTid();
    }

    // syscall 매번 호출하지 않도록 thread_local 캐시
    [[nodiscard]] static long currentTid() noexcept { return cachedTid_(); }

    [[nodiscard]] static std::string_view currentThreadTag() noexcept
    {
        auto &buf = tagBuf_();
        if (buf[0] == '\0')
        {
            std::snprintf(buf.data(), buf.size(), "main");
        }
        return std::string_view{buf.data()};
    }

  private:
    static long computeTid_() noexcept
    {
#if defined(__linux__)
        return static_cast<long>(::syscall(SYS_gettid));
#else
        return 0;
#endif
    }

    static long &cachedTid_() noexcept
    {
        thread_local long tid = computeTid_(); // 스레드당 1회만 syscall
        return tid;
    }

    static std::array<char, 16> &tagBuf_() noexcept
    {
        thread_local std::array<char, 16> buf{};
        return buf;
    }
};

[[nodiscard]] inline long tid() noexcept
{
    return ThreadContext::currentTid();
}
[[nodiscard]] inline std::string_view ttag() noexcept
{
    return ThreadContext::currentThreadTag();
}

} // namespace curlmux::core
