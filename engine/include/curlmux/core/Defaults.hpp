#pragma once
#include <cstddef>
#include <cstdint>

namespace curlmux::core::defaults
{

// ===== Event loop timer / epoll =====
// libcurl 은 0ms~수 ms 단위 timeout 을 자주 요청하므로 tick 을 짧게 잡는다.
inline constexpr std::uint32_t kTickResolutionMs = 1;
inline constexpr std::size_t kTimerSlots = 1024;
inline constexpr int kMaxEpollEvents = 64;

// ===== Multi handle limits (0 = libcurl 기본값 유지) =====
inline constexpr long kMaxTotalConnections = 0;
inline constexpr long kMaxHostConnections = 0;
inline constexpr long kMaxConnects = 0;

// ===== fetch CLI =====
inline constexpr std::uint32_t kFetchTimeoutMs = 30'000;

} // namespace curlmux::core::defaults
