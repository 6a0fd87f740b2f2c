#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <curlmux/core/Defaults.hpp>
#include <curlmux/core/Logger.hpp>
#include <curlmux/core/Options.hpp>

namespace curlmux
{

/// 이벤트 루프 + Multiplexer 설정 파라미터 구조체입니다.
struct MuxConfig
{
    /// 로그를 기록할 파일 경로입니다.
    /// - 빈 문자열("")이면 std::clog 로만 출력합니다.
    std::string logFilePath;

    /// 기본 로그 레벨입니다.
    core::LogLevel logLevel = core::LogLevel::Info;

    // ===== Event loop tuning (0이면 기본값 사용) =====

    /// 타이머 tick 해상도(ms). libcurl 타임아웃 정밀도의 하한이 된다.
    std::uint32_t tickResolutionMs = 0;

    /// 타이머 슬롯 수(휠 크기)
    std::size_t timerSlots = 0;

    /// epoll_wait 1회당 최대 이벤트 수
    std::uint32_t maxEpollEvents = 0;

    // ===== libcurl multi 한도 (0이면 libcurl 기본값 유지) =====

    /// CURLMOPT_MAX_TOTAL_CONNECTIONS
    long maxTotalConnections = core::defaults::kMaxTotalConnections;

    /// CURLMOPT_MAX_HOST_CONNECTIONS
    long maxHostConnections = core::defaults::kMaxHostConnections;

    /// CURLMOPT_MAXCONNECTS (연결 캐시 크기)
    long maxConnects = core::defaults::kMaxConnects;
};

/// MuxConfig 필드 값에 대한 기본 검증을 수행합니다. 실패 시 std::invalid_argument.
void validateMuxConfig(const MuxConfig &config);

/// 0(기본값) 필드를 채운 실제 EventLoop 옵션을 만듭니다.
[[nodiscard]] core::EventLoopOptions makeEventLoopOptions(const MuxConfig &config) noexcept;

} // namespace curlmux
