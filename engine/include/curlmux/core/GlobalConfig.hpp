#pragma once

#include <curlmux/MuxConfig.hpp>
#include <curlmux/core/Defaults.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace curlmux::core
{

// curlmux_fetch 전용 설정
struct FetchConfig
{
    std::vector<std::string> urls;

    /// 전송별 CURLOPT_TIMEOUT_MS. 0 이면 제한 없음.
    std::uint32_t timeoutMs{defaults::kFetchTimeoutMs};

    bool followRedirects{true};
    std::string userAgent{"curlmux-fetch/1.0"};

    /// CURLOPT_VERBOSE (libcurl 자체 디버그 출력)
    bool verbose{false};
};

// 전체 통합 설정
struct GlobalConfig
{
    curlmux::MuxConfig mux{};
    FetchConfig fetch{};
};

} // namespace curlmux::core
