#pragma once

#include <curlmux/MuxConfig.hpp>

namespace curlmux::core
{

/// MuxConfig 의 logLevel/logFilePath 를 프로세스 전역 Logger 에 반영합니다.
void applyLoggingConfig(const curlmux::MuxConfig &cfg);

} // namespace curlmux::core
