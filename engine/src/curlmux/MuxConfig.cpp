#include <curlmux/MuxConfig.hpp>

#include <curlmux/core/Defaults.hpp>

#include <limits>
#include <stdexcept>
#include <string>

namespace curlmux
{

namespace
{
[[noreturn]] void throwConfigError(const std::string &detail)
{
    auto msg = "[MuxConfig] " + detail;
    SLOG_ERROR("MuxConfig", "ValidationError", "msg={}", msg);
    throw std::invalid_argument{msg};
}
} // namespace

void validateMuxConfig(const MuxConfig &config)
{
    if (config.tickResolutionMs > 1000)
    {
        throwConfigError("tickResolutionMs must be <= 1000 (libcurl timeouts are ms-scale)");
    }
    if (config.timerSlots > (1U << 20))
    {
        throwConfigError("timerSlots is too large (max 1048576)");
    }
    if (config.maxEpollEvents > static_cast<std::uint32_t>(std::numeric_limits<int>::max()))
    {
        throwConfigError("maxEpollEvents does not fit in int");
    }
    if (config.maxTotalConnections < 0)
    {
        throwConfigError("maxTotalConnections must be >= 0");
    }
    if (config.maxHostConnections < 0)
    {
        throwConfigError("maxHostConnections must be >= 0");
    }
    if (config.maxConnects < 0)
    {
        throwConfigError("maxConnects must be >= 0");
    }
    if (config.maxTotalConnections != 0 && config.maxHostConnections > config.maxTotalConnections)
    {
        throwConfigError("maxHostConnections must not exceed maxTotalConnections");
    }
}

core::EventLoopOptions makeEventLoopOptions(const MuxConfig &config) noexcept
{
    core::EventLoopOptions opt{};

    const std::uint32_t tickMs =
        config.tickResolutionMs != 0 ? config.tickResolutionMs : core::defaults::kTickResolutionMs;
    opt.timer.tickResolution = std::chrono::milliseconds{tickMs};
    opt.timer.slotCount = config.timerSlots != 0 ? config.timerSlots : core::defaults::kTimerSlots;
    opt.maxEpollEvents = config.maxEpollEvents != 0 ? static_cast<int>(config.maxEpollEvents)
                                                    : core::defaults::kMaxEpollEvents;
    return opt;
}

} // namespace curlmux
