#pragma once

#include <curlmux/util/NonCopyable.hpp>

#include <atomic>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace curlmux::core
{

enum class LogLevel : int
{
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

namespace detail
{
// 레벨 필터 fast-path (Logger.cpp 에서 정의)
std::atomic<int> &fastMinLevel();
} // namespace detail

inline bool fastEnabled(LogLevel level) noexcept
{
    return static_cast<int>(level) >= detail::fastMinLevel().load(std::memory_order_relaxed);
}

/// 로깅 백엔드 인터페이스입니다.
///
/// - message 는 이미 "comp | evt | key=value..." 형태로 조립되어 들어옵니다.
/// - 시간/스레드/레벨 prefix 는 구현체가 붙입니다.
class ILogger : private curlmux::util::NonCopyable
{
  public:
    virtual ~ILogger() = default;

    [[nodiscard]] virtual LogLevel minLevel() const noexcept { return LogLevel::Trace; }
    virtual void flush() noexcept {}
    virtual void shutdown() noexcept {}

    virtual void log(LogLevel level, std::string_view message) = 0;
};

/// 기본 Logger (ostream 대상, 백그라운드 writer 스레드로 비동기 출력)
class Logger final : public ILogger
{
  public:
    explicit Logger(std::ostream &os = std::clog);
    ~Logger() override;

    void log(LogLevel level, std::string_view message) override;

    void setMinLevel(LogLevel level) noexcept;
    [[nodiscard]] LogLevel minLevel() const noexcept override;

    /// 호출 시점까지 큐에 들어간 로그가 모두 출력될 때까지 기다립니다.
    void flush() noexcept override;

    // 명시적 중단 (스레드 조인 및 잔여 로그 플러시)
    void stopAndJoin();
    void shutdown() noexcept override { stopAndJoin(); }

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// Global instance
ILogger &getLogger();
void setLogger(std::shared_ptr<ILogger> logger) noexcept;
void shutdownLogger() noexcept;

[[nodiscard]] std::string_view toString(LogLevel level) noexcept;

// =============================================================================
// Structured Logging Frontend
//   최종 라인: "HH:MM:SS.uuuuuu | loop tid=123 | INFO  | comp | evt | k=v ..."
// =============================================================================
namespace slog
{
inline std::string build(std::string_view comp, std::string_view evt, std::string_view details)
{
    if (details.empty())
        return std::format("{} | {}", comp, evt);
    return std::format("{} | {} | {}", comp, evt, details);
}

inline void emit(LogLevel lvl, std::string_view comp, std::string_view evt)
{
    if (!fastEnabled(lvl))
        return;
    getLogger().log(lvl, build(comp, evt, {}));
}

template <typename... Args>
inline void emit(LogLevel lvl, std::string_view comp, std::string_view evt,
                 std::format_string<Args...> fmt, Args &&...args)
{
    if (!fastEnabled(lvl))
        return;
    std::string details = std::format(fmt, std::forward<Args>(args)...);
    getLogger().log(lvl, build(comp, evt, details));
}
} // namespace slog

#define SLOG_TRACE(comp, evt, ...)                                                                 \
    ::curlmux::core::slog::emit(::curlmux::core::LogLevel::Trace, (comp),                          \
                                (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_DEBUG(comp, evt, ...)                                                                 \
    ::curlmux::core::slog::emit(::curlmux::core::LogLevel::Debug, (comp),                          \
                                (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_INFO(comp, evt, ...)                                                                  \
    ::curlmux::core::slog::emit(::curlmux::core::LogLevel::Info, (comp),                           \
                                (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_WARN(comp, evt, ...)                                                                  \
    ::curlmux::core::slog::emit(::curlmux::core::LogLevel::Warn, (comp),                           \
                                (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_ERROR(comp, evt, ...)                                                                 \
    ::curlmux::core::slog::emit(::curlmux::core::LogLevel::Error, (comp),                          \
                                (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_FATAL(comp, evt, ...)                                                                 \
    ::curlmux::core::slog::emit(::curlmux::core::LogLevel::Fatal, (comp),                          \
                                (evt)__VA_OPT__(, ) __VA_ARGS__)

} // namespace curlmux::core
