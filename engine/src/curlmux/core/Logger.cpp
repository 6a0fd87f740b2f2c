#include <curlmux/core/Logger.hpp>
#include <curlmux/core/ThreadContext.hpp> // ttag(), tid()

#include <chrono>
#include <condition_variable>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <queue>
#include <thread>
#include <unistd.h> // isatty, fileno
#include <vector>

namespace curlmux::core
{

namespace detail
{
std::atomic<int> &fastMinLevel()
{
    static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
    return level;
}
} // namespace detail

std::string_view toString(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    }
    return "INFO";
}

struct LogEvent
{
    LogLevel level{};
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::string threadTag; // "main", "loop"
    long threadId{};
};

class Logger::Impl
{
  public:
    explicit Impl(std::ostream &os) : os_(os)
    {
        if (&os == &std::cout || &os == &std::clog || &os == &std::cerr)
        {
            useColor_ = (::isatty(::fileno(stderr)) != 0);
        }
        worker_ = std::thread([this]() { processQueue(); });
    }

    ~Impl() { stop(); }

    void stop()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

    void log(LogLevel level, std::string_view msg)
    {
        // 시간/스레드 정보는 호출 시점에 캡처한다 (writer 스레드가 아니라)
        auto now = std::chrono::system_clock::now();
        std::string tag(curlmux::core::ttag());
        long tid = curlmux::core::tid();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_)
            {
                return;
            }
            queue_.push(LogEvent{level, std::string(msg), now, std::move(tag), tid});
            ++enqueued_;
        }
        cv_.notify_all();
    }

    void flush() noexcept
    {
        std::unique_lock<std::mutex> lock(mutex_);
        const std::uint64_t target = enqueued_;
        cv_.wait(lock, [this, target]() { return stop_ || written_ >= target; });
    }

    void setMinLevel(LogLevel level) noexcept
    {
        minLevel_.store(level, std::memory_order_relaxed);
        detail::fastMinLevel().store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel minLevel() const noexcept { return minLevel_.load(std::memory_order_relaxed); }

  private:
    void processQueue()
    {
        while (true)
        {
            std::vector<LogEvent> batch;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return stop_ || !queue_.empty(); });

                if (stop_ && queue_.empty())
                    return;

                while (!queue_.empty())
                {
                    batch.push_back(std::move(queue_.front()));
                    queue_.pop();
                }
            }

            for (const auto &ev : batch)
            {
                if (ev.level < minLevel())
                    continue;
                writeLog(ev);
            }
            os_.flush();

            {
                std::lock_guard<std::mutex> lock(mutex_);
                written_ += batch.size();
            }
            cv_.notify_all();
        }
    }

    void writeLog(const LogEvent &ev)
    {
        using namespace std::chrono;

        const auto t = system_clock::to_time_t(ev.timestamp);
        std::tm tm{};
        localtime_r(&t, &tm);

        const auto us = duration_cast<microseconds>(ev.timestamp.time_since_epoch()) % seconds(1);

        const std::string thrCol = std::format("{} tid={}", ev.threadTag, ev.threadId);
        const std::string lvlCol = std::format("{:<5}", toString(ev.level));

        const char *c1 = "";
        const char *c2 = "";
        if (useColor_)
        {
            c2 = "\x1b[0m";
            switch (ev.level)
            {
            case LogLevel::Trace:
                c1 = "\x1b[90m";
                break;
            case LogLevel::Debug:
                c1 = "\x1b[36m";
                break;
            case LogLevel::Info:
                c1 = "\x1b[32m";
                break;
            case LogLevel::Warn:
                c1 = "\x1b[33m";
                break;
            case LogLevel::Error:
            case LogLevel::Fatal:
                c1 = "\x1b[31m";
                break;
            }
        }

        os_ << std::format("{:02d}:{:02d}:{:02d}.{:06d} | {} | {}{}{} | {}\n", tm.tm_hour,
                           tm.tm_min, tm.tm_sec, static_cast<int>(us.count()), thrCol, c1, lvlCol,
                           c2, ev.message);
    }

    std::ostream &os_;
    std::thread worker_;
    std::queue<LogEvent> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_{false};
    std::uint64_t enqueued_{0};
    std::uint64_t written_{0};
    std::atomic<LogLevel> minLevel_{LogLevel::Info};
    bool useColor_{false};
};

Logger::Logger(std::ostream &os) : impl_(std::make_unique<Impl>(os)) {}
Logger::~Logger() = default;

void Logger::log(LogLevel level, std::string_view message)
{
    impl_->log(level, message);
}
void Logger::setMinLevel(LogLevel level) noexcept
{
    impl_->setMinLevel(level);
}
LogLevel Logger::minLevel() const noexcept
{
    return impl_->minLevel();
}
void Logger::flush() noexcept
{
    impl_->flush();
}

void Logger::stopAndJoin()
{
    impl_->stop();
}

// ===== Global Instance Management =====

static std::shared_ptr<ILogger> &globalLoggerStorage()
{
    static std::shared_ptr<ILogger> logger = std::make_shared<Logger>();
    return logger;
}

ILogger &getLogger()
{
    auto &instance = globalLoggerStorage();
    if (!instance)
    {
        instance = std::make_shared<Logger>();
    }
    return *instance;
}

void setLogger(std::shared_ptr<ILogger> logger) noexcept
{
    if (logger)
    {
        detail::fastMinLevel().store(static_cast<int>(logger->minLevel()),
                                     std::memory_order_relaxed);
    }
    else
    {
        detail::fastMinLevel().store(static_cast<int>(LogLevel::Info), std::memory_order_relaxed);
    }
    globalLoggerStorage() = std::move(logger);
}

void shutdownLogger() noexcept
{
    auto &instance = globalLoggerStorage();
    if (!instance)
        return;

    // 종료 시점(cold path): 잔여 로그를 비우고 writer 스레드를 join 한다
    instance->flush();
    instance->shutdown();
    instance.reset();
}

} // namespace curlmux::core
