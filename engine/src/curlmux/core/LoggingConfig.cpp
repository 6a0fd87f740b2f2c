#include <curlmux/core/LoggingConfig.hpp>
#include <curlmux/core/Logger.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace curlmux::core
{
namespace
{

// 파일 스트림 수명을 소유하면서 내부 Logger 로 비동기 출력을 유지한다.
class OwningOstreamLogger final : public ILogger
{
  public:
    OwningOstreamLogger(std::shared_ptr<std::ostream> os, LogLevel lvl)
        : os_(std::move(os)), logger_(*os_)
    {
        logger_.setMinLevel(lvl);
    }

    void log(LogLevel level, std::string_view message) override { logger_.log(level, message); }
    [[nodiscard]] LogLevel minLevel() const noexcept override { return logger_.minLevel(); }
    void flush() noexcept override { logger_.flush(); }
    void shutdown() noexcept override { logger_.stopAndJoin(); }

  private:
    std::shared_ptr<std::ostream> os_;
    Logger logger_;
};

} // namespace

void applyLoggingConfig(const curlmux::MuxConfig &cfg)
{
    if (cfg.logFilePath.empty())
    {
        auto os = std::shared_ptr<std::ostream>(&std::clog, [](std::ostream *) {});
        setLogger(std::make_shared<OwningOstreamLogger>(std::move(os), cfg.logLevel));
        return;
    }

    auto file = std::make_shared<std::ofstream>(cfg.logFilePath, std::ios::app);
    if (!file->is_open())
    {
        throw std::runtime_error("[LoggingConfig] failed to open log file: " + cfg.logFilePath);
    }

    std::shared_ptr<std::ostream> os = file;
    setLogger(std::make_shared<OwningOstreamLogger>(std::move(os), cfg.logLevel));
}

} // namespace curlmux::core
