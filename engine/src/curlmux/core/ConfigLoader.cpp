#include <curlmux/core/ConfigLoader.hpp>

#include <curlmux/MuxConfig.hpp>
#include <curlmux/core/Logger.hpp>

#include <toml++/toml.hpp>

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace
{
using namespace curlmux;
using namespace curlmux::core;

// -----------------------------------------------------------------------------
// Helper Functions (Validation & Parsing)
// -----------------------------------------------------------------------------

void printUsage(const char *argv0)
{
    std::string exe = "curlmux_fetch";
    if (argv0 && *argv0)
    {
        exe = std::filesystem::path(argv0).filename().string();
    }
    std::cout << "Usage: " << exe << " --config <path.toml> [url ...]\n";
}

LogLevel parseLogLevel(std::string_view s)
{
    std::string v(s);
    for (auto &c : v)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (v == "trace")
        return LogLevel::Trace;
    if (v == "debug")
        return LogLevel::Debug;
    if (v == "info")
        return LogLevel::Info;
    if (v == "warn" || v == "warning")
        return LogLevel::Warn;
    if (v == "error")
        return LogLevel::Error;
    if (v == "fatal")
        return LogLevel::Fatal;

    throw std::invalid_argument("Invalid log_level: " + std::string(s));
}

struct CliArgs
{
    std::optional<std::string> configPath;
    std::vector<std::string> urls;
};

CliArgs scanCli(int argc, char **argv)
{
    CliArgs out;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i] ? std::string_view(argv[i]) : std::string_view{};
        if (a == "--config" || a == "-c")
        {
            if (i + 1 >= argc || !argv[i + 1] || !*argv[i + 1])
                throw std::runtime_error("--config requires a path");
            out.configPath = std::string(argv[++i]);
            continue;
        }
        if (!a.empty() && a.front() == '-')
            throw std::runtime_error("Unknown option: " + std::string(a));
        if (!a.empty())
            out.urls.emplace_back(a);
    }
    return out;
}

// [Strict Mode] Helper: Must check range safely
unsigned int checkedUIntFromI64(std::int64_t v, const char *key)
{
    if (v < 0 || v > static_cast<std::int64_t>(std::numeric_limits<unsigned int>::max()))
        throw std::invalid_argument(std::string(key) + " out of range: " + std::to_string(v));
    return static_cast<unsigned int>(v);
}

std::size_t checkedSizeFromI64(std::int64_t v, const char *key)
{
    if (v < 0)
        throw std::invalid_argument(std::string(key) + " must be non-negative: " + std::to_string(v));
    return static_cast<std::size_t>(v);
}

long checkedLongFromI64(std::int64_t v, const char *key)
{
    if (v < 0 || v > static_cast<std::int64_t>(std::numeric_limits<long>::max()))
        throw std::invalid_argument(std::string(key) + " out of range: " + std::to_string(v));
    return static_cast<long>(v);
}

// [Strict Mode] Helper: Required Table
const toml::table &requireTable(const toml::table &root, const char *name)
{
    const auto *t = root[name].as_table();
    if (!t)
        throw std::runtime_error(std::string("Missing required [") + name + "] section");
    return *t;
}

// -----------------------------------------------------------------------------
// Section Parsing
// -----------------------------------------------------------------------------

void applyEngineToml(GlobalConfig &cfg, const toml::table &root)
{
    // [engine] 섹션은 필수 (키는 모두 선택)
    const toml::table &engine = requireTable(root, "engine");

    if (auto s = engine["log_level"].value<std::string>())
        cfg.mux.logLevel = parseLogLevel(*s);
    if (auto s = engine["log_file_path"].value<std::string>())
        cfg.mux.logFilePath = *s;

    if (auto v = engine["tick_resolution_ms"].value<std::int64_t>())
        cfg.mux.tickResolutionMs = static_cast<std::uint32_t>(checkedUIntFromI64(*v, "tick_resolution_ms"));
    if (auto v = engine["timer_slots"].value<std::int64_t>())
        cfg.mux.timerSlots = checkedSizeFromI64(*v, "timer_slots");
    if (auto v = engine["max_epoll_events"].value<std::int64_t>())
        cfg.mux.maxEpollEvents = static_cast<std::uint32_t>(checkedUIntFromI64(*v, "max_epoll_events"));
}

void applyMultiToml(GlobalConfig &cfg, const toml::table &root)
{
    const auto *multi = root["multi"].as_table();
    if (!multi)
        return;

    if (auto v = (*multi)["max_total_connections"].value<std::int64_t>())
        cfg.mux.maxTotalConnections = checkedLongFromI64(*v, "max_total_connections");
    if (auto v = (*multi)["max_host_connections"].value<std::int64_t>())
        cfg.mux.maxHostConnections = checkedLongFromI64(*v, "max_host_connections");
    if (auto v = (*multi)["max_connects"].value<std::int64_t>())
        cfg.mux.maxConnects = checkedLongFromI64(*v, "max_connects");
}

void applyFetchToml(GlobalConfig &cfg, const toml::table &root)
{
    const auto *fetch = root["fetch"].as_table();
    if (!fetch)
        return;

    if (const auto *urls = (*fetch)["urls"].as_array())
    {
        for (const auto &node : *urls)
        {
            auto s = node.value<std::string>();
            if (!s)
                throw std::invalid_argument("fetch.urls must contain only strings");
            cfg.fetch.urls.push_back(*s);
        }
    }
    else if ((*fetch).contains("urls"))
    {
        throw std::invalid_argument("fetch.urls must be an array of strings");
    }

    if (auto v = (*fetch)["timeout_ms"].value<std::int64_t>())
        cfg.fetch.timeoutMs = static_cast<std::uint32_t>(checkedUIntFromI64(*v, "timeout_ms"));
    if (auto b = (*fetch)["follow_redirects"].value<bool>())
        cfg.fetch.followRedirects = *b;
    if (auto s = (*fetch)["user_agent"].value<std::string>())
        cfg.fetch.userAgent = *s;
    if (auto b = (*fetch)["verbose"].value<bool>())
        cfg.fetch.verbose = *b;
}

void validateFailFast(const GlobalConfig &cfg)
{
    for (const auto &url : cfg.fetch.urls)
    {
        if (url.empty())
            throw std::invalid_argument("fetch.urls must not contain empty strings");
    }
    validateMuxConfig(cfg.mux);
}

GlobalConfig fromTable(const toml::table &root)
{
    GlobalConfig cfg{};
    applyEngineToml(cfg, root);
    applyMultiToml(cfg, root);
    applyFetchToml(cfg, root);
    validateFailFast(cfg);
    return cfg;
}

} // namespace

namespace curlmux::core
{

GlobalConfig ConfigLoader::parse(std::string_view tomlText)
{
    toml::table root;
    try
    {
        root = toml::parse(tomlText);
    }
    catch (const toml::parse_error &e)
    {
        throw std::runtime_error("TOML Parse Error: " + std::string(e.what()));
    }
    return fromTable(root);
}

GlobalConfig ConfigLoader::loadFile(const std::string &path)
{
    if (!std::filesystem::exists(path))
    {
        throw std::runtime_error("Config file not found: " + path);
    }

    toml::table root;
    try
    {
        root = toml::parse_file(path);
    }
    catch (const toml::parse_error &e)
    {
        throw std::runtime_error("TOML Parse Error: " + std::string(e.what()));
    }
    return fromTable(root);
}

GlobalConfig ConfigLoader::load(int argc, char **argv)
{
    // Help Check
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i] ? std::string_view(argv[i]) : std::string_view{};
        if (a == "--help" || a == "-h")
        {
            printUsage((argc > 0) ? argv[0] : nullptr);
            std::exit(0);
        }
    }

    // 1. CLI
    CliArgs cli = scanCli(argc, argv);
    if (!cli.configPath.has_value())
    {
        printUsage((argc > 0) ? argv[0] : nullptr);
        throw std::runtime_error("Missing required argument: --config <path.toml>");
    }

    // 2. Parse + Validate
    GlobalConfig cfg = loadFile(*cli.configPath);

    // 3. 위치 인자 URL 은 설정 파일 목록 뒤에 붙인다
    for (auto &url : cli.urls)
        cfg.fetch.urls.push_back(std::move(url));

    std::cout << "[ConfigLoader] Successfully loaded: " << *cli.configPath << "\n";
    return cfg;
}

} // namespace curlmux::core
