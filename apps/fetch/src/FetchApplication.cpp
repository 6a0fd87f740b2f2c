#include "FetchApplication.hpp"

#include <curlmux/core/Logger.hpp>
#include <curlmux/core/SignalHandler.hpp>
#include <curlmux/mux/Errors.hpp>
#include <curlmux/mux/Multiplexer.hpp>
#include <curlmux/mux/TransferHandle.hpp>
#include <curlmux/net/EventLoop.hpp>

#include <curl/curl.h>

#include <memory>
#include <ostream>
#include <utility>
#include <vector>

namespace fetch
{

using curlmux::mux::Multiplexer;
using curlmux::mux::TransferFuture;
using curlmux::mux::TransferHandle;
using curlmux::mux::TransferResult;

namespace
{
void applyMultiLimits(Multiplexer &mux, const curlmux::MuxConfig &cfg)
{
    if (cfg.maxTotalConnections > 0)
        mux.setOption(CURLMOPT_MAX_TOTAL_CONNECTIONS, cfg.maxTotalConnections);
    if (cfg.maxHostConnections > 0)
        mux.setOption(CURLMOPT_MAX_HOST_CONNECTIONS, cfg.maxHostConnections);
    if (cfg.maxConnects > 0)
        mux.setOption(CURLMOPT_MAXCONNECTS, cfg.maxConnects);
}

void configure(TransferHandle &handle, const std::string &url, const curlmux::core::FetchConfig &cfg)
{
    handle.setOption(CURLOPT_URL, url);
    handle.setOption(CURLOPT_TIMEOUT_MS, static_cast<long long>(cfg.timeoutMs));
    handle.setOption(CURLOPT_FOLLOWLOCATION, cfg.followRedirects ? 1LL : 0LL);
    handle.setOption(CURLOPT_VERBOSE, cfg.verbose ? 1LL : 0LL);
    if (!cfg.userAgent.empty())
        handle.setOption(CURLOPT_USERAGENT, cfg.userAgent);
}
} // namespace

FetchApplication::FetchApplication(curlmux::core::GlobalConfig cfg, std::ostream &out)
    : cfg_(std::move(cfg)), out_(out)
{
}

void FetchApplication::report_(const std::string &url, const TransferFuture &future)
{
    ++settled_;
    const TransferResult &r = future.result();

    try
    {
        TransferHandle *done = future.get();
        if (done == nullptr)
        {
            ++unsuccessful_;
            out_ << "stopped " << url << " - 0\n";
            return;
        }
        ++succeeded_;
        out_ << "ok " << url << ' ' << done->responseCode() << ' ' << done->responseBody().size()
             << '\n';
    }
    catch (const curlmux::mux::TransferError &e)
    {
        ++unsuccessful_;
        out_ << "failed " << url << " - 0 (" << e.code() << ": " << e.message() << ")\n";
    }
    catch (const curlmux::mux::TransferCancelled &)
    {
        ++unsuccessful_;
        out_ << "cancelled " << url << " - 0\n";
    }
    SLOG_DEBUG("Fetch", "Settled", "url={} status={}", url, curlmux::mux::toString(r.status));
}

int FetchApplication::run()
{
    if (cfg_.fetch.urls.empty())
    {
        SLOG_WARN("Fetch", "NoUrls", "hint='pass urls in [fetch] or as arguments'");
        return 0;
    }

    curlmux::core::SignalHandler signals;
    curlmux::net::EventLoop loop(curlmux::makeEventLoopOptions(cfg_.mux));
    Multiplexer mux(loop);
    applyMultiLimits(mux, cfg_.mux);

    const std::size_t total = cfg_.fetch.urls.size();
    std::vector<std::unique_ptr<TransferHandle>> handles;
    handles.reserve(total);

    for (const auto &url : cfg_.fetch.urls)
    {
        auto handle = std::make_unique<TransferHandle>(mux);
        configure(*handle, url, cfg_.fetch);
        handle->perform().then([this, url](const TransferFuture &f) { report_(url, f); });
        handles.push_back(std::move(handle));
    }
    SLOG_INFO("Fetch", "Started", "transfers={}", total);

    const bool finished = loop.runUntil([&]() {
        int signo = 0;
        if (signals.consumeStopRequest(&signo))
        {
            SLOG_INFO("Fetch", "StopRequested", "signal={} in_flight={}",
                      curlmux::core::SignalHandler::signalName(signo), mux.inFlightCount());
            for (auto &h : handles)
                h->cancel();
        }
        return settled_ == total;
    });

    if (!finished)
    {
        SLOG_ERROR("Fetch", "LoopStalled", "settled={} total={}", settled_, total);
    }

    mux.close();
    const auto &stats = mux.stats();
    SLOG_INFO("Fetch", "Finished", "ok={} unsuccessful={} completed={} failed={} cancelled={}",
              succeeded_, unsuccessful_, stats.completed, stats.failed, stats.cancelled);

    return (finished && unsuccessful_ == 0) ? 0 : 1;
}

} // namespace fetch
