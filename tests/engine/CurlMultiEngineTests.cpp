#include <curlmux/mux/Errors.hpp>
#include <curlmux/mux/Multiplexer.hpp>
#include <curlmux/mux/TransferHandle.hpp>
#include <curlmux/net/EventLoop.hpp>

#include <curl/curl.h>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

using curlmux::mux::ConfigError;
using curlmux::mux::Multiplexer;
using curlmux::mux::TransferError;
using curlmux::mux::TransferFuture;
using curlmux::mux::TransferHandle;
using curlmux::mux::TransferState;
using curlmux::net::EventLoop;

namespace
{

/// mkstemp 로 만든 임시 파일 (소멸 시 삭제)
class TempFile
{
  public:
    explicit TempFile(const std::string &content)
    {
        char pattern[] = "/tmp/curlmux_test_XXXXXX";
        const int fd = ::mkstemp(pattern);
        if (fd < 0)
        {
            return;
        }
        path_ = pattern;
        const ssize_t n = ::write(fd, content.data(), content.size());
        ::close(fd);
        if (n != static_cast<ssize_t>(content.size()))
        {
            path_.clear();
        }
    }

    ~TempFile()
    {
        if (!path_.empty())
        {
            ::unlink(path_.c_str());
        }
    }

    TempFile(const TempFile &) = delete;
    TempFile &operator=(const TempFile &) = delete;

    [[nodiscard]] bool valid() const noexcept { return !path_.empty(); }
    [[nodiscard]] std::string url() const { return "file://" + path_; }

  private:
    std::string path_;
};

bool check(bool cond, const char *tag, const char *what)
{
    if (!cond)
    {
        std::cerr << "[" << tag << "] " << what << "\n";
    }
    return cond;
}

template <typename Ex, typename Fn> bool throws(Fn &&fn)
{
    try
    {
        fn();
    }
    catch (const Ex &)
    {
        return true;
    }
    return false;
}

/// 파일 하나를 전송하고 본문이 그대로 모이는지 확인합니다.
bool test_single_file_transfer()
{
    TempFile file("hello from curlmux\n");
    if (!check(file.valid(), "single", "temp file creation failed"))
    {
        return false;
    }

    EventLoop loop;
    Multiplexer mux(loop);
    TransferHandle h(mux);
    h.setOption(CURLOPT_URL, file.url());

    TransferFuture f = h.perform();
    bool continued = false;
    f.then([&](const TransferFuture &done) { continued = done.ready(); });

    bool ok = check(loop.runUntil([&]() { return continued; }), "single", "transfer never settled");
    ok = ok && check(f.get() == &h, "single", "future must yield the handle");
    ok = ok && check(h.responseBody() == "hello from curlmux\n", "single", "body mismatch");
    ok = ok && check(h.effectiveUrl() == file.url(), "single", "effective url mismatch");
    ok = ok && check(mux.inFlightCount() == 0, "single", "transfer still tracked");
    ok = ok && check(mux.stats().completed == 1, "single", "completed counter not bumped");
    return ok;
}

/// 없는 파일은 엔진 오류 코드와 메시지를 담은 TransferError 로 끝난다.
bool test_missing_file_fails()
{
    EventLoop loop;
    Multiplexer mux(loop);
    TransferHandle h(mux);
    h.setOption(CURLOPT_URL, std::string("file:///nonexistent/curlmux/missing.txt"));

    TransferFuture f = h.perform();
    bool ok = check(loop.runUntil([&]() { return f.ready(); }), "missing", "transfer never settled");

    int code = 0;
    std::string message;
    try
    {
        (void)f.get();
    }
    catch (const TransferError &e)
    {
        code = e.code();
        message = e.message();
    }

    ok = ok && check(code == CURLE_FILE_COULDNT_READ_FILE, "missing", "unexpected error code");
    ok = ok && check(!message.empty(), "missing", "error message missing");
    ok = ok && check(h.state() == TransferState::Failed, "missing", "state must be Failed");
    return ok;
}

/// 여러 전송을 동시에 진행해도 각 handle 에 자기 본문이 모인다.
bool test_concurrent_transfers()
{
    constexpr int kCount = 4;

    std::vector<std::unique_ptr<TempFile>> files;
    for (int i = 0; i < kCount; ++i)
    {
        files.push_back(std::make_unique<TempFile>("payload-" + std::to_string(i)));
        if (!check(files.back()->valid(), "concurrent", "temp file creation failed"))
        {
            return false;
        }
    }

    EventLoop loop;
    Multiplexer mux(loop);
    mux.setOption(CURLMOPT_MAXCONNECTS, 2LL);

    std::vector<std::unique_ptr<TransferHandle>> handles;
    std::vector<TransferFuture> futures;
    int settled = 0;
    for (int i = 0; i < kCount; ++i)
    {
        handles.push_back(std::make_unique<TransferHandle>(mux));
        handles.back()->setOption(CURLOPT_URL, files[static_cast<std::size_t>(i)]->url());
        futures.push_back(handles.back()->perform());
        futures.back().then([&](const TransferFuture &) { ++settled; });
    }

    bool ok = check(mux.inFlightCount() == static_cast<std::size_t>(kCount), "concurrent",
                    "not all transfers in flight");
    ok = ok && check(loop.runUntil([&]() { return settled == kCount; }), "concurrent",
                     "not all transfers settled");

    for (int i = 0; i < kCount && ok; ++i)
    {
        const auto idx = static_cast<std::size_t>(i);
        ok = check(futures[idx].get() == handles[idx].get(), "concurrent", "wrong handle");
        ok = ok && check(handles[idx]->responseBody() == "payload-" + std::to_string(i),
                         "concurrent", "body crossed between transfers");
    }
    return ok;
}

/// 루프가 돌기 전에 stop 하면 바로 nullptr 로 해소되고, reset 후 다시 쓸 수 있다.
bool test_stop_then_reuse()
{
    TempFile file("second run");
    if (!check(file.valid(), "reuse", "temp file creation failed"))
    {
        return false;
    }

    EventLoop loop;
    Multiplexer mux(loop);
    TransferHandle h(mux);
    h.setOption(CURLOPT_URL, file.url());

    TransferFuture stopped = h.perform();
    h.stop();
    bool ok = check(stopped.ready() && stopped.get() == nullptr, "reuse", "stop must yield nullptr");

    h.reset();
    TransferFuture again = h.perform();
    ok = ok && check(loop.runUntil([&]() { return again.ready(); }), "reuse",
                     "second run never settled");
    ok = ok && check(again.get() == &h && h.responseBody() == "second run", "reuse",
                     "second run body mismatch");
    return ok;
}

bool test_option_validation()
{
    EventLoop loop;
    Multiplexer mux(loop);
    TransferHandle h(mux);

    bool ok = check(throws<ConfigError>([&] { h.setOption(CURLOPT_WRITEFUNCTION, 0LL); }),
                    "options", "adapter-owned easy option accepted");
    ok = ok && check(throws<ConfigError>([&] { h.setOption(CURLOPT_PRIVATE, 0LL); }), "options",
                     "CURLOPT_PRIVATE accepted");
    ok = ok && check(throws<ConfigError>([&] { h.setOption(CURLOPT_URL, 1LL); }), "options",
                     "string option accepted an integer");
    ok = ok && check(throws<ConfigError>([&] { h.setOption(CURLOPT_TIMEOUT_MS, std::string("5")); }),
                     "options", "integer option accepted a string");
    ok = ok && check(throws<ConfigError>([&] { h.setOption(987654, 1LL); }), "options",
                     "unknown easy option accepted");

    // 요청 본문은 libcurl 이 복사하는 문자열로 넘길 수 있다(NUL 포함)
    h.setOption(CURLOPT_COPYPOSTFIELDS, std::string("a=1\0b=2", 7));
    ok = ok && check(throws<ConfigError>([&] { h.setOption(CURLOPT_COPYPOSTFIELDS, 1LL); }),
                     "options", "request body accepted an integer");

    h.setOption(CURLOPT_TIMEOUT_MS, 2000LL);
    h.setOption(CURLOPT_USERAGENT, std::string("curlmux-test/1.0"));
    h.addHeader("X-Test: 1");

    ok = ok && check(throws<ConfigError>([&] { mux.setOption(CURLMOPT_SOCKETFUNCTION, 0LL); }),
                     "options", "socket callback option accepted");
    ok = ok && check(throws<ConfigError>([&] { mux.setOption(CURLMOPT_TIMERFUNCTION, 0LL); }),
                     "options", "timer callback option accepted");
    ok = ok && check(throws<ConfigError>([&] { mux.setOption(CURLMOPT_SOCKETDATA, 0LL); }),
                     "options", "pointer multi option accepted");

    mux.setOption(CURLMOPT_MAXCONNECTS, 8LL);
    mux.setOption(CURLMOPT_MAX_TOTAL_CONNECTIONS, 4LL);
    return ok;
}

/// Multiplexer 를 닫으면 진행 중 전송은 nullptr 로 끝나고, handle 은 그 뒤에도 안전하게 정리된다.
bool test_close_with_transfers_in_flight()
{
    TempFile file("never read");
    if (!check(file.valid(), "close", "temp file creation failed"))
    {
        return false;
    }

    EventLoop loop;
    auto mux = std::make_unique<Multiplexer>(loop);
    TransferHandle h(*mux);
    h.setOption(CURLOPT_URL, file.url());
    TransferFuture f = h.perform();

    mux->close();
    bool ok = check(f.ready() && f.get() == nullptr, "close", "close must stop in-flight transfers");
    ok = ok && check(loop.watchedFdCount() == 0 && loop.pendingTimers() == 0, "close",
                     "close left scheduler registrations behind");

    h.close();
    mux.reset();
    return ok;
}

} // namespace

int main()
{
    bool ok = true;

    ok = ok && test_single_file_transfer();
    ok = ok && test_missing_file_fails();
    ok = ok && test_concurrent_transfers();
    ok = ok && test_stop_then_reuse();
    ok = ok && test_option_validation();
    ok = ok && test_close_with_transfers_in_flight();

    if (!ok)
    {
        std::cerr << "CurlMultiEngine tests FAILED\n";
        return 1;
    }

    std::cout << "CurlMultiEngine tests PASSED\n";
    return 0;
}
