#include <curlmux/engine/CurlMultiEngine.hpp>

#include <curlmux/core/Logger.hpp>
#include <curlmux/engine/CurlGlobal.hpp>
#include <curlmux/mux/Errors.hpp>
#include <curlmux/mux/TransferHandle.hpp>

#include <limits>
#include <string>
#include <utility>

namespace curlmux::engine
{

static_assert(static_cast<int>(WatchMask::In) == CURL_POLL_IN);
static_assert(static_cast<int>(WatchMask::Out) == CURL_POLL_OUT);
static_assert(static_cast<int>(WatchMask::InOut) == CURL_POLL_INOUT);
static_assert(static_cast<int>(WatchMask::Remove) == CURL_POLL_REMOVE);
static_assert(static_cast<int>(Direction::In) == CURL_CSELECT_IN);
static_assert(static_cast<int>(Direction::Out) == CURL_CSELECT_OUT);
static_assert(static_cast<int>(Direction::Err) == CURL_CSELECT_ERR);
static_assert(kTimeoutSocket == CURL_SOCKET_TIMEOUT);

namespace
{
[[noreturn]] void throwMultiError(CURLMcode rc, const char *what)
{
    throw mux::EngineError(static_cast<int>(rc),
                           std::string(what) + " failed: " + curl_multi_strerror(rc));
}
} // namespace

CurlMultiEngine::CurlMultiEngine(IEngineCallbacks &callbacks) : callbacks_(callbacks)
{
    ensureCurlGlobalInit();

    multi_ = curl_multi_init();
    if (!multi_)
    {
        throw mux::EngineError(CURLM_OUT_OF_MEMORY, "curl_multi_init failed");
    }

    CURLMcode rc = curl_multi_setopt(multi_, CURLMOPT_SOCKETFUNCTION,
                                     &CurlMultiEngine::socketTrampoline);
    if (rc == CURLM_OK)
    {
        rc = curl_multi_setopt(multi_, CURLMOPT_SOCKETDATA, static_cast<void *>(this));
    }
    if (rc == CURLM_OK)
    {
        rc = curl_multi_setopt(multi_, CURLMOPT_TIMERFUNCTION, &CurlMultiEngine::timerTrampoline);
    }
    if (rc == CURLM_OK)
    {
        rc = curl_multi_setopt(multi_, CURLMOPT_TIMERDATA, static_cast<void *>(this));
    }
    if (rc != CURLM_OK)
    {
        curl_multi_cleanup(multi_);
        multi_ = nullptr;
        throwMultiError(rc, "install multi callbacks");
    }

    SLOG_DEBUG("CurlMultiEngine", "Created", "multi={}", static_cast<const void *>(multi_));
}

CurlMultiEngine::~CurlMultiEngine()
{
    if (!multi_)
    {
        return;
    }

    if (!attached_.empty())
    {
        SLOG_WARN("CurlMultiEngine", "DestroyedWithTransfers", "attached={}", attached_.size());
        for (const auto &entry : attached_)
        {
            (void)curl_multi_remove_handle(multi_, entry.second->native());
        }
        attached_.clear();
    }

    const CURLMcode rc = curl_multi_cleanup(multi_);
    multi_ = nullptr;
    if (rc != CURLM_OK)
    {
        SLOG_WARN("CurlMultiEngine", "CleanupFailed", "code={} msg='{}'", static_cast<int>(rc),
                  curl_multi_strerror(rc));
    }

    if (callbackError_)
    {
        // 소멸 중에는 다시 던질 곳이 없다
        try
        {
            std::rethrow_exception(std::exchange(callbackError_, nullptr));
        }
        catch (const std::exception &e)
        {
            SLOG_WARN("CurlMultiEngine", "CallbackErrorOnCleanup", "what='{}'", e.what());
        }
    }
}

EngineFactory CurlMultiEngine::factory()
{
    return [](IEngineCallbacks &callbacks) -> std::unique_ptr<IMultiEngine> {
        return std::make_unique<CurlMultiEngine>(callbacks);
    };
}

std::unique_ptr<IEasyTransfer> CurlMultiEngine::createTransfer()
{
    return std::make_unique<CurlEasyTransfer>();
}

void CurlMultiEngine::rethrowCallbackError_()
{
    if (callbackError_)
    {
        std::rethrow_exception(std::exchange(callbackError_, nullptr));
    }
}

void CurlMultiEngine::addTransfer(mux::TransferHandle &handle)
{
    auto *easy = dynamic_cast<CurlEasyTransfer *>(&handle.transfer());
    if (!easy)
    {
        throw mux::StateError("transfer was not created by CurlMultiEngine");
    }
    if (attached_.count(&handle) != 0)
    {
        throw mux::StateError("transfer is already attached to this multi handle");
    }

    easy->prepareForSubmit(&handle);

    const CURLMcode rc = curl_multi_add_handle(multi_, easy->native());
    if (rc == CURLM_OK && callbackError_)
    {
        // 추가 도중 브리지가 실패했다. 붙이지 않은 상태로 되돌리고 원래 예외를 던진다.
        auto error = std::exchange(callbackError_, nullptr);
        (void)curl_multi_remove_handle(multi_, easy->native());
        callbackError_ = nullptr;
        std::rethrow_exception(error);
    }
    rethrowCallbackError_();
    if (rc != CURLM_OK)
    {
        throwMultiError(rc, "curl_multi_add_handle");
    }

    attached_.emplace(&handle, easy);
    SLOG_TRACE("CurlMultiEngine", "Added", "handle={} attached={}",
               static_cast<const void *>(&handle), attached_.size());
}

void CurlMultiEngine::removeTransfer(mux::TransferHandle &handle)
{
    auto it = attached_.find(&handle);
    if (it == attached_.end())
    {
        SLOG_DEBUG("CurlMultiEngine", "RemoveUnknown", "handle={}",
                   static_cast<const void *>(&handle));
        return;
    }

    CurlEasyTransfer *easy = it->second;
    attached_.erase(it);

    const CURLMcode rc = curl_multi_remove_handle(multi_, easy->native());
    rethrowCallbackError_();
    if (rc != CURLM_OK)
    {
        throwMultiError(rc, "curl_multi_remove_handle");
    }
    SLOG_TRACE("CurlMultiEngine", "Removed", "handle={} attached={}",
               static_cast<const void *>(&handle), attached_.size());
}

int CurlMultiEngine::step(int socket, Direction direction)
{
    int running = 0;
    const CURLMcode rc = curl_multi_socket_action(multi_, static_cast<curl_socket_t>(socket),
                                                  static_cast<int>(direction), &running);
    rethrowCallbackError_();
    if (rc != CURLM_OK)
    {
        throwMultiError(rc, "curl_multi_socket_action");
    }
    return running;
}

std::optional<Completion> CurlMultiEngine::nextCompletion()
{
    int queued = 0;
    while (CURLMsg *msg = curl_multi_info_read(multi_, &queued))
    {
        if (msg->msg != CURLMSG_DONE)
        {
            continue;
        }

        char *priv = nullptr;
        (void)curl_easy_getinfo(msg->easy_handle, CURLINFO_PRIVATE, &priv);

        Completion completion;
        completion.handle = reinterpret_cast<mux::TransferHandle *>(priv);
        completion.code = static_cast<int>(msg->data.result);
        if (!completion.ok())
        {
            auto it = attached_.find(completion.handle);
            completion.message = (it != attached_.end())
                                     ? it->second->errorMessage(completion.code)
                                     : std::string(curl_easy_strerror(msg->data.result));
        }
        return completion;
    }
    return std::nullopt;
}

bool CurlMultiEngine::isReservedOption(int option) const noexcept
{
    return option == CURLMOPT_SOCKETFUNCTION || option == CURLMOPT_TIMERFUNCTION;
}

void CurlMultiEngine::setOption(int option, long long value)
{
    if (isReservedOption(option))
    {
        throw mux::ConfigError("multi option " + std::to_string(option) +
                               " is reserved for the event loop bridge");
    }
    // multi 옵션 번호 대역: 0.. long, 10000.. 객체 포인터, 20000.. 함수 포인터
    if (option < 0 || option >= CURLOPTTYPE_OBJECTPOINT)
    {
        throw mux::ConfigError("multi option " + std::to_string(option) +
                               " does not take an integer value");
    }
    if (value < std::numeric_limits<long>::min() || value > std::numeric_limits<long>::max())
    {
        throw mux::ConfigError("multi option " + std::to_string(option) +
                               ": value out of range for long");
    }

    const CURLMcode rc =
        curl_multi_setopt(multi_, static_cast<CURLMoption>(option), static_cast<long>(value));
    if (rc != CURLM_OK)
    {
        throw mux::ConfigError("multi option " + std::to_string(option) + ": " +
                               curl_multi_strerror(rc));
    }
}

int CurlMultiEngine::socketTrampoline(CURL * /*easy*/, curl_socket_t s, int what, void *userp,
                                      void * /*socketp*/) noexcept
{
    auto *self = static_cast<CurlMultiEngine *>(userp);
    try
    {
        self->callbacks_.onSocketWatch(static_cast<int>(s), static_cast<WatchMask>(what));
        return 0;
    }
    catch (...)
    {
        // C 경계 너머로 예외를 넘기지 않는다. curl 호출이 반환된 뒤 다시 던진다.
        if (!self->callbackError_)
        {
            self->callbackError_ = std::current_exception();
        }
        return -1;
    }
}

int CurlMultiEngine::timerTrampoline(CURLM * /*multi*/, long timeoutMs, void *userp) noexcept
{
    auto *self = static_cast<CurlMultiEngine *>(userp);
    try
    {
        self->callbacks_.onTimerArm(timeoutMs);
        return 0;
    }
    catch (...)
    {
        if (!self->callbackError_)
        {
            self->callbackError_ = std::current_exception();
        }
        return -1;
    }
}

} // namespace curlmux::engine
