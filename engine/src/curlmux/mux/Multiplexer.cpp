#include <curlmux/mux/Multiplexer.hpp>

#include <curlmux/core/Logger.hpp>
#include <curlmux/engine/CurlMultiEngine.hpp>
#include <curlmux/mux/Errors.hpp>

#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace curlmux::mux
{

Multiplexer::Multiplexer(net::IReactorScheduler &scheduler)
    : Multiplexer(scheduler, engine::CurlMultiEngine::factory())
{
}

Multiplexer::Multiplexer(net::IReactorScheduler &scheduler, const engine::EngineFactory &factory)
    : scheduler_(scheduler), bridge_(scheduler, *this)
{
    if (!factory)
    {
        throw ConfigError("Multiplexer requires an engine factory");
    }
    engine_ = factory(bridge_);
    if (!engine_)
    {
        throw ConfigError("Multiplexer engine factory returned null");
    }
    SLOG_INFO("Multiplexer", "Created", "mux={}", static_cast<const void *>(this));
}

Multiplexer::~Multiplexer()
{
    close();
}

void Multiplexer::requireOpen_(const char *api) const
{
    if (!engine_)
    {
        throw StateError(std::string("Multiplexer::") + api + " after close");
    }
}

engine::IMultiEngine &Multiplexer::engine()
{
    requireOpen_("engine");
    return *engine_;
}

bool Multiplexer::contains(const TransferHandle &handle) const noexcept
{
    return transfers_.count(const_cast<TransferHandle *>(&handle)) != 0;
}

void Multiplexer::setOption(int option, long long value)
{
    requireOpen_("setOption");
    if (engine_->isReservedOption(option))
    {
        throw ConfigError("multi option " + std::to_string(option) +
                          " is reserved for the event loop bridge");
    }
    engine_->setOption(option, value);
    SLOG_DEBUG("Multiplexer", "OptionSet", "option={} value={}", option, value);
}

TransferFuture Multiplexer::perform(TransferHandle &handle)
{
    requireOpen_("perform");

    if (&handle.mux_ != this)
    {
        throw StateError("TransferHandle belongs to a different Multiplexer");
    }
    if (contains(handle))
    {
        throw StateError("TransferHandle is already in flight");
    }
    const TransferState s = handle.state();
    if (s != TransferState::Idle)
    {
        throw StateError(std::string("TransferHandle cannot be performed in state ") +
                         toString(s));
    }

    auto pending = std::make_shared<PendingCompletion>(scheduler_);
    transfers_.emplace(&handle, pending);
    try
    {
        engine_->addTransfer(handle);
    }
    catch (const std::exception &e)
    {
        transfers_.erase(&handle);
        SLOG_WARN("Multiplexer", "SubmitFailed", "handle={} what='{}'",
                  static_cast<const void *>(&handle), e.what());
        throw;
    }

    handle.pending_ = pending;
    ++stats_.submitted;
    SLOG_DEBUG("Multiplexer", "Submitted", "handle={} in_flight={}",
               static_cast<const void *>(&handle), transfers_.size());
    return TransferFuture{std::move(pending)};
}

void Multiplexer::stop(TransferHandle &handle)
{
    finishEarly_(handle, TransferResult::stopped(), "stop");
    ++stats_.stopped;
}

void Multiplexer::cancel(TransferHandle &handle)
{
    finishEarly_(handle, TransferResult::cancelled(), "cancel");
    ++stats_.cancelled;
}

void Multiplexer::finishEarly_(TransferHandle &handle, TransferResult result, const char *api)
{
    requireOpen_(api);

    auto it = transfers_.find(&handle);
    if (it == transfers_.end())
    {
        throw StateError(std::string("Multiplexer::") + api + ": TransferHandle is not in flight");
    }

    // 엔진에서 먼저 떼어낸다. 이 안에서 watch 해제 콜백이 동기적으로 올 수 있다.
    engine_->removeTransfer(handle);

    auto pending = std::move(it->second);
    transfers_.erase(it);

    SLOG_DEBUG("Multiplexer", "FinishedEarly", "handle={} status={} in_flight={}",
               static_cast<const void *>(&handle), toString(result.status), transfers_.size());
    pending->resolve(std::move(result));
}

void Multiplexer::step(int socket, engine::Direction direction)
{
    if (!engine_)
    {
        SLOG_DEBUG("Multiplexer", "StepAfterClose", "fd={}", socket);
        return;
    }

    const int running = engine_->step(socket, direction);
    SLOG_TRACE("Multiplexer", "Step", "fd={} dir={} running={} in_flight={}", socket,
               static_cast<int>(direction), running, transfers_.size());

    if (running < 0 || static_cast<std::size_t>(running) != transfers_.size())
    {
        drain_();
    }
}

void Multiplexer::drain_()
{
    // 완료 큐가 빌 때까지 반복한다. 해소는 상태 갱신 + post 뿐이라 여기로 재진입하지 않는다.
    // 엔진 해제가 실패해도 나머지 완료는 계속 처리하고, 첫 예외만 루프가 끝난 뒤 다시 던진다.
    std::exception_ptr firstError;

    while (engine_)
    {
        std::optional<engine::Completion> completion = engine_->nextCompletion();
        if (!completion)
        {
            break;
        }

        TransferHandle *handle = completion->handle;
        auto it = transfers_.find(handle);
        if (it == transfers_.end())
        {
            SLOG_WARN("Multiplexer", "UnknownCompletion", "handle={} code={}",
                      static_cast<const void *>(handle), completion->code);
            if (handle)
            {
                detachCompleted_(*handle, firstError);
            }
            continue;
        }

        // 맵에서 먼저 빼야 해제가 실패해도 "맵에 있음 == 진행 중" 이 유지된다
        auto pending = std::move(it->second);
        transfers_.erase(it);
        detachCompleted_(*handle, firstError);

        if (completion->ok())
        {
            ++stats_.completed;
            SLOG_DEBUG("Multiplexer", "Completed", "handle={} in_flight={}",
                       static_cast<const void *>(handle), transfers_.size());
            pending->resolve(TransferResult::completed(handle));
        }
        else
        {
            ++stats_.failed;
            SLOG_INFO("Multiplexer", "Failed", "handle={} code={} msg='{}' in_flight={}",
                      static_cast<const void *>(handle), completion->code, completion->message,
                      transfers_.size());
            pending->resolve(
                TransferResult::failed(completion->code, std::move(completion->message)));
        }
    }

    if (firstError)
    {
        std::rethrow_exception(firstError);
    }
}

void Multiplexer::detachCompleted_(TransferHandle &handle, std::exception_ptr &firstError)
{
    try
    {
        engine_->removeTransfer(handle);
    }
    catch (const std::exception &e)
    {
        SLOG_ERROR("Multiplexer", "DetachFailed", "handle={} what='{}'",
                   static_cast<const void *>(&handle), e.what());
        if (!firstError)
        {
            firstError = std::current_exception();
        }
    }
}

void Multiplexer::close() noexcept
{
    if (!engine_)
    {
        return;
    }

    std::vector<TransferHandle *> snapshot;
    snapshot.reserve(transfers_.size());
    for (const auto &entry : transfers_)
    {
        snapshot.push_back(entry.first);
    }

    for (TransferHandle *handle : snapshot)
    {
        try
        {
            stop(*handle);
        }
        catch (const std::exception &e)
        {
            SLOG_ERROR("Multiplexer", "CloseStopFailed", "handle={} what='{}'",
                       static_cast<const void *>(handle), e.what());
            // 엔진이 거부해도 대기자는 nullptr 로 풀어 준다
            auto it = transfers_.find(handle);
            if (it != transfers_.end())
            {
                auto pending = std::move(it->second);
                transfers_.erase(it);
                pending->resolve(TransferResult::stopped());
                ++stats_.stopped;
            }
        }
    }

    // 엔진 해제 도중에도 브리지 콜백이 올 수 있으므로 브리지는 마지막에 정리한다
    engine_.reset();
    bridge_.releaseAll();

    SLOG_INFO("Multiplexer", "Closed",
              "submitted={} completed={} failed={} stopped={} cancelled={}", stats_.submitted,
              stats_.completed, stats_.failed, stats_.stopped, stats_.cancelled);
}

} // namespace curlmux::mux
