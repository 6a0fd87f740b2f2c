#pragma once

#include <curlmux/mux/TransferResult.hpp>
#include <curlmux/net/IReactorScheduler.hpp>
#include <curlmux/util/NonCopyable.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace curlmux::mux
{

/// 진행 중인 전송 하나의 단일 해소(single-resolution) 공유 상태입니다.
///
/// - resolve() 는 상태만 바꾼다. 대기 중인 continuation 은 스케줄러에 post 되어
///   다음 턴에 실행되며, resolve 하는 콜 스택에서 동기적으로 실행되지 않는다.
/// - 두 번째 resolve() 는 무시된다(false 반환).
class PendingCompletion : private curlmux::util::NonCopyable
{
  public:
    using Continuation = std::function<void()>;

    explicit PendingCompletion(net::IReactorScheduler &scheduler) noexcept
        : scheduler_(scheduler)
    {
    }

    bool resolve(TransferResult result);

    /// 해소되면 실행할 continuation 을 등록합니다. 이미 해소되었으면 바로 post 합니다.
    void onSettled(Continuation cont);

    [[nodiscard]] bool settled() const noexcept { return result_.has_value(); }

    /// 해소 전이면 StateError
    [[nodiscard]] const TransferResult &result() const;

  private:
    net::IReactorScheduler &scheduler_;
    std::optional<TransferResult> result_;
    std::vector<Continuation> waiters_;
};

/// 호출자가 보는 PendingCompletion 의 핸들 (복사 가능, 상태 공유)
class TransferFuture
{
  public:
    TransferFuture() = default;
    explicit TransferFuture(std::shared_ptr<PendingCompletion> state) noexcept
        : state_(std::move(state))
    {
    }

    [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(state_); }
    [[nodiscard]] bool ready() const noexcept { return state_ && state_->settled(); }

    /// 결과를 그대로 봅니다. 해소 전이면 StateError.
    [[nodiscard]] const TransferResult &result() const;

    /// 결과를 꺼냅니다.
    ///
    /// - Completed: 전송을 마친 handle
    /// - Stopped: nullptr
    /// - Failed: TransferError(code, message) 를 던진다
    /// - Cancelled: TransferCancelled 를 던진다
    /// - 아직 해소 전: StateError
    TransferHandle *get() const;

    /// 해소된 뒤 다음 턴에 cont(*this) 를 실행합니다.
    void then(std::function<void(const TransferFuture &)> cont) const;

  private:
    std::shared_ptr<PendingCompletion> state_;

    const PendingCompletion &stateOrThrow_() const;
};

} // namespace curlmux::mux
