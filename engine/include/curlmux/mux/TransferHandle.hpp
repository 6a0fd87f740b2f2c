#pragma once

#include <curlmux/engine/IEasyTransfer.hpp>
#include <curlmux/mux/PendingCompletion.hpp>
#include <curlmux/util/NonCopyable.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace curlmux::mux
{

class Multiplexer;

enum class TransferState
{
    Idle,
    Submitted,
    Completed,
    Failed,
    Stopped,
    Cancelled,
    Closed
};

[[nodiscard]] const char *toString(TransferState s) noexcept;

/// 호출자가 소유하는 전송 하나입니다. (엔진 측 easy handle 을 소유)
///
/// - 생성 시 묶인 Multiplexer 로만 제출된다. 동시에 한 번만 진행할 수 있다.
/// - 해소된 뒤에는 reset() 전까지 다시 perform() 할 수 없다.
/// - close() 는 진행 중이면 stop 한 뒤 easy handle 을 놓는다. 소멸자도 close() 를 부른다.
/// - Multiplexer 가 먼저 닫혀도 안전하다(닫힐 때 모든 진행 중 전송을 stop 한다).
class TransferHandle : private curlmux::util::NonCopyable
{
  public:
    /// @throws StateError mux 가 이미 닫혀 있으면
    explicit TransferHandle(Multiplexer &mux);
    ~TransferHandle();

    TransferHandle(TransferHandle &&) = delete;
    TransferHandle &operator=(TransferHandle &&) = delete;

    /// Multiplexer 에 제출하고 결과 future 를 돌려줍니다.
    ///
    /// @throws StateError 진행 중, 해소 후 reset() 전, 또는 닫힌 handle
    TransferFuture perform();

    /// 진행 중이면 오류 없이 조기 종료한다(future 는 nullptr). 아니면 아무 일도 하지 않는다.
    void stop();

    /// 진행 중이면 취소한다(future 는 TransferCancelled). 아니면 아무 일도 하지 않는다.
    void cancel();

    void close() noexcept;

    /// 해소된 handle 을 Idle 로 되돌린다. 설정은 유지된다.
    void reset();

    [[nodiscard]] TransferState state() const noexcept;
    [[nodiscard]] bool inFlight() const noexcept { return state() == TransferState::Submitted; }
    [[nodiscard]] bool closed() const noexcept { return closed_; }

    // ===== 설정 pass-through (진행 중이거나 닫혀 있으면 StateError) =====
    void setOption(int option, long long value);
    void setOption(int option, const std::string &value);
    void addHeader(std::string_view line);

    [[nodiscard]] long responseCode() const;
    [[nodiscard]] const std::string &responseBody() const;
    [[nodiscard]] std::string effectiveUrl() const;

    /// 엔진이 제출/해제 시 사용하는 전송 객체. 닫혀 있으면 StateError.
    [[nodiscard]] engine::IEasyTransfer &transfer();
    [[nodiscard]] const engine::IEasyTransfer &transfer() const;

    [[nodiscard]] Multiplexer &multiplexer() const noexcept { return mux_; }

  private:
    friend class Multiplexer;

    Multiplexer &mux_;
    std::unique_ptr<engine::IEasyTransfer> transfer_;

    // 마지막 제출의 공유 상태. 없으면 Idle.
    std::shared_ptr<PendingCompletion> pending_;
    bool closed_{false};

    void requireConfigurable_(const char *api) const;
};

} // namespace curlmux::mux
