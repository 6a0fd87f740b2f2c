#pragma once

#include <curlmux/util/NonCopyable.hpp>

#include <array>
#include <csignal> // std::sig_atomic_t
#include <string_view>

#include <signal.h> // sigaction, SIGINT, SIGTERM

namespace curlmux::core
{

/// SIGINT/SIGTERM 을 플래그로만 기록하는 핸들러입니다.
///
/// - 핸들러 안에서는 플래그만 세운다. 실제 처리(진행 중 전송 취소 등)는 이벤트 루프가
///   다음 턴에 consumeStopRequest() 로 관측해서 수행한다.
/// - 프로세스 전역 상태이므로 인스턴스는 하나만 둔다.
class SignalHandler : private curlmux::util::NonCopyable
{
  public:
    /// @throws std::system_error sigaction 실패
    SignalHandler();

    /// 설치 전 핸들러로 되돌립니다. (best-effort)
    ~SignalHandler() noexcept;

    SignalHandler(SignalHandler &&) = delete;
    SignalHandler &operator=(SignalHandler &&) = delete;

    [[nodiscard]] bool isStopRequested() const noexcept;

    /// 요청이 있었으면 플래그를 내리고 true. outSignal 에 마지막 신호 번호를 돌려준다.
    bool consumeStopRequest(int *outSignal = nullptr) noexcept;

    /// 플래그를 지웁니다. (테스트용)
    void reset() noexcept;

    [[nodiscard]] static std::string_view signalName(int signo) noexcept;

  private:
    static void handleSignal(int signo) noexcept;

    static constexpr std::array<int, 2> kSignals = {SIGINT, SIGTERM};

    std::array<struct sigaction, kSignals.size()> oldActions_{};
    bool installed_{false};

    void installOrThrow();
    void uninstall() noexcept;
};

} // namespace curlmux::core
