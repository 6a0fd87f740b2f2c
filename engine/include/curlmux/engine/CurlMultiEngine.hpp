#pragma once

#include <curlmux/engine/CurlEasyTransfer.hpp>
#include <curlmux/engine/IMultiEngine.hpp>
#include <curlmux/util/NonCopyable.hpp>

#include <curl/curl.h>

#include <exception>
#include <unordered_map>

namespace curlmux::engine
{

/// libcurl multi handle 을 소유하는 IMultiEngine 구현입니다.
///
/// - CURLMOPT_SOCKETFUNCTION / CURLMOPT_TIMERFUNCTION 은 생성 시 정적 trampoline 으로
///   설치되며, 두 옵션은 예약되어 setOption 으로 바꿀 수 없다.
/// - trampoline 은 C 경계를 넘기 전에 콜백 예외를 잡아 libcurl 에 -1 을 돌려주고,
///   해당 curl_multi_* 호출이 반환된 뒤 같은 예외를 다시 던진다.
/// - 붙어 있는 전송은 handle 포인터로 추적한다. 해제 시 handle 을 역참조하지 않는다.
class CurlMultiEngine final : public IMultiEngine, private curlmux::util::NonCopyable
{
  public:
    /// @throws mux::EngineError curl_multi_init / 콜백 설치 실패
    explicit CurlMultiEngine(IEngineCallbacks &callbacks);
    ~CurlMultiEngine() override;

    CurlMultiEngine(CurlMultiEngine &&) = delete;
    CurlMultiEngine &operator=(CurlMultiEngine &&) = delete;

    [[nodiscard]] std::unique_ptr<IEasyTransfer> createTransfer() override;

    void addTransfer(mux::TransferHandle &handle) override;
    void removeTransfer(mux::TransferHandle &handle) override;

    int step(int socket, Direction direction) override;
    [[nodiscard]] std::optional<Completion> nextCompletion() override;

    /// long 값을 받는 multi 옵션만 허용한다(포인터/함수/객체 옵션은 ConfigError).
    void setOption(int option, long long value) override;
    [[nodiscard]] bool isReservedOption(int option) const noexcept override;

    [[nodiscard]] std::size_t attachedCount() const noexcept { return attached_.size(); }

    static EngineFactory factory();

  private:
    IEngineCallbacks &callbacks_;
    CURLM *multi_{nullptr};

    std::unordered_map<mux::TransferHandle *, CurlEasyTransfer *> attached_;

    // trampoline 이 잡아 둔 콜백 예외 (curl 호출이 반환된 뒤 다시 던진다)
    std::exception_ptr callbackError_;

    void rethrowCallbackError_();

    static int socketTrampoline(CURL *easy, curl_socket_t s, int what, void *userp,
                                void *socketp) noexcept;
    static int timerTrampoline(CURLM *multi, long timeoutMs, void *userp) noexcept;
};

} // namespace curlmux::engine
