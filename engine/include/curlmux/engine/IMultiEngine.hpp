#pragma once

#include <curlmux/engine/IEasyTransfer.hpp>
#include <curlmux/engine/IEngineCallbacks.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace curlmux::mux
{
class TransferHandle;
}

namespace curlmux::engine
{

/// 엔진이 보고한 완료(성공 또는 실패) 하나
struct Completion
{
    mux::TransferHandle *handle{nullptr};
    int code{0};         ///< 0 이면 성공, 아니면 엔진 오류 코드(CURLcode)
    std::string message; ///< 실패 시 사람이 읽을 메시지

    [[nodiscard]] bool ok() const noexcept { return code == 0; }
};

/// 다중 전송 엔진(libcurl multi handle) 추상화입니다.
///
/// Multiplexer 가 단독으로 소유한다. 콜백 대상(IEngineCallbacks)은 생성 시 고정되며,
/// 엔진은 아래 호출 도중 그 콜백을 동기적으로 부를 수 있다.
/// 엔진 호출 실패는 EngineError 로 던진다.
class IMultiEngine
{
  public:
    virtual ~IMultiEngine() = default;

    /// 이 엔진에 제출할 수 있는 새 전송 객체
    [[nodiscard]] virtual std::unique_ptr<IEasyTransfer> createTransfer() = 0;

    virtual void addTransfer(mux::TransferHandle &handle) = 0;

    /// 붙어 있지 않은 handle 이면 아무 일도 하지 않는다.
    virtual void removeTransfer(mux::TransferHandle &handle) = 0;

    /// socket 의 준비(또는 kTimeoutSocket 의 타임아웃)를 엔진에 알리고,
    /// 아직 진행 중인 전송 수(running count)를 돌려줍니다.
    virtual int step(int socket, Direction direction) = 0;

    /// 완료 큐에서 하나를 꺼냅니다. 비었으면 std::nullopt.
    [[nodiscard]] virtual std::optional<Completion> nextCompletion() = 0;

    virtual void setOption(int option, long long value) = 0;

    /// 브리지가 점유한 콜백 등록 옵션이면 true
    [[nodiscard]] virtual bool isReservedOption(int option) const noexcept = 0;
};

using EngineFactory = std::function<std::unique_ptr<IMultiEngine>(IEngineCallbacks &)>;

} // namespace curlmux::engine
