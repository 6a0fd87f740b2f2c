#pragma once

#include <curlmux/engine/IMultiEngine.hpp>
#include <curlmux/mux/PendingCompletion.hpp>
#include <curlmux/mux/SocketTimerBridge.hpp>
#include <curlmux/mux/TransferHandle.hpp>
#include <curlmux/net/IReactorScheduler.hpp>
#include <curlmux/util/NonCopyable.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <unordered_map>

namespace curlmux::mux
{

/// 누적 카운터 (로그/CLI 요약용)
struct MuxStats
{
    std::uint64_t submitted{0};
    std::uint64_t completed{0};
    std::uint64_t failed{0};
    std::uint64_t stopped{0};
    std::uint64_t cancelled{0};
};

/// 다중 전송 엔진 하나를 단일 스레드 스케줄러 위에서 돌리는 어댑터입니다.
///
/// - 엔진의 socket/timer 콜백은 SocketTimerBridge 가 스케줄러 등록으로 옮긴다.
/// - 스케줄러의 준비/타이머 이벤트는 step() 으로 들어와 엔진을 진행시키고,
///   running count 가 진행 중 map 크기와 다르면 완료 큐를 drain 해서 future 를 해소한다.
/// - 진행 중 map: 제출되었고 아직 해소되지 않은 handle → 공유 상태.
///   drain 직후 map 크기 == 엔진의 running count.
/// - 모든 호출은 스케줄러 owner thread 에서만.
class Multiplexer : private curlmux::util::NonCopyable
{
  public:
    /// libcurl multi 엔진으로 생성합니다.
    explicit Multiplexer(net::IReactorScheduler &scheduler);

    /// 임의의 엔진으로 생성합니다. factory 는 이 Multiplexer 의 브리지를 콜백 대상으로 받는다.
    Multiplexer(net::IReactorScheduler &scheduler, const engine::EngineFactory &factory);

    ~Multiplexer();

    Multiplexer(Multiplexer &&) = delete;
    Multiplexer &operator=(Multiplexer &&) = delete;

    /// 엔진 옵션 pass-through. 브리지가 점유한 콜백 옵션은 ConfigError.
    void setOption(int option, long long value);

    /// handle 을 제출합니다. 엔진은 이 호출 안에서 watch/timer 를 요청할 수 있다.
    ///
    /// @throws StateError 이미 진행 중, 해소 후 reset() 전, 닫힌 handle/Multiplexer,
    ///         다른 Multiplexer 의 handle
    TransferFuture perform(TransferHandle &handle);

    /// @throws StateError 진행 중이 아닌 handle
    void stop(TransferHandle &handle);
    void cancel(TransferHandle &handle);

    /// 진행 중 전송을 모두 stop(nullptr 로 해소)하고 엔진을 해제합니다. 멱등.
    void close() noexcept;

    /// 준비된 socket(또는 kTimeoutSocket)으로 엔진을 진행시키고 필요하면 drain 합니다.
    /// 닫힌 뒤 늦게 도착한 이벤트는 무시한다.
    void step(int socket, engine::Direction direction);

    [[nodiscard]] bool closed() const noexcept { return !engine_; }
    [[nodiscard]] std::size_t inFlightCount() const noexcept { return transfers_.size(); }
    [[nodiscard]] bool contains(const TransferHandle &handle) const noexcept;
    [[nodiscard]] const MuxStats &stats() const noexcept { return stats_; }
    [[nodiscard]] net::IReactorScheduler &scheduler() const noexcept { return scheduler_; }
    [[nodiscard]] const SocketTimerBridge &bridge() const noexcept { return bridge_; }

    /// @throws StateError 닫혀 있으면
    [[nodiscard]] engine::IMultiEngine &engine();

  private:
    net::IReactorScheduler &scheduler_;
    SocketTimerBridge bridge_;
    std::unique_ptr<engine::IMultiEngine> engine_;

    std::unordered_map<TransferHandle *, std::shared_ptr<PendingCompletion>> transfers_;
    MuxStats stats_{};

    void requireOpen_(const char *api) const;
    void finishEarly_(TransferHandle &handle, TransferResult result, const char *api);
    void drain_();
    void detachCompleted_(TransferHandle &handle, std::exception_ptr &firstError);
};

} // namespace curlmux::mux
