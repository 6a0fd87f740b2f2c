#pragma once

#include <cstdint>

namespace curlmux::engine
{

/// 엔진이 watch 를 요청할 때 넘기는 비트마스크. 값은 libcurl 의 CURL_POLL_* 와 같다.
enum class WatchMask : int
{
    None = 0,
    In = 1,
    Out = 2,
    InOut = 3,
    Remove = 4
};

/// step() 에 넘기는 준비 방향. 값은 libcurl 의 CURL_CSELECT_* 와 같다.
/// None 은 타이머 만료(kTimeoutSocket)에 사용한다. Err 는 소켓 오류(EPOLLERR) 보고용.
enum class Direction : int
{
    None = 0,
    In = 1,
    Out = 2,
    Err = 4
};

/// 특정 소켓이 아니라 "타임아웃 처리" 를 뜻하는 의사 소켓 (CURL_SOCKET_TIMEOUT)
inline constexpr int kTimeoutSocket = -1;

/// onTimerArm 의 해제 센티널
inline constexpr long kDisarmTimer = -1;

[[nodiscard]] constexpr bool wantsRead(WatchMask mask) noexcept
{
    return (static_cast<int>(mask) & static_cast<int>(WatchMask::In)) != 0;
}

[[nodiscard]] constexpr bool wantsWrite(WatchMask mask) noexcept
{
    return (static_cast<int>(mask) & static_cast<int>(WatchMask::Out)) != 0;
}

[[nodiscard]] constexpr const char *toString(WatchMask mask) noexcept
{
    switch (mask)
    {
    case WatchMask::None:
        return "none";
    case WatchMask::In:
        return "in";
    case WatchMask::Out:
        return "out";
    case WatchMask::InOut:
        return "inout";
    case WatchMask::Remove:
        return "remove";
    }
    return "unknown";
}

/// 엔진 → 어댑터 방향의 두 콜백 계약입니다.
///
/// - 엔진은 addTransfer/removeTransfer/step 도중 동기적으로 이 메서드들을 부를 수 있다.
/// - 구현이 던진 예외는 엔진이 호출자에게 다시 전달해야 한다(삼키지 않는다).
class IEngineCallbacks
{
  public:
    virtual ~IEngineCallbacks() = default;

    /// socket 의 관심 방향이 mask 로 바뀌었다. Remove 면 더 이상 watch 하지 않는다.
    virtual void onSocketWatch(int socket, WatchMask mask) = 0;

    /// 공유 타이머를 timeoutMs 뒤로 다시 건다. kDisarmTimer 면 해제만 한다.
    virtual void onTimerArm(long timeoutMs) = 0;
};

} // namespace curlmux::engine
