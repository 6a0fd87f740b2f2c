#pragma once

#include <cstdint>
#include <functional>

namespace curlmux::net {

/// EventLoop 에 등록된 fd 하나의 방향별 watch 상태입니다.
///
/// - fd → {read 콜백, write 콜백, epoll 에 등록된 mask} 를 EventLoop 한 곳에서 관리한다.
/// - 두 콜백이 모두 비면 EventLoop 가 epoll 에서 fd 를 제거하고 컨텍스트를 지운다.
/// - 디스패치 시점에는 fd 로 컨텍스트를 다시 조회한다. 콜백 안에서 자기 자신이나 다른 fd 의
///   watch 를 지우는 일이 흔하다(libcurl 이 socket_action 도중 POLL_REMOVE 를 요청).
struct FdContext {
    int fd{-1};
    std::function<void()> onReadable;
    std::function<void()> onWritable;
    std::function<void()> onFailure; ///< 없으면 EPOLLERR 도 방향 콜백으로 전달
    std::uint32_t registeredEvents{0}; ///< epoll_ctl 에 등록된 events mask
    std::uint64_t generation{0};       ///< 재등록 구분용 (로그/디스패치 검증)
};

} // namespace curlmux::net
