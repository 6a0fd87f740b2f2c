#pragma once

namespace curlmux::util {

/// 복사를 금지하는 베이스 클래스입니다.
///
/// - EventLoop, Multiplexer, TransferHandle 처럼 "단일 소유" 자원(epoll fd, CURLM*, CURL*)을
///   감싸는 타입이 private 상속합니다.
/// - 이동 가능 여부는 파생 클래스가 결정합니다. (대부분 이동도 delete 합니다)
class NonCopyable {
  protected:
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &) = delete;
    NonCopyable &operator=(const NonCopyable &) = delete;

    NonCopyable(NonCopyable &&) = default;
    NonCopyable &operator=(NonCopyable &&) = default;
};

} // namespace curlmux::util
