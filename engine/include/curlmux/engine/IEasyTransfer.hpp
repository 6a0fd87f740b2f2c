#pragma once

#include <string>
#include <string_view>

namespace curlmux::engine
{

/// 전송 하나의 엔진 측 객체(libcurl easy handle)에 대한 설정/결과 façade 입니다.
///
/// - 값 타입은 정수(long / curl_off_t)와 문자열만 받는다. 어댑터가 직접 쓰는
///   옵션(private 포인터, write 콜백 등)은 ConfigError 로 거부한다.
/// - TransferHandle 이 소유하고, 제출 중에는 엔진이 비소유로 참조한다.
class IEasyTransfer
{
  public:
    virtual ~IEasyTransfer() = default;

    virtual void setOption(int option, long long value) = 0;
    virtual void setOption(int option, const std::string &value) = 0;

    /// 요청 헤더 한 줄("Name: value")을 추가합니다.
    virtual void addHeader(std::string_view line) = 0;

    [[nodiscard]] virtual long responseCode() const = 0;
    [[nodiscard]] virtual const std::string &responseBody() const noexcept = 0;
    [[nodiscard]] virtual std::string effectiveUrl() const = 0;
};

} // namespace curlmux::engine
