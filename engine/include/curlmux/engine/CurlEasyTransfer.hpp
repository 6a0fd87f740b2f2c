#pragma once

#include <curlmux/engine/IEasyTransfer.hpp>
#include <curlmux/util/NonCopyable.hpp>

#include <curl/curl.h>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace curlmux::engine
{

/// libcurl easy handle 하나를 소유하는 IEasyTransfer 구현입니다.
///
/// - 응답 본문은 내부 버퍼에 모은다(write 콜백은 어댑터 전용).
/// - CURLOPT_PRIVATE / WRITEFUNCTION / WRITEDATA / ERRORBUFFER / HTTPHEADER 는
///   어댑터가 쓰므로 setOption 으로 바꿀 수 없다(ConfigError).
/// - 옵션 값 타입은 curl_easy_option_by_id 로 확인해 long / curl_off_t / 문자열만 받는다.
class CurlEasyTransfer final : public IEasyTransfer, private curlmux::util::NonCopyable
{
  public:
    /// @throws mux::EngineError curl_easy_init 실패
    CurlEasyTransfer();
    ~CurlEasyTransfer() override;

    CurlEasyTransfer(CurlEasyTransfer &&) = delete;
    CurlEasyTransfer &operator=(CurlEasyTransfer &&) = delete;

    void setOption(int option, long long value) override;
    void setOption(int option, const std::string &value) override;
    void addHeader(std::string_view line) override;

    [[nodiscard]] long responseCode() const override;
    [[nodiscard]] const std::string &responseBody() const noexcept override { return body_; }
    [[nodiscard]] std::string effectiveUrl() const override;

    /// 제출 직전에 CurlMultiEngine 이 호출합니다: 응답 버퍼를 비우고
    /// private 포인터(owner), write 콜백, 헤더 목록을 다시 설치한다.
    void prepareForSubmit(void *owner);

    /// 실패 코드에 대한 메시지. 에러 버퍼가 채워져 있으면 그 내용을 쓴다.
    [[nodiscard]] std::string errorMessage(int code) const;

    [[nodiscard]] CURL *native() const noexcept { return easy_; }

  private:
    CURL *easy_{nullptr};
    curl_slist *headers_{nullptr};
    std::string body_;
    std::array<char, CURL_ERROR_SIZE> errorBuffer_{};

    static std::size_t writeCallback(char *data, std::size_t size, std::size_t nmemb,
                                     void *userp) noexcept;

    static bool isAdapterOwned_(int option) noexcept;
};

} // namespace curlmux::engine
