#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace curlmux::mux
{

/// 잘못된 설정 값/옵션. setOption, 설정 검증에서 동기적으로 던진다.
class ConfigError : public std::invalid_argument
{
  public:
    using std::invalid_argument::invalid_argument;
};

/// 상태 위반: 중복 제출, 닫힌 handle/Multiplexer 사용, 등록되지 않은 handle.
class StateError : public std::logic_error
{
  public:
    using std::logic_error::logic_error;
};

/// 엔진이 보고한 전송 실패. 해당 전송의 future 를 통해서만 전달된다.
class TransferError : public std::runtime_error
{
  public:
    TransferError(int code, const std::string &message)
        : std::runtime_error("transfer failed (code " + std::to_string(code) + "): " + message),
          code_(code), message_(message)
    {
    }

    [[nodiscard]] int code() const noexcept { return code_; }
    [[nodiscard]] const std::string &message() const noexcept { return message_; }

  private:
    int code_;
    std::string message_;
};

/// 취소 신호. 오류 값이 아니라 별도 채널이므로 std::exception 에서 바로 파생한다.
class TransferCancelled : public std::exception
{
  public:
    [[nodiscard]] const char *what() const noexcept override { return "transfer cancelled"; }
};

/// curl_multi_* / curl_easy_* 호출 자체의 실패
class EngineError : public std::runtime_error
{
  public:
    EngineError(int code, const std::string &what) : std::runtime_error(what), code_(code) {}

    [[nodiscard]] int code() const noexcept { return code_; }

  private:
    int code_;
};

} // namespace curlmux::mux
