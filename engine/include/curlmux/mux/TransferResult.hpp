#pragma once

#include <string>
#include <utility>

namespace curlmux::mux
{

class TransferHandle;

/// 전송 하나의 최종 결과 (PendingCompletion 이 한 번만 기록한다)
struct TransferResult
{
    enum class Status
    {
        Completed,
        Stopped,
        Failed,
        Cancelled
    };

    Status status{Status::Stopped};
    TransferHandle *handle{nullptr}; ///< Completed 일 때만 non-null
    int code{0};                     ///< Failed 일 때 엔진 오류 코드
    std::string message;             ///< Failed 일 때 엔진 메시지

    static TransferResult completed(TransferHandle *h) { return {Status::Completed, h, 0, {}}; }
    static TransferResult stopped() { return {Status::Stopped, nullptr, 0, {}}; }
    static TransferResult cancelled() { return {Status::Cancelled, nullptr, 0, {}}; }
    static TransferResult failed(int code, std::string message)
    {
        return {Status::Failed, nullptr, code, std::move(message)};
    }
};

[[nodiscard]] constexpr const char *toString(TransferResult::Status s) noexcept
{
    switch (s)
    {
    case TransferResult::Status::Completed:
        return "completed";
    case TransferResult::Status::Stopped:
        return "stopped";
    case TransferResult::Status::Failed:
        return "failed";
    case TransferResult::Status::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

} // namespace curlmux::mux
