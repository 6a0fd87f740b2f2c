#pragma once

#include <curlmux/core/GlobalConfig.hpp>
#include <curlmux/mux/PendingCompletion.hpp>

#include <cstddef>
#include <iosfwd>
#include <string>

namespace fetch
{

/// URL 목록을 한 이벤트 루프 위에서 동시에 받아 결과 한 줄씩 출력하는 앱입니다.
///
/// 출력: "<status> <url> <http code> <bytes>" (status: ok / failed / stopped / cancelled)
class FetchApplication final
{
  public:
    FetchApplication(curlmux::core::GlobalConfig cfg, std::ostream &out);

    /// 모든 전송이 해소될 때까지 루프를 돌린다.
    ///
    /// @return 전부 성공하면 0, 실패/취소가 하나라도 있으면 1
    int run();

  private:
    curlmux::core::GlobalConfig cfg_;
    std::ostream &out_;

    std::size_t settled_{0};
    std::size_t succeeded_{0};
    std::size_t unsuccessful_{0};

    void report_(const std::string &url, const curlmux::mux::TransferFuture &future);
};

} // namespace fetch
