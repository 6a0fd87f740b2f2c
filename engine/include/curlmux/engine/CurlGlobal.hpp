#pragma once

namespace curlmux::engine
{

/// curl_global_init(CURL_GLOBAL_DEFAULT) 를 프로세스당 한 번 수행합니다.
///
/// - 첫 호출은 다른 스레드가 없을 때(main 초기화 구간) 이뤄지는 것을 전제로 한다.
/// - 정리(curl_global_cleanup)는 정적 객체 소멸 시점에 한 번 수행된다.
/// @throws mux::EngineError 초기화 실패
void ensureCurlGlobalInit();

} // namespace curlmux::engine
