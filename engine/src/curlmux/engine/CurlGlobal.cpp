#include <curlmux/engine/CurlGlobal.hpp>

#include <curlmux/core/Logger.hpp>
#include <curlmux/mux/Errors.hpp>

#include <curl/curl.h>

#include <string>

namespace curlmux::engine
{

namespace
{
class CurlGlobal
{
  public:
    CurlGlobal()
    {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK)
        {
            throw mux::EngineError(rc, std::string("curl_global_init failed: ") +
                                           curl_easy_strerror(rc));
        }
        const curl_version_info_data *info = curl_version_info(CURLVERSION_NOW);
        SLOG_INFO("Curl", "GlobalInit", "version={} ssl='{}'", info ? info->version : "?",
                  (info && info->ssl_version) ? info->ssl_version : "none");
    }

    ~CurlGlobal() { curl_global_cleanup(); }

    CurlGlobal(const CurlGlobal &) = delete;
    CurlGlobal &operator=(const CurlGlobal &) = delete;
};
} // namespace

void ensureCurlGlobalInit()
{
    // 생성자가 던지면 다음 호출에서 다시 시도된다
    static const CurlGlobal global;
    (void)global;
}

} // namespace curlmux::engine
