#include <curlmux/engine/CurlEasyTransfer.hpp>

#include <curlmux/core/Logger.hpp>
#include <curlmux/engine/CurlGlobal.hpp>
#include <curlmux/mux/Errors.hpp>

#include <limits>
#include <new>

namespace curlmux::engine
{

namespace
{
std::string optionLabel(int option)
{
    const curl_easyoption *info = curl_easy_option_by_id(static_cast<CURLoption>(option));
    if (info && info->name)
    {
        return std::string("CURLOPT_") + info->name;
    }
    return "option " + std::to_string(option);
}

void throwIfFailed(CURLcode rc, int option)
{
    if (rc != CURLE_OK)
    {
        throw mux::ConfigError(optionLabel(option) + ": " + curl_easy_strerror(rc));
    }
}
} // namespace

CurlEasyTransfer::CurlEasyTransfer()
{
    ensureCurlGlobalInit();

    easy_ = curl_easy_init();
    if (!easy_)
    {
        throw mux::EngineError(CURLE_FAILED_INIT, "curl_easy_init failed");
    }
}

CurlEasyTransfer::~CurlEasyTransfer()
{
    if (easy_)
    {
        curl_easy_cleanup(easy_);
        easy_ = nullptr;
    }
    if (headers_)
    {
        curl_slist_free_all(headers_);
        headers_ = nullptr;
    }
}

bool CurlEasyTransfer::isAdapterOwned_(int option) noexcept
{
    switch (option)
    {
    case CURLOPT_PRIVATE:
    case CURLOPT_WRITEFUNCTION:
    case CURLOPT_WRITEDATA:
    case CURLOPT_ERRORBUFFER:
    case CURLOPT_HTTPHEADER:
        return true;
    default:
        return false;
    }
}

void CurlEasyTransfer::setOption(int option, long long value)
{
    if (isAdapterOwned_(option))
    {
        throw mux::ConfigError(optionLabel(option) + " is reserved by the transfer adapter");
    }

    const curl_easyoption *info = curl_easy_option_by_id(static_cast<CURLoption>(option));
    if (!info)
    {
        throw mux::ConfigError("unknown easy option " + std::to_string(option));
    }

    const auto opt = static_cast<CURLoption>(option);
    switch (info->type)
    {
    case CURLOT_LONG:
    case CURLOT_VALUES:
        if (value < std::numeric_limits<long>::min() || value > std::numeric_limits<long>::max())
        {
            throw mux::ConfigError(optionLabel(option) + ": value out of range for long");
        }
        throwIfFailed(curl_easy_setopt(easy_, opt, static_cast<long>(value)), option);
        break;
    case CURLOT_OFF_T:
        throwIfFailed(curl_easy_setopt(easy_, opt, static_cast<curl_off_t>(value)), option);
        break;
    default:
        throw mux::ConfigError(optionLabel(option) + " does not take an integer value");
    }
}

void CurlEasyTransfer::setOption(int option, const std::string &value)
{
    if (isAdapterOwned_(option))
    {
        throw mux::ConfigError(optionLabel(option) + " is reserved by the transfer adapter");
    }

    const curl_easyoption *info = curl_easy_option_by_id(static_cast<CURLoption>(option));
    if (!info)
    {
        throw mux::ConfigError("unknown easy option " + std::to_string(option));
    }

    // 요청 본문: OBJECT 타입이지만 libcurl 이 값을 복사하므로 문자열로 받는다.
    // 크기를 먼저 지정해 두면 본문 안의 NUL 도 그대로 전달된다.
    if (option == CURLOPT_COPYPOSTFIELDS)
    {
        throwIfFailed(curl_easy_setopt(easy_, CURLOPT_POSTFIELDSIZE_LARGE,
                                       static_cast<curl_off_t>(value.size())),
                      CURLOPT_POSTFIELDSIZE_LARGE);
        throwIfFailed(curl_easy_setopt(easy_, CURLOPT_COPYPOSTFIELDS, value.data()), option);
        return;
    }

    if (info->type != CURLOT_STRING)
    {
        throw mux::ConfigError(optionLabel(option) + " does not take a string value");
    }

    // libcurl 은 문자열 옵션을 복사해 둔다
    throwIfFailed(curl_easy_setopt(easy_, static_cast<CURLoption>(option), value.c_str()),
                  option);
}

void CurlEasyTransfer::addHeader(std::string_view line)
{
    const std::string copy(line);
    curl_slist *next = curl_slist_append(headers_, copy.c_str());
    if (!next)
    {
        throw std::bad_alloc();
    }
    headers_ = next;
}

void CurlEasyTransfer::prepareForSubmit(void *owner)
{
    body_.clear();
    errorBuffer_[0] = '\0';

    CURLcode rc = curl_easy_setopt(easy_, CURLOPT_PRIVATE, owner);
    if (rc == CURLE_OK)
    {
        rc = curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &CurlEasyTransfer::writeCallback);
    }
    if (rc == CURLE_OK)
    {
        rc = curl_easy_setopt(easy_, CURLOPT_WRITEDATA, static_cast<void *>(this));
    }
    if (rc == CURLE_OK)
    {
        rc = curl_easy_setopt(easy_, CURLOPT_ERRORBUFFER, errorBuffer_.data());
    }
    if (rc == CURLE_OK)
    {
        rc = curl_easy_setopt(easy_, CURLOPT_HTTPHEADER, headers_);
    }
    if (rc != CURLE_OK)
    {
        throw mux::EngineError(rc, std::string("prepare easy handle: ") + curl_easy_strerror(rc));
    }
}

std::size_t CurlEasyTransfer::writeCallback(char *data, std::size_t size, std::size_t nmemb,
                                            void *userp) noexcept
{
    auto *self = static_cast<CurlEasyTransfer *>(userp);
    const std::size_t n = size * nmemb;
    try
    {
        self->body_.append(data, n);
    }
    catch (const std::bad_alloc &)
    {
        // n 이 아닌 값을 돌려주면 libcurl 이 CURLE_WRITE_ERROR 로 전송을 실패시킨다
        SLOG_ERROR("CurlEasyTransfer", "WriteAllocFailed", "bytes={} buffered={}", n,
                   self->body_.size());
        return 0;
    }
    return n;
}

long CurlEasyTransfer::responseCode() const
{
    long code = 0;
    const CURLcode rc = curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &code);
    if (rc != CURLE_OK)
    {
        throw mux::EngineError(rc, std::string("CURLINFO_RESPONSE_CODE: ") +
                                       curl_easy_strerror(rc));
    }
    return code;
}

std::string CurlEasyTransfer::effectiveUrl() const
{
    char *url = nullptr;
    const CURLcode rc = curl_easy_getinfo(easy_, CURLINFO_EFFECTIVE_URL, &url);
    if (rc != CURLE_OK)
    {
        throw mux::EngineError(rc, std::string("CURLINFO_EFFECTIVE_URL: ") +
                                       curl_easy_strerror(rc));
    }
    return url ? std::string(url) : std::string{};
}

std::string CurlEasyTransfer::errorMessage(int code) const
{
    if (errorBuffer_[0] != '\0')
    {
        return std::string(errorBuffer_.data());
    }
    return curl_easy_strerror(static_cast<CURLcode>(code));
}

} // namespace curlmux::engine
