#pragma once

#include <curlmux/core/GlobalConfig.hpp>

#include <string>
#include <string_view>

namespace curlmux::core
{

class ConfigLoader
{
  public:
    // Apps는 이 한 줄만 호출하면 됩니다: --config <path.toml> [url ...]
    static GlobalConfig load(int argc, char **argv);

    /// TOML 파일 하나를 읽어 검증까지 마친 설정을 돌려줍니다.
    static GlobalConfig loadFile(const std::string &path);

    /// TOML 문자열을 파싱합니다. (테스트/임베딩용)
    static GlobalConfig parse(std::string_view tomlText);
};

} // namespace curlmux::core
