#pragma once

#include "common/config.hpp"
#include "common/status_or.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace session_cache {
namespace common {

class ConfigLoader {
public:
    // 读取并解析配置文件, 失败时返回 ConfigurationError
    static StatusOr<AppConfig> Load(const std::string& path);
    static StatusOr<AppConfig> LoadFromEnvOrDefault();
    // 按 $SESSION_CACHE_CONFIG -> $SESSION_CACHE_HOME/conf -> ./conf 的顺序确定配置路径
    static std::string DetectConfigPath();

    static AppConfig FromJson(const nlohmann::json& j);
private:
    static nlohmann::json ReadFile(const std::string& path);
};

}
}
