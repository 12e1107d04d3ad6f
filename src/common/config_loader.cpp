#include "common/config_loader.hpp"

#include "common/errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace session_cache {
namespace common {

namespace {

constexpr const char* kConfigEnv = "SESSION_CACHE_CONFIG";
constexpr const char* kHomeEnv = "SESSION_CACHE_HOME";
constexpr const char* kConfigFile = "session_cache.json";

} // namespace

std::string ConfigLoader::DetectConfigPath() {
    if (const char* env = std::getenv(kConfigEnv)) {
        if (*env != '\0') {
            return env;
        }
    }
    if (const char* home = std::getenv(kHomeEnv)) {
        std::filesystem::path candidate = std::filesystem::path(home) / "conf" / kConfigFile;
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec)) {
            return candidate.string();
        }
    }
    return (std::filesystem::path("conf") / kConfigFile).string();
}

StatusOr<AppConfig> ConfigLoader::Load(const std::string& path) {
    try {
        auto json = ReadFile(path);
        return StatusOr<AppConfig>(FromJson(json));
    } catch (const nlohmann::json::exception& ex) {
        return FromCacheError(CacheErrorCode::kConfiguration,
                              "Invalid config file " + path + ": " + ex.what());
    } catch (const std::runtime_error& ex) {
        return FromCacheError(CacheErrorCode::kConfiguration, ex.what());
    }
}

StatusOr<AppConfig> ConfigLoader::LoadFromEnvOrDefault() {
    return Load(DetectConfigPath());
}

nlohmann::json ConfigLoader::ReadFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    return nlohmann::json::parse(ifs, nullptr, true, true);
}

// 从JSON对象构建配置结构体
AppConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    AppConfig cfg;
    // Logging配置
    if (j.contains("logging")) {
        const auto& logging = j["logging"];
        cfg.logging.level = logging.value("level", cfg.logging.level);
        cfg.logging.pattern = logging.value("pattern", cfg.logging.pattern);
        cfg.logging.console = logging.value("console", cfg.logging.console);
        cfg.logging.file = logging.value("file", cfg.logging.file);
    }
    // Redis配置
    if (j.contains("redis")) {
        const auto& redis = j["redis"];
        auto& r = cfg.redis;
        r.cluster_enabled = redis.value("cluster_enabled", r.cluster_enabled);
        r.hosts = redis.value("hosts", r.hosts);
        r.password = redis.value("password", r.password);
        r.database = redis.value("database", r.database);
        r.timeout_ms = redis.value("timeout_ms", r.timeout_ms);
        r.max_active = redis.value("max_active", r.max_active);
        r.max_idle = redis.value("max_idle", r.max_idle);
        r.min_idle = redis.value("min_idle", r.min_idle);
        r.test_on_borrow = redis.value("test_on_borrow", r.test_on_borrow);
        r.test_on_return = redis.value("test_on_return", r.test_on_return);
        r.test_while_idle = redis.value("test_while_idle", r.test_while_idle);
        r.eviction_run_interval_ms = redis.value("eviction_run_interval_ms", r.eviction_run_interval_ms);
        r.eviction_per_run = redis.value("eviction_per_run", r.eviction_per_run);
        r.min_evictable_idle_ms = redis.value("min_evictable_idle_ms", r.min_evictable_idle_ms);
    }
    return cfg;
}

}
}
