#pragma once

#include <string>

namespace session_cache {
namespace common {

// 日志配置结构体
struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e][%^%l%$][%t] %v";
    bool console = true;
    std::string file = "";
};

// Redis配置结构体
struct RedisConfig {
    bool cluster_enabled = false;
    std::string hosts = "127.0.0.1:6379"; // 逗号分隔的 host:port 列表
    std::string password = "";
    int database = 0;                     // 仅单节点模式有效
    int timeout_ms = 2000;                // 连接/读写超时, 下限 kMinTimeoutMs
    // 连接池参数
    int max_active = 8;
    int max_idle = 8;
    int min_idle = 0;
    bool test_on_borrow = false;
    bool test_on_return = false;
    bool test_while_idle = false;
    int eviction_run_interval_ms = 30000; // <= 0 表示不启动空闲回收
    int eviction_per_run = 3;
    int min_evictable_idle_ms = 60000;

    static constexpr int kDefaultPort = 6379;
    static constexpr int kMinTimeoutMs = 2000;
};

// 应用配置结构体
struct AppConfig {
    LoggingConfig logging;
    RedisConfig redis;
};

}
}
