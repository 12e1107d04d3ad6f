#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace session_cache {
namespace cache {

struct HostAndPort {
    std::string host;
    int port = 0;

    std::string ToString() const { return host + ":" + std::to_string(port); }
    bool operator==(const HostAndPort& other) const {
        return host == other.host && port == other.port;
    }
};

// 单节点连接池参数
struct PoolOptions {
    std::string host = "127.0.0.1";
    int port = 6379;
    std::string password;
    int database = 0;
    std::chrono::milliseconds connect_timeout{2000};
    std::chrono::milliseconds socket_timeout{2000};
    std::chrono::milliseconds acquire_timeout{2000}; // 连接池耗尽时的最长等待
    std::size_t max_active = 8;
    std::size_t max_idle = 8;
    std::size_t min_idle = 0;
    bool test_on_borrow = false;
    bool test_on_return = false;
    bool test_while_idle = false;
    std::chrono::milliseconds eviction_run_interval{30000}; // <= 0 不启动回收线程
    int eviction_per_run = 3; // 负数 n 表示每轮检查 ceil(空闲数 / |n|) 个
    std::chrono::milliseconds min_evictable_idle{60000};
};

// 集群客户端参数, 每个节点的连接池由 redis++ 自行管理
struct ClusterOptions {
    std::vector<HostAndPort> seeds;
    std::string password;
    std::chrono::milliseconds connect_timeout{2000};
    std::chrono::milliseconds socket_timeout{2000};
    std::size_t pool_size = 8;
    std::chrono::milliseconds acquire_timeout{2000};
    std::chrono::milliseconds connection_idle_time{0}; // 0 表示不回收
};

} // namespace cache
} // namespace session_cache
