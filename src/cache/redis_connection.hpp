#pragma once

#include "cache/options.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"

#include <sw/redis++/redis++.h>

#include <memory>

namespace session_cache {
namespace cache {

// 单条 Redis 连接, 由 ConnectionPool 借出和回收
class RedisConnection {
public:
    RedisConnection(const RedisConnection&) = delete;
    RedisConnection& operator=(const RedisConnection&) = delete;
    ~RedisConnection();

    // 建立连接并 PING 一次, 失败时返回 Unavailable
    static common::StatusOr<std::unique_ptr<RedisConnection>> Create(const PoolOptions& options);
    // 只创建客户端对象, 第一次执行命令时才真正连接
    static std::unique_ptr<RedisConnection> Open(const PoolOptions& options);

    // 健康检查, 连接不可用时返回 false
    bool Ping();

    sw::redis::Redis& Raw() noexcept { return *redis_; }

private:
    explicit RedisConnection(std::unique_ptr<sw::redis::Redis> redis);

    std::unique_ptr<sw::redis::Redis> redis_;
};

} // namespace cache
} // namespace session_cache
