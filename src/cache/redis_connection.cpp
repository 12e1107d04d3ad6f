#include "cache/redis_connection.hpp"

#include "cache/redis_errors.hpp"
#include "common/errors.hpp"

#include <fmt/format.h>

namespace session_cache {
namespace cache {

RedisConnection::RedisConnection(std::unique_ptr<sw::redis::Redis> redis)
    : redis_(std::move(redis)) {}

RedisConnection::~RedisConnection() = default;

std::unique_ptr<RedisConnection> RedisConnection::Open(const PoolOptions& options) {
    sw::redis::ConnectionOptions opts;
    opts.host = options.host;
    opts.port = options.port;
    if (!options.password.empty()) {
        opts.password = options.password;
    }
    opts.db = options.database;
    opts.connect_timeout = options.connect_timeout;
    opts.socket_timeout = options.socket_timeout;

    // 每个 RedisConnection 只持有一条底层连接, 池化由 ConnectionPool 负责
    sw::redis::ConnectionPoolOptions pool_opts;
    pool_opts.size = 1;
    pool_opts.wait_timeout = options.acquire_timeout;

    return std::unique_ptr<RedisConnection>(
        new RedisConnection(std::make_unique<sw::redis::Redis>(opts, pool_opts)));
}

common::StatusOr<std::unique_ptr<RedisConnection>> RedisConnection::Create(const PoolOptions& options) {
    std::unique_ptr<RedisConnection> connection;
    try {
        connection = Open(options);
        connection->Raw().ping();
    } catch (const sw::redis::ReplyError& err) {
        // 例如认证失败, 重试无意义
        return FromRedisError(err, fmt::format("Redis {}:{} rejected connection", options.host, options.port));
    } catch (const sw::redis::Error& err) {
        return common::FromCacheError(
            common::CacheErrorCode::kConnectivity,
            fmt::format("Failed to connect to Redis {}:{}: {}", options.host, options.port, err.what()));
    }
    return common::StatusOr<std::unique_ptr<RedisConnection>>(std::move(connection));
}

bool RedisConnection::Ping() {
    try {
        redis_->ping();
        return true;
    } catch (const sw::redis::Error&) {
        return false;
    }
}

} // namespace cache
} // namespace session_cache
