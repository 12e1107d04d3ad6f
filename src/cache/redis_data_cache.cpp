#include "cache/redis_data_cache.hpp"

#include "cache/redis_errors.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

#include <chrono>

namespace session_cache {
namespace cache {

RedisDataCache::RedisDataCache(PoolOptions options)
    : RedisDataCache(std::make_unique<ConnectionPool>(std::move(options))) {}

RedisDataCache::RedisDataCache(std::unique_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {
    policy_.name = "redis";
    policy_.max_attempts = kMaxAttempts;
    policy_.delay = std::chrono::milliseconds(0);
    SESSION_CACHE_LOG_INFO("[RedisDataCache] single node {}:{} db {} (max_active {})",
                           pool_->Options().host, pool_->Options().port,
                           pool_->Options().database, pool_->Options().max_active);
}

RedisDataCache::~RedisDataCache() = default;

template <typename Fn>
auto RedisDataCache::Execute(const char* operation, const std::string& key, Fn&& fn)
    -> decltype(fn(std::declval<sw::redis::Redis&>())) {
    using Result = decltype(fn(std::declval<sw::redis::Redis&>()));
    common::RetryPolicy policy = policy_;
    policy.name = std::string(operation) + " " + key;

    // lease 在每次尝试结束时析构, 连接总是在决定是否重试之前归还
    return common::Retry(policy, common::IsConnectivityError, [&](int) -> Result {
        auto lease = pool_->Acquire();
        if (!lease.IsOk()) {
            return lease.GetStatus();
        }
        auto& connection = lease.Value();
        try {
            return fn(connection->Raw());
        } catch (const sw::redis::Error& err) {
            auto status = FromRedisError(err, std::string("Redis ") + operation + " failed");
            if (common::IsConnectivityError(status)) {
                connection.Invalidate();
            }
            return status;
        }
    });
}

common::Status RedisDataCache::DoWrite(const std::string& key, const std::string& value) {
    return Execute("SET", key, [&](sw::redis::Redis& redis) {
        redis.set(key, value);
        return common::Status::OK();
    });
}

common::StatusOr<bool> RedisDataCache::DoWriteIfAbsent(const std::string& key, const std::string& value) {
    return Execute("SETNX", key, [&](sw::redis::Redis& redis) {
        return common::StatusOr<bool>(redis.setnx(key, value));
    });
}

common::Status RedisDataCache::DoSetExpiry(const std::string& key, int seconds) {
    return Execute("EXPIRE", key, [&](sw::redis::Redis& redis) {
        redis.expire(key, std::chrono::seconds(seconds));
        return common::Status::OK();
    });
}

common::StatusOr<std::optional<std::string>> RedisDataCache::DoRead(const std::string& key) {
    using Result = common::StatusOr<std::optional<std::string>>;
    return Execute("GET", key, [&](sw::redis::Redis& redis) {
        auto value = redis.get(key);
        if (!value) {
            return Result(std::optional<std::string>());
        }
        return Result(std::optional<std::string>(*value));
    });
}

common::Status RedisDataCache::DoDelete(const std::string& key) {
    return Execute("DEL", key, [&](sw::redis::Redis& redis) {
        redis.del(key);
        return common::Status::OK();
    });
}

} // namespace cache
} // namespace session_cache
