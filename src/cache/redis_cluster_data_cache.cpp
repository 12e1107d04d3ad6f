#include "cache/redis_cluster_data_cache.hpp"

#include "cache/redis_errors.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

#include <fmt/format.h>

namespace session_cache {
namespace cache {

RedisClusterDataCache::RedisClusterDataCache(ClusterOptions options, common::SleepFunction sleep,
                                             Connector connector)
    : options_(std::move(options)), sleep_(std::move(sleep)), connector_(std::move(connector)) {
    policy_.name = "redis-cluster";
    policy_.max_attempts = kMaxAttempts;
    policy_.delay = kFailoverWait;
    if (!sleep_) {
        sleep_ = common::BlockingSleep;
    }
    if (!connector_) {
        connector_ = [](const sw::redis::ConnectionOptions& opts,
                        const sw::redis::ConnectionPoolOptions& pool_opts) {
            return std::make_shared<sw::redis::RedisCluster>(opts, pool_opts);
        };
    }
}

RedisClusterDataCache::~RedisClusterDataCache() = default;

common::Status RedisClusterDataCache::Connect() {
    if (Topology()) {
        return common::Status::OK(); // 已经连接
    }
    if (options_.seeds.empty()) {
        return common::FromCacheError(common::CacheErrorCode::kConfiguration,
                                      "Redis cluster has no seed nodes");
    }

    sw::redis::ConnectionPoolOptions pool_opts;
    pool_opts.size = options_.pool_size;
    pool_opts.wait_timeout = options_.acquire_timeout;
    pool_opts.connection_idle_time = options_.connection_idle_time;

    // 连接种子节点和拉取槽位信息可能阻塞到 connect_timeout, 不能持锁
    std::string last_error;
    for (const auto& seed : options_.seeds) {
        sw::redis::ConnectionOptions opts;
        opts.host = seed.host;
        opts.port = seed.port;
        if (!options_.password.empty()) {
            opts.password = options_.password;
        }
        opts.connect_timeout = options_.connect_timeout;
        opts.socket_timeout = options_.socket_timeout;
        std::shared_ptr<sw::redis::RedisCluster> candidate;
        try {
            candidate = connector_(opts, pool_opts);
        } catch (const sw::redis::Error& err) {
            last_error = seed.ToString() + ": " + err.what();
            SESSION_CACHE_LOG_WARN("[RedisClusterDataCache] seed {} unavailable: {}",
                                   seed.ToString(), err.what());
            continue;
        }
        if (!candidate) {
            last_error = seed.ToString() + ": no topology";
            continue;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (!cluster_) {
            cluster_ = std::move(candidate);
            SESSION_CACHE_LOG_INFO("[RedisClusterDataCache] connected via seed {}", seed.ToString());
        }
        return common::Status::OK();
    }
    return common::FromCacheError(common::CacheErrorCode::kConnectivity,
                                  "Failed to connect to Redis cluster, last error " + last_error);
}

std::shared_ptr<sw::redis::RedisCluster> RedisClusterDataCache::Topology() {
    std::lock_guard<std::mutex> lock(mutex_);
    return cluster_;
}

template <typename Fn>
auto RedisClusterDataCache::Execute(const char* operation, const std::string& key, Fn&& fn)
    -> decltype(fn(std::declval<sw::redis::RedisCluster&>())) {
    using Result = decltype(fn(std::declval<sw::redis::RedisCluster&>()));
    common::RetryPolicy policy = policy_;
    policy.name = std::string(operation) + " " + key;

    return common::Retry(
        policy, common::IsConnectivityError,
        [&](int) -> Result {
            auto status = Connect();
            if (!status.IsOk()) {
                return status;
            }
            auto cluster = Topology();
            try {
                return fn(*cluster);
            } catch (const sw::redis::Error& err) {
                return FromRedisClusterError(err, fmt::format("Redis cluster {} failed", operation));
            }
        },
        sleep_);
}

common::Status RedisClusterDataCache::DoWrite(const std::string& key, const std::string& value) {
    return Execute("SET", key, [&](sw::redis::RedisCluster& cluster) {
        cluster.set(key, value);
        return common::Status::OK();
    });
}

common::StatusOr<bool> RedisClusterDataCache::DoWriteIfAbsent(const std::string& key, const std::string& value) {
    return Execute("SETNX", key, [&](sw::redis::RedisCluster& cluster) {
        return common::StatusOr<bool>(cluster.setnx(key, value));
    });
}

common::Status RedisClusterDataCache::DoSetExpiry(const std::string& key, int seconds) {
    return Execute("EXPIRE", key, [&](sw::redis::RedisCluster& cluster) {
        cluster.expire(key, std::chrono::seconds(seconds));
        return common::Status::OK();
    });
}

common::StatusOr<std::optional<std::string>> RedisClusterDataCache::DoRead(const std::string& key) {
    using Result = common::StatusOr<std::optional<std::string>>;
    return Execute("GET", key, [&](sw::redis::RedisCluster& cluster) {
        auto value = cluster.get(key);
        if (!value) {
            return Result(std::optional<std::string>());
        }
        return Result(std::optional<std::string>(*value));
    });
}

common::Status RedisClusterDataCache::DoDelete(const std::string& key) {
    return Execute("DEL", key, [&](sw::redis::RedisCluster& cluster) {
        cluster.del(key);
        return common::Status::OK();
    });
}

} // namespace cache
} // namespace session_cache
