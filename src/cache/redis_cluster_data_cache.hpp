#pragma once

#include "cache/data_cache.hpp"
#include "cache/options.hpp"
#include "common/retry.hpp"

#include <sw/redis++/redis++.h>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace session_cache {
namespace cache {

// Redis 集群数据缓存
// 键路由和 MOVED/ASK 重定向由 redis++ 的 RedisCluster 处理.
// 遇到连接失败或重定向耗尽时等待 kFailoverWait 让集群完成主从切换, 最多尝试 kMaxAttempts 次.
class RedisClusterDataCache : public DataCache {
public:
    static constexpr int kMaxAttempts = 30;
    static constexpr std::chrono::milliseconds kFailoverWait{4000};

    // 通过一个种子节点建立集群拓扑, 失败时抛出 sw::redis::Error
    using Connector = std::function<std::shared_ptr<sw::redis::RedisCluster>(
        const sw::redis::ConnectionOptions&, const sw::redis::ConnectionPoolOptions&)>;

    explicit RedisClusterDataCache(ClusterOptions options,
                                   common::SleepFunction sleep = common::BlockingSleep,
                                   Connector connector = {});
    ~RedisClusterDataCache() override;

    // 依次尝试种子节点建立集群拓扑, 已建立时直接返回 OK
    // 建立过程不持锁, 多个线程同时建立时保留第一个发布的拓扑
    common::Status Connect();

    const common::RetryPolicy& Policy() const noexcept { return policy_; }
    const ClusterOptions& Options() const noexcept { return options_; }

protected:
    common::Status DoWrite(const std::string& key, const std::string& value) override;
    common::StatusOr<bool> DoWriteIfAbsent(const std::string& key, const std::string& value) override;
    common::Status DoSetExpiry(const std::string& key, int seconds) override;
    common::StatusOr<std::optional<std::string>> DoRead(const std::string& key) override;
    common::Status DoDelete(const std::string& key) override;

private:
    std::shared_ptr<sw::redis::RedisCluster> Topology();

    template <typename Fn>
    auto Execute(const char* operation, const std::string& key, Fn&& fn)
        -> decltype(fn(std::declval<sw::redis::RedisCluster&>()));

    ClusterOptions options_;
    common::SleepFunction sleep_;
    Connector connector_;
    common::RetryPolicy policy_;

    std::mutex mutex_; // 仅保护 cluster_ 的读取和发布
    std::shared_ptr<sw::redis::RedisCluster> cluster_;
};

} // namespace cache
} // namespace session_cache
