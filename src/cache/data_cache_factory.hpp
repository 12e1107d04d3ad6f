#pragma once

#include "cache/data_cache.hpp"
#include "cache/options.hpp"
#include "common/config.hpp"
#include "common/retry.hpp"
#include "common/status_or.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace session_cache {
namespace cache {

// 根据配置选择单节点或集群实现
class DataCacheFactory {
public:
    // 解析 "host:port,host:port" 列表
    // 集群模式: 全部作为种子节点; 单节点模式: 取第一个主机名非空且端口为正的节点
    static common::StatusOr<std::vector<HostAndPort>> ParseHosts(const std::string& hosts,
                                                                 bool cluster_enabled);

    static PoolOptions MakePoolOptions(const common::RedisConfig& config, const HostAndPort& node);
    static ClusterOptions MakeClusterOptions(const common::RedisConfig& config,
                                             std::vector<HostAndPort> seeds);

    // 超时时间不低于 RedisConfig::kMinTimeoutMs
    static int EffectiveTimeoutMs(const common::RedisConfig& config);

    static common::StatusOr<std::shared_ptr<DataCache>> Create(
        const common::RedisConfig& config, common::SleepFunction sleep = common::BlockingSleep);
};

// 持有进程内唯一的 DataCache 实例, 由组装应用的组件创建并显式传递
// 第一次 Get() 时构建, 之后总是返回同一个实例(或同一个初始化错误), 不支持热更新.
class DataCacheProvider {
public:
    using Builder = std::function<common::StatusOr<std::shared_ptr<DataCache>>(const common::RedisConfig&)>;

    explicit DataCacheProvider(common::RedisConfig config);
    DataCacheProvider(common::RedisConfig config, Builder builder);

    DataCacheProvider(const DataCacheProvider&) = delete;
    DataCacheProvider& operator=(const DataCacheProvider&) = delete;

    common::StatusOr<std::shared_ptr<DataCache>> Get();

private:
    common::RedisConfig config_;
    Builder builder_;
    std::once_flag once_;
    common::Status init_status_;
    std::shared_ptr<DataCache> cache_;
};

} // namespace cache
} // namespace session_cache
