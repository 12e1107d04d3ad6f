#include "cache/data_cache_factory.hpp"

#include "cache/redis_cluster_data_cache.hpp"
#include "cache/redis_data_cache.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <sstream>

namespace session_cache {
namespace cache {

namespace {

constexpr int kMaxPort = 65535;

common::Status BadHosts(const std::string& detail) {
    return common::FromCacheError(common::CacheErrorCode::kConfiguration, "Invalid redis hosts: " + detail);
}

// 解析单个 host:port, 语法错误返回 ConfigurationError
common::StatusOr<HostAndPort> ParseHostPort(const std::string& entry) {
    auto colon = entry.rfind(':');
    if (colon == std::string::npos) {
        return BadHosts("missing port in '" + entry + "'");
    }
    HostAndPort node;
    node.host = entry.substr(0, colon);
    std::string port = entry.substr(colon + 1);
    if (port.empty()) {
        return BadHosts("missing port in '" + entry + "'");
    }
    const char* end = port.data() + port.size();
    auto [ptr, ec] = std::from_chars(port.data(), end, node.port);
    if (ec != std::errc() || ptr != end) {
        return BadHosts("non-numeric port in '" + entry + "'");
    }
    if (node.port > kMaxPort) {
        return BadHosts("port out of range in '" + entry + "'");
    }
    return common::StatusOr<HostAndPort>(std::move(node));
}

} // namespace

common::StatusOr<std::vector<HostAndPort>> DataCacheFactory::ParseHosts(const std::string& hosts,
                                                                        bool cluster_enabled) {
    std::string compact;
    compact.reserve(hosts.size());
    std::copy_if(hosts.begin(), hosts.end(), std::back_inserter(compact),
                 [](unsigned char c) { return !std::isspace(c); });

    std::vector<HostAndPort> nodes;
    std::stringstream ss(compact);
    std::string entry;
    while (std::getline(ss, entry, ',')) {
        if (entry.empty()) {
            continue;
        }
        auto parsed = ParseHostPort(entry);
        if (!parsed.IsOk()) {
            return parsed.GetStatus();
        }
        auto node = std::move(parsed).Value();
        if (cluster_enabled) {
            if (node.host.empty() || node.port <= 0) {
                return BadHosts("invalid cluster node '" + entry + "'");
            }
            if (std::find(nodes.begin(), nodes.end(), node) == nodes.end()) {
                nodes.push_back(std::move(node));
            }
        } else if (!node.host.empty() && node.port > 0) {
            nodes.push_back(std::move(node));
            break;
        }
    }
    if (nodes.empty()) {
        return BadHosts("no usable node in '" + hosts + "'");
    }
    return common::StatusOr<std::vector<HostAndPort>>(std::move(nodes));
}

int DataCacheFactory::EffectiveTimeoutMs(const common::RedisConfig& config) {
    return std::max(config.timeout_ms, common::RedisConfig::kMinTimeoutMs);
}

PoolOptions DataCacheFactory::MakePoolOptions(const common::RedisConfig& config, const HostAndPort& node) {
    const std::chrono::milliseconds timeout(EffectiveTimeoutMs(config));
    PoolOptions options;
    options.host = node.host;
    options.port = node.port;
    options.password = config.password;
    options.database = config.database;
    options.connect_timeout = timeout;
    options.socket_timeout = timeout;
    options.acquire_timeout = timeout;
    options.max_active = static_cast<std::size_t>(std::max(config.max_active, 1));
    options.max_idle = static_cast<std::size_t>(std::max(config.max_idle, 0));
    options.min_idle = static_cast<std::size_t>(std::max(config.min_idle, 0));
    options.test_on_borrow = config.test_on_borrow;
    options.test_on_return = config.test_on_return;
    options.test_while_idle = config.test_while_idle;
    options.eviction_run_interval = std::chrono::milliseconds(config.eviction_run_interval_ms);
    options.eviction_per_run = config.eviction_per_run;
    options.min_evictable_idle = std::chrono::milliseconds(config.min_evictable_idle_ms);
    return options;
}

ClusterOptions DataCacheFactory::MakeClusterOptions(const common::RedisConfig& config,
                                                    std::vector<HostAndPort> seeds) {
    const std::chrono::milliseconds timeout(EffectiveTimeoutMs(config));
    ClusterOptions options;
    options.seeds = std::move(seeds);
    options.password = config.password;
    options.connect_timeout = timeout;
    options.socket_timeout = timeout;
    options.acquire_timeout = timeout;
    options.pool_size = static_cast<std::size_t>(std::max(config.max_active, 1));
    if (config.eviction_run_interval_ms > 0) {
        options.connection_idle_time = std::chrono::milliseconds(std::max(config.min_evictable_idle_ms, 0));
    }
    return options;
}

common::StatusOr<std::shared_ptr<DataCache>> DataCacheFactory::Create(const common::RedisConfig& config,
                                                                      common::SleepFunction sleep) {
    auto nodes = ParseHosts(config.hosts, config.cluster_enabled);
    if (!nodes.IsOk()) {
        SESSION_CACHE_LOG_ERROR("[DataCacheFactory] {}", nodes.GetStatus().Message());
        return nodes.GetStatus();
    }

    if (config.cluster_enabled) {
        auto cluster = std::make_shared<RedisClusterDataCache>(
            MakeClusterOptions(config, std::move(nodes).Value()), std::move(sleep));
        // 启动时集群不可达不算致命错误, 首次操作会按故障转移策略重连
        auto status = cluster->Connect();
        if (!status.IsOk()) {
            SESSION_CACHE_LOG_WARN("[DataCacheFactory] cluster not reachable at startup: {}", status.Message());
        }
        return common::StatusOr<std::shared_ptr<DataCache>>(std::shared_ptr<DataCache>(std::move(cluster)));
    }

    const auto& node = nodes.Value().front();
    auto single = std::make_shared<RedisDataCache>(MakePoolOptions(config, node));
    return common::StatusOr<std::shared_ptr<DataCache>>(std::shared_ptr<DataCache>(std::move(single)));
}

DataCacheProvider::DataCacheProvider(common::RedisConfig config)
    : DataCacheProvider(std::move(config), [](const common::RedisConfig& cfg) {
          return DataCacheFactory::Create(cfg);
      }) {}

DataCacheProvider::DataCacheProvider(common::RedisConfig config, Builder builder)
    : config_(std::move(config)), builder_(std::move(builder)) {}

common::StatusOr<std::shared_ptr<DataCache>> DataCacheProvider::Get() {
    std::call_once(once_, [this]() {
        auto created = builder_(config_);
        init_status_ = created.GetStatus();
        if (created.IsOk()) {
            cache_ = std::move(created).Value();
        }
    });
    if (!init_status_.IsOk()) {
        return init_status_;
    }
    return common::StatusOr<std::shared_ptr<DataCache>>(cache_);
}

} // namespace cache
} // namespace session_cache
