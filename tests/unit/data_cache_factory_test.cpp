#include "cache/data_cache_factory.hpp"
#include "cache/redis_cluster_data_cache.hpp"
#include "cache/redis_data_cache.hpp"
#include "common/errors.hpp"
#include "fake_data_cache.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using session_cache::cache::DataCache;
using session_cache::cache::DataCacheFactory;
using session_cache::cache::DataCacheProvider;
using session_cache::cache::HostAndPort;
using session_cache::cache::RedisClusterDataCache;
using session_cache::cache::RedisDataCache;
using session_cache::common::IsConfigurationError;
using session_cache::common::RedisConfig;
using session_cache::common::Status;
using session_cache::common::StatusOr;

TEST(ParseHostsTest, SingleNode) {
    auto nodes = DataCacheFactory::ParseHosts("127.0.0.1:6379", false);
    ASSERT_TRUE(nodes.IsOk());
    ASSERT_EQ(nodes.Value().size(), 1u);
    EXPECT_EQ(nodes.Value()[0].host, "127.0.0.1");
    EXPECT_EQ(nodes.Value()[0].port, 6379);
}

TEST(ParseHostsTest, SingleNodeUsesFirstUsableEntry) {
    auto nodes = DataCacheFactory::ParseHosts(":6379, redis:0, redis:6381, other:6382", false);
    ASSERT_TRUE(nodes.IsOk()) << nodes.GetStatus().Message();
    ASSERT_EQ(nodes.Value().size(), 1u);
    EXPECT_EQ(nodes.Value()[0].ToString(), "redis:6381");
}

TEST(ParseHostsTest, ClusterKeepsAllSeedsInOrder) {
    auto nodes = DataCacheFactory::ParseHosts(" node-a : 7000 ,node-b:7001,\tnode-a:7000,node-c:7002 ", true);
    ASSERT_TRUE(nodes.IsOk()) << nodes.GetStatus().Message();
    ASSERT_EQ(nodes.Value().size(), 3u);
    EXPECT_EQ(nodes.Value()[0].ToString(), "node-a:7000");
    EXPECT_EQ(nodes.Value()[1].ToString(), "node-b:7001");
    EXPECT_EQ(nodes.Value()[2].ToString(), "node-c:7002");
}

TEST(ParseHostsTest, MalformedEntriesAreConfigurationErrors) {
    const std::vector<std::string> bad = {"redis", "redis:", "redis:abc", "redis:63x9",
                                          "redis:70000", "redis:99999999999"};
    for (const auto& hosts : bad) {
        for (bool cluster : {false, true}) {
            auto nodes = DataCacheFactory::ParseHosts(hosts, cluster);
            ASSERT_FALSE(nodes.IsOk()) << hosts;
            EXPECT_TRUE(IsConfigurationError(nodes.GetStatus())) << hosts;
        }
    }
}

TEST(ParseHostsTest, HighestPortIsAccepted) {
    auto nodes = DataCacheFactory::ParseHosts("redis:65535", false);
    ASSERT_TRUE(nodes.IsOk()) << nodes.GetStatus().Message();
    EXPECT_EQ(nodes.Value()[0].port, 65535);

    // 超出范围的端口是配置错误, 不会被当作不可用节点跳过
    auto out_of_range = DataCacheFactory::ParseHosts("redis:65536,redis:6379", false);
    ASSERT_FALSE(out_of_range.IsOk());
    EXPECT_TRUE(IsConfigurationError(out_of_range.GetStatus()));
}

TEST(ParseHostsTest, ClusterRejectsUnusableSeed) {
    EXPECT_TRUE(IsConfigurationError(DataCacheFactory::ParseHosts("a:7000,:7001", true).GetStatus()));
    EXPECT_TRUE(IsConfigurationError(DataCacheFactory::ParseHosts("a:7000,b:0", true).GetStatus()));
}

TEST(ParseHostsTest, NoUsableNodeIsConfigurationError) {
    EXPECT_TRUE(IsConfigurationError(DataCacheFactory::ParseHosts("", false).GetStatus()));
    EXPECT_TRUE(IsConfigurationError(DataCacheFactory::ParseHosts(" , ", true).GetStatus()));
    EXPECT_TRUE(IsConfigurationError(DataCacheFactory::ParseHosts(":6379,host:-1", false).GetStatus()));
}

TEST(DataCacheFactoryTest, TimeoutHasFloor) {
    RedisConfig config;
    config.timeout_ms = 500;
    EXPECT_EQ(DataCacheFactory::EffectiveTimeoutMs(config), RedisConfig::kMinTimeoutMs);
    config.timeout_ms = 5000;
    EXPECT_EQ(DataCacheFactory::EffectiveTimeoutMs(config), 5000);
}

TEST(DataCacheFactoryTest, PoolOptionsFollowConfig) {
    RedisConfig config;
    config.password = "pw";
    config.database = 3;
    config.timeout_ms = 100;
    config.max_active = 0;
    config.max_idle = 2;
    config.min_idle = 1;
    config.test_on_borrow = true;
    config.eviction_run_interval_ms = 0;
    config.eviction_per_run = -3;
    config.min_evictable_idle_ms = 1000;

    auto options = DataCacheFactory::MakePoolOptions(config, HostAndPort{"redis", 6380});
    EXPECT_EQ(options.host, "redis");
    EXPECT_EQ(options.port, 6380);
    EXPECT_EQ(options.password, "pw");
    EXPECT_EQ(options.database, 3);
    EXPECT_EQ(options.connect_timeout.count(), 2000);
    EXPECT_EQ(options.socket_timeout.count(), 2000);
    EXPECT_EQ(options.max_active, 1u);
    EXPECT_EQ(options.max_idle, 2u);
    EXPECT_EQ(options.min_idle, 1u);
    EXPECT_TRUE(options.test_on_borrow);
    EXPECT_FALSE(options.test_on_return);
    EXPECT_EQ(options.eviction_run_interval.count(), 0);
    EXPECT_EQ(options.eviction_per_run, -3);
    EXPECT_EQ(options.min_evictable_idle.count(), 1000);
}

TEST(DataCacheFactoryTest, ClusterOptionsFollowConfig) {
    RedisConfig config;
    config.password = "pw";
    config.max_active = 12;
    config.min_evictable_idle_ms = 45000;
    auto options = DataCacheFactory::MakeClusterOptions(config, {HostAndPort{"a", 7000}});
    ASSERT_EQ(options.seeds.size(), 1u);
    EXPECT_EQ(options.password, "pw");
    EXPECT_EQ(options.pool_size, 12u);
    EXPECT_EQ(options.connection_idle_time.count(), 45000);

    config.eviction_run_interval_ms = 0;
    options = DataCacheFactory::MakeClusterOptions(config, {HostAndPort{"a", 7000}});
    EXPECT_EQ(options.connection_idle_time.count(), 0);
}

TEST(DataCacheFactoryTest, InvalidHostsFailCreation) {
    RedisConfig config;
    config.hosts = "no-port-here";
    auto created = DataCacheFactory::Create(config);
    ASSERT_FALSE(created.IsOk());
    EXPECT_TRUE(IsConfigurationError(created.GetStatus()));
}

TEST(DataCacheFactoryTest, SingleNodeModeCreatesRedisDataCache) {
    RedisConfig config;
    config.hosts = "127.0.0.1:1";
    config.eviction_run_interval_ms = 0;
    auto created = DataCacheFactory::Create(config);
    ASSERT_TRUE(created.IsOk()) << created.GetStatus().Message();
    auto single = std::dynamic_pointer_cast<RedisDataCache>(created.Value());
    ASSERT_NE(single, nullptr);
    EXPECT_EQ(single->Policy().max_attempts, RedisDataCache::kMaxAttempts);
    EXPECT_EQ(single->Pool().Options().port, 1);
}

// 启动时集群不可达只记录告警, 仍返回集群实现
TEST(DataCacheFactoryTest, UnreachableClusterIsNotFatalAtStartup) {
    RedisConfig config;
    config.cluster_enabled = true;
    config.hosts = "127.0.0.1:1";
    std::vector<std::chrono::milliseconds> waits;
    auto created = DataCacheFactory::Create(config, [&waits](std::chrono::milliseconds d) {
        waits.push_back(d);
    });
    ASSERT_TRUE(created.IsOk()) << created.GetStatus().Message();
    auto cluster = std::dynamic_pointer_cast<RedisClusterDataCache>(created.Value());
    ASSERT_NE(cluster, nullptr);
    ASSERT_EQ(cluster->Options().seeds.size(), 1u);
    EXPECT_EQ(cluster->Options().seeds[0].ToString(), "127.0.0.1:1");
    EXPECT_TRUE(waits.empty());
}

TEST(DataCacheProviderTest, BuildsOnceAndSharesInstance) {
    std::atomic<int> builds{0};
    DataCacheProvider provider(RedisConfig{}, [&builds](const RedisConfig&) {
        ++builds;
        return StatusOr<std::shared_ptr<DataCache>>(
            std::shared_ptr<DataCache>(std::make_shared<session_cache_test::FakeDataCache>()));
    });

    constexpr int kThreads = 8;
    std::vector<std::shared_ptr<DataCache>> seen(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&provider, &seen, i]() {
            auto cache = provider.Get();
            if (cache.IsOk()) {
                seen[i] = cache.Value();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(builds.load(), 1);
    ASSERT_NE(seen[0], nullptr);
    for (const auto& cache : seen) {
        EXPECT_EQ(cache, seen[0]);
    }
    EXPECT_EQ(provider.Get().Value(), seen[0]);
}

TEST(DataCacheProviderTest, InitializationFailureIsRemembered) {
    int builds = 0;
    RedisConfig config;
    config.hosts = "broken";
    DataCacheProvider provider(config, [&builds](const RedisConfig& cfg) {
        ++builds;
        return DataCacheFactory::Create(cfg);
    });

    auto first = provider.Get();
    auto second = provider.Get();
    ASSERT_FALSE(first.IsOk());
    ASSERT_FALSE(second.IsOk());
    EXPECT_TRUE(IsConfigurationError(first.GetStatus()));
    EXPECT_EQ(first.GetStatus().Message(), second.GetStatus().Message());
    EXPECT_EQ(builds, 1);
}
