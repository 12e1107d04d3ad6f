#include <gtest/gtest.h>

#include "cache/connection_pool.hpp"
#include "cache/redis_connection.hpp"
#include "cache/redis_data_cache.hpp"
#include "common/errors.hpp"
#include "serialization/session_serializer.hpp"
#include "session/session.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using session_cache::cache::ConnectionPool;
using session_cache::cache::PoolOptions;
using session_cache::cache::RedisConnection;
using session_cache::cache::RedisDataCache;
using session_cache::common::IsConnectivityError;
using session_cache::common::StatusOr;

namespace {

PoolOptions UnreachableNode() {
    PoolOptions options;
    options.host = "127.0.0.1";
    options.port = 1;
    options.connect_timeout = std::chrono::milliseconds(200);
    options.socket_timeout = std::chrono::milliseconds(200);
    options.acquire_timeout = std::chrono::milliseconds(200);
    options.eviction_run_interval = std::chrono::milliseconds(0);
    return options;
}

PoolOptions LiveNode() {
    PoolOptions options;
    if (const char* host = std::getenv("REDIS_HOST")) options.host = host;
    if (const char* port = std::getenv("REDIS_PORT")) options.port = std::atoi(port);
    if (const char* pass = std::getenv("REDIS_PASSWORD")) options.password = pass;
    options.eviction_run_interval = std::chrono::milliseconds(0);
    return options;
}

} // namespace

// 单节点不可达: 立即重试, 共 3 次后返回连接错误
TEST(RedisDataCacheTest, UnreachableNodeFailsAfterThreeAttempts) {
    auto options = UnreachableNode();
    std::atomic<int> connects{0};
    auto pool = std::make_unique<ConnectionPool>(
        options,
        [&connects, options]() {
            ++connects;
            return RedisConnection::Create(options);
        },
        [](RedisConnection& connection) { return connection.Ping(); });
    RedisDataCache cache(std::move(pool));

    auto status = cache.Write("sess 1", "payload");
    ASSERT_FALSE(status.IsOk());
    EXPECT_TRUE(IsConnectivityError(status)) << status.Message();
    EXPECT_EQ(connects.load(), RedisDataCache::kMaxAttempts);
    EXPECT_EQ(cache.Pool().TotalCount(), 0u);
}

// 命令执行中的连接失败: 连接被丢弃, 下一次尝试换新连接
TEST(RedisDataCacheTest, BrokenConnectionIsNotReturnedToPool) {
    auto options = UnreachableNode();
    std::atomic<int> opened{0};
    auto pool = std::make_unique<ConnectionPool>(
        options,
        [&opened, options]() {
            ++opened;
            return StatusOr<std::unique_ptr<RedisConnection>>(RedisConnection::Open(options));
        },
        [](RedisConnection&) { return true; });
    RedisDataCache cache(std::move(pool));

    auto read = cache.Read("sess 1");
    ASSERT_FALSE(read.IsOk());
    EXPECT_TRUE(IsConnectivityError(read.GetStatus()));
    EXPECT_EQ(opened.load(), 3);
    EXPECT_EQ(cache.Pool().IdleCount(), 0u);
    EXPECT_EQ(cache.Pool().TotalCount(), 0u);
}

TEST(RedisDataCacheTest, Policy) {
    RedisDataCache cache(UnreachableNode());
    EXPECT_EQ(cache.Policy().max_attempts, 3);
    EXPECT_EQ(cache.Policy().delay.count(), 0);
}

// 以下用例需要可用的 Redis (REDIS_HOST / REDIS_PORT / REDIS_PASSWORD)
class LiveRedisDataCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto probe = RedisConnection::Create(LiveNode());
        if (!probe.IsOk()) {
            GTEST_SKIP() << "Redis not available: " << probe.GetStatus().Message();
        }
        cache_ = std::make_unique<RedisDataCache>(LiveNode());
    }

    void TearDown() override {
        if (cache_) {
            for (const auto& key : keys_) {
                (void)cache_->Delete(key);
            }
        }
    }

    std::string Key(const std::string& suffix) {
        std::string key = "session_cache_test:" + suffix;
        keys_.push_back(key);
        return key;
    }

    std::unique_ptr<RedisDataCache> cache_;
    std::vector<std::string> keys_;
};

TEST_F(LiveRedisDataCacheTest, BasicOps) {
    const auto key = Key("basic");
    auto st = cache_->Write(key, "value");
    ASSERT_TRUE(st.IsOk()) << st.Message();

    auto get = cache_->Read(key);
    ASSERT_TRUE(get.IsOk()) << get.GetStatus().Message();
    ASSERT_TRUE(get.Value().has_value());
    EXPECT_EQ(*get.Value(), "value");

    EXPECT_TRUE(cache_->SetExpiry(key, 60).IsOk());
    EXPECT_TRUE(cache_->SetExpiry(key, 0).IsOk());

    auto del = cache_->Delete(key);
    ASSERT_TRUE(del.IsOk()) << del.Message();
    auto gone = cache_->Read(key);
    ASSERT_TRUE(gone.IsOk());
    EXPECT_FALSE(gone.Value().has_value());
}

TEST_F(LiveRedisDataCacheTest, MissingKeyIsAbsent) {
    auto get = cache_->Read(Key("never-written"));
    ASSERT_TRUE(get.IsOk()) << get.GetStatus().Message();
    EXPECT_FALSE(get.Value().has_value());
    EXPECT_TRUE(cache_->Delete(Key("never-written")).IsOk());
}

TEST_F(LiveRedisDataCacheTest, KeysAreNormalized) {
    Key("sess_123");
    ASSERT_TRUE(cache_->Write("session_cache_test:sess 123", "v").IsOk());
    auto get = cache_->Read("session_cache_test:sess_123");
    ASSERT_TRUE(get.IsOk());
    ASSERT_TRUE(get.Value().has_value());
    EXPECT_EQ(*get.Value(), "v");
}

TEST_F(LiveRedisDataCacheTest, WriteIfAbsentHasSingleWinner) {
    const auto key = Key("contended");
    constexpr int kThreads = 8;
    std::atomic<int> winners{0};
    std::atomic<int> errors{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([this, &key, &winners, &errors, i]() {
            auto created = cache_->WriteIfAbsent(key, std::to_string(i));
            if (!created.IsOk()) {
                ++errors;
            } else if (created.Value()) {
                ++winners;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(errors.load(), 0);
    EXPECT_EQ(winners.load(), 1);
}

TEST_F(LiveRedisDataCacheTest, SessionRoundTrip) {
    using namespace session_cache::serialization;
    using session_cache::session::Session;

    const auto key = Key("S1");
    SessionSerializer serializer;
    Session session(key);
    session.Metadata().session_id = key;
    session.Metadata().max_inactive_interval = 1800;
    session.SetAttribute("user", std::string("alice"));

    auto blob = serializer.Encode(session.Metadata(), [&session](ObjectWriter& out) {
        return session.WriteObjectData(out);
    });
    ASSERT_TRUE(blob.IsOk());
    ASSERT_TRUE(cache_->Write(key, blob.Value()).IsOk());
    ASSERT_TRUE(cache_->SetExpiry(key, session.Metadata().max_inactive_interval).IsOk());

    auto stored = cache_->Read(key);
    ASSERT_TRUE(stored.IsOk());
    ASSERT_TRUE(stored.Value().has_value());

    Session loaded;
    SessionMetadata metadata;
    auto status = serializer.Decode(*stored.Value(), [&loaded](ObjectReader& in) {
        return loaded.ReadObjectData(in);
    }, &metadata);
    ASSERT_TRUE(status.IsOk()) << status.Message();
    EXPECT_EQ(metadata.session_id, key);
    EXPECT_EQ(metadata.max_inactive_interval, 1800);
    EXPECT_TRUE(AttributesEqual(loaded.Attributes(), session.Attributes()));
}
