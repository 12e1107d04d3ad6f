#include "cache/redis_cluster_data_cache.hpp"
#include "cache/redis_data_cache.hpp"
#include "common/errors.hpp"
#include "common/retry.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <vector>

using session_cache::common::IsConnectivityError;
using session_cache::common::Retry;
using session_cache::common::RetryPolicy;
using session_cache::common::Status;
using session_cache::common::StatusCode;
using session_cache::common::StatusOr;

namespace {

RetryPolicy MakePolicy(int attempts, std::chrono::milliseconds delay) {
    RetryPolicy policy;
    policy.name = "test";
    policy.max_attempts = attempts;
    policy.delay = delay;
    return policy;
}

} // namespace

TEST(RetryTest, SucceedsOnFirstAttempt) {
    int calls = 0;
    auto status = Retry(MakePolicy(3, std::chrono::milliseconds(0)), IsConnectivityError, [&](int) {
        ++calls;
        return Status::OK();
    });
    EXPECT_TRUE(status.IsOk());
    EXPECT_EQ(calls, 1);
}

// 单节点: 连接失败立即重试, 共 3 次
TEST(RetryTest, SingleNodeBoundIsThreeImmediateAttempts) {
    int calls = 0;
    int sleeps = 0;
    auto status = Retry(
        MakePolicy(session_cache::cache::RedisDataCache::kMaxAttempts, std::chrono::milliseconds(0)),
        IsConnectivityError,
        [&](int) {
            ++calls;
            return Status::Unavailable("connection refused");
        },
        [&](std::chrono::milliseconds) { ++sleeps; });
    EXPECT_EQ(status.Code(), StatusCode::kUnavailable);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(sleeps, 0);
}

// 集群: 30 次尝试, 每两次之间等待 4 秒
TEST(RetryTest, ClusterBoundIsThirtyAttemptsWithFailoverWait) {
    using session_cache::cache::RedisClusterDataCache;
    int calls = 0;
    std::vector<std::chrono::milliseconds> waits;
    auto status = Retry(
        MakePolicy(RedisClusterDataCache::kMaxAttempts, RedisClusterDataCache::kFailoverWait),
        IsConnectivityError,
        [&](int) {
            ++calls;
            return Status::Unavailable("CLUSTERDOWN");
        },
        [&](std::chrono::milliseconds d) { waits.push_back(d); });
    EXPECT_EQ(status.Code(), StatusCode::kUnavailable);
    EXPECT_EQ(calls, 30);
    ASSERT_EQ(waits.size(), 29u);
    for (const auto& w : waits) {
        EXPECT_EQ(w, std::chrono::milliseconds(4000));
    }
}

TEST(RetryTest, NonRetryableFailureReturnsImmediately) {
    int calls = 0;
    auto status = Retry(MakePolicy(30, std::chrono::milliseconds(4000)), IsConnectivityError,
                        [&](int) {
                            ++calls;
                            return Status::Internal("WRONGTYPE");
                        },
                        [](std::chrono::milliseconds) { FAIL() << "must not wait"; });
    EXPECT_EQ(status.Code(), StatusCode::kInternal);
    EXPECT_EQ(calls, 1);
}

TEST(RetryTest, RecoversAfterTransientFailures) {
    std::vector<int> attempts;
    auto result = Retry(MakePolicy(3, std::chrono::milliseconds(0)), IsConnectivityError,
                        [&](int attempt) -> StatusOr<int> {
                            attempts.push_back(attempt);
                            if (attempt < 3) {
                                return Status::Unavailable("reset by peer");
                            }
                            return StatusOr<int>(42);
                        });
    ASSERT_TRUE(result.IsOk()) << result.GetStatus().Message();
    EXPECT_EQ(result.Value(), 42);
    EXPECT_EQ(attempts, (std::vector<int>{1, 2, 3}));
}

TEST(RetryTest, NonPositiveAttemptLimitStillRunsOnce) {
    int calls = 0;
    auto status = Retry(MakePolicy(0, std::chrono::milliseconds(0)), IsConnectivityError, [&](int) {
        ++calls;
        return Status::Unavailable("down");
    });
    EXPECT_FALSE(status.IsOk());
    EXPECT_EQ(calls, 1);
}

TEST(RetryTest, ClientPoliciesMatchBounds) {
    EXPECT_EQ(session_cache::cache::RedisDataCache::kMaxAttempts, 3);
    EXPECT_EQ(session_cache::cache::RedisClusterDataCache::kMaxAttempts, 30);
    EXPECT_EQ(session_cache::cache::RedisClusterDataCache::kFailoverWait, std::chrono::seconds(4));
}

// 每类缓存错误对应一个独立的状态码和名称
TEST(CacheErrorTest, EachKindHasItsOwnStatusCode) {
    using session_cache::common::CacheErrorCode;
    using session_cache::common::FromCacheError;
    using session_cache::common::StatusCodeToString;

    auto connectivity = FromCacheError(CacheErrorCode::kConnectivity);
    auto encoding = FromCacheError(CacheErrorCode::kEncoding);
    auto deserialization = FromCacheError(CacheErrorCode::kDeserialization, "no class com.example.Missing");
    auto configuration = FromCacheError(CacheErrorCode::kConfiguration);

    EXPECT_EQ(StatusCodeToString(connectivity.Code()), "Unavailable");
    EXPECT_EQ(StatusCodeToString(encoding.Code()), "Data Loss");
    EXPECT_EQ(StatusCodeToString(deserialization.Code()), "Failed Precondition");
    EXPECT_EQ(StatusCodeToString(configuration.Code()), "Invalid Argument");
    EXPECT_EQ(StatusCodeToString(Status::Internal("x").Code()), "Internal");
    EXPECT_EQ(StatusCodeToString(Status::OK().Code()), "OK");

    EXPECT_EQ(connectivity.Message(), "Cache backend unreachable");
    EXPECT_EQ(deserialization.Message(), "no class com.example.Missing");
    EXPECT_TRUE(IsConnectivityError(connectivity));
    EXPECT_FALSE(IsConnectivityError(encoding));
}
