#pragma once

#include "cache/connection_pool.hpp"
#include "cache/data_cache.hpp"
#include "cache/options.hpp"
#include "common/retry.hpp"

#include <memory>
#include <optional>
#include <string>

namespace session_cache {
namespace cache {

// 单节点 Redis 数据缓存
// 每次操作: 借出连接 -> 执行 -> 归还 (失败也归还) -> 连接层失败时立即重试.
// 单节点没有故障转移可等, 最多尝试 kMaxAttempts 次后返回 Unavailable.
class RedisDataCache : public DataCache {
public:
    static constexpr int kMaxAttempts = 3;

    explicit RedisDataCache(PoolOptions options);
    // 使用已有连接池, 便于替换连接工厂
    explicit RedisDataCache(std::unique_ptr<ConnectionPool> pool);
    ~RedisDataCache() override;

    const common::RetryPolicy& Policy() const noexcept { return policy_; }
    ConnectionPool& Pool() noexcept { return *pool_; }

protected:
    common::Status DoWrite(const std::string& key, const std::string& value) override;
    common::StatusOr<bool> DoWriteIfAbsent(const std::string& key, const std::string& value) override;
    common::Status DoSetExpiry(const std::string& key, int seconds) override;
    common::StatusOr<std::optional<std::string>> DoRead(const std::string& key) override;
    common::Status DoDelete(const std::string& key) override;

private:
    template <typename Fn>
    auto Execute(const char* operation, const std::string& key, Fn&& fn)
        -> decltype(fn(std::declval<sw::redis::Redis&>()));

    std::unique_ptr<ConnectionPool> pool_;
    common::RetryPolicy policy_;
};

} // namespace cache
} // namespace session_cache
