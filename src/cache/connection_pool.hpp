#pragma once

#include "cache/options.hpp"
#include "cache/redis_connection.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace session_cache {
namespace cache {

// Redis 连接池
// 连接只在一次操作期间被借出; 连接层失败后租约被标记为失效, 归还时直接丢弃.
// 可选的后台线程按 eviction_run_interval 回收长时间空闲的连接并维持 min_idle.
class ConnectionPool {
public:
    using Factory = std::function<common::StatusOr<std::unique_ptr<RedisConnection>>()>;
    using Validator = std::function<bool(RedisConnection&)>;

    explicit ConnectionPool(PoolOptions options);
    ConnectionPool(PoolOptions options, Factory factory, Validator validator);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // 连接租赁类, RAII管理连接的获取和归还
    class Lease {
    public:
        Lease() = default;
        Lease(ConnectionPool* pool, std::unique_ptr<RedisConnection> connection);
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        ~Lease();

        RedisConnection* operator->() noexcept { return connection_.get(); }
        RedisConnection& operator*() noexcept { return *connection_; }
        explicit operator bool() const noexcept { return connection_ != nullptr; }

        // 标记连接已损坏, 归还时丢弃
        void Invalidate() noexcept { broken_ = true; }
        // 提前归还
        void Release();
    private:
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ConnectionPool* pool_ = nullptr;
        std::unique_ptr<RedisConnection> connection_;
        bool broken_ = false;
    };

    // 获取连接租赁对象, 池满且超过 acquire_timeout 时返回 Unavailable
    common::StatusOr<Lease> Acquire();

    // 执行一轮空闲连接回收
    void EvictIdle();

    std::size_t IdleCount() const;
    std::size_t TotalCount() const;
    const PoolOptions& Options() const noexcept { return options_; }

private:
    struct IdleEntry {
        std::unique_ptr<RedisConnection> connection;
        std::chrono::steady_clock::time_point since;
    };

    // 归还连接到连接池
    void Return(std::unique_ptr<RedisConnection> connection, bool broken);
    void EnsureMinIdle();
    void EvictorLoop();
    std::size_t TestsPerRun(std::size_t idle) const;

    PoolOptions options_;
    Factory factory_;
    Validator validator_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<IdleEntry> idle_; // 队头最旧, 队尾最近归还
    std::size_t total_connections_ = 0; // 总连接数(空闲 + 借出)

    bool stopping_ = false;
    std::condition_variable stop_cv_;
    std::thread evictor_;
};

} // namespace cache
} // namespace session_cache
