#include "cache/connection_pool.hpp"

#include "common/errors.hpp"
#include "common/logger.hpp"

#include <algorithm>
#include <vector>

namespace session_cache {
namespace cache {

ConnectionPool::ConnectionPool(PoolOptions options)
    : ConnectionPool(options,
                     [options]() { return RedisConnection::Create(options); },
                     [](RedisConnection& connection) { return connection.Ping(); }) {}

ConnectionPool::ConnectionPool(PoolOptions options, Factory factory, Validator validator)
    : options_(std::move(options)), factory_(std::move(factory)), validator_(std::move(validator)) {
    if (options_.max_active == 0) {
        options_.max_active = 1;
    }
    if (options_.eviction_run_interval.count() > 0) {
        evictor_ = std::thread([this]() { EvictorLoop(); });
    }
}

ConnectionPool::~ConnectionPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    stop_cv_.notify_all();
    cv_.notify_all();
    if (evictor_.joinable()) {
        evictor_.join();
    }
}

// 连接租赁
ConnectionPool::Lease::Lease(ConnectionPool* pool, std::unique_ptr<RedisConnection> connection)
    : pool_(pool), connection_(std::move(connection)) {}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), connection_(std::move(other.connection_)), broken_(other.broken_) {
    other.pool_ = nullptr;
    other.broken_ = false;
}

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        // 归还当前连接
        Release();
        pool_ = other.pool_;
        connection_ = std::move(other.connection_);
        broken_ = other.broken_;
        other.pool_ = nullptr;
        other.broken_ = false;
    }
    return *this;
}

ConnectionPool::Lease::~Lease() {
    Release();
}

void ConnectionPool::Lease::Release() {
    if (pool_ && connection_) {
        pool_->Return(std::move(connection_), broken_);
    }
    pool_ = nullptr;
    broken_ = false;
}

common::StatusOr<ConnectionPool::Lease> ConnectionPool::Acquire() {
    const auto deadline = std::chrono::steady_clock::now() + options_.acquire_timeout;
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        if (stopping_) {
            return common::Status::Unavailable("Connection pool is shutting down");
        }

        // 策略1: 有空闲连接 -> 取最近归还的
        if (!idle_.empty()) {
            auto connection = std::move(idle_.back().connection);
            idle_.pop_back();
            if (options_.test_on_borrow) {
                lock.unlock();
                bool healthy = validator_(*connection);
                if (!healthy) {
                    SESSION_CACHE_LOG_DEBUG("[ConnectionPool] dropping connection that failed borrow check");
                    connection.reset();
                    lock.lock();
                    --total_connections_;
                    cv_.notify_one();
                    continue;
                }
            }
            return common::StatusOr<Lease>(Lease(this, std::move(connection)));
        }

        // 策略2: 未达最大连接数 -> 创建新连接
        if (total_connections_ < options_.max_active) {
            ++total_connections_;
            lock.unlock();
            auto created = factory_();
            if (!created.IsOk()) {
                std::lock_guard<std::mutex> guard(mutex_);
                --total_connections_;
                cv_.notify_one();
                return created.GetStatus();
            }
            return common::StatusOr<Lease>(Lease(this, std::move(created.Value())));
        }

        // 策略3: 达到最大连接数 -> 等待归还或超时
        bool ready = cv_.wait_until(lock, deadline, [this]() {
            return stopping_ || !idle_.empty() || total_connections_ < options_.max_active;
        });
        if (!ready) {
            return common::FromCacheError(common::CacheErrorCode::kConnectivity,
                                          "Acquire connection timeout");
        }
    }
}

void ConnectionPool::Return(std::unique_ptr<RedisConnection> connection, bool broken) {
    if (!broken && options_.test_on_return) {
        broken = !validator_(*connection);
    }

    std::unique_ptr<RedisConnection> doomed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (broken || stopping_ || idle_.size() >= options_.max_idle) {
            // 连接已断开或空闲连接过多，丢弃并减少计数
            --total_connections_;
            doomed = std::move(connection);
        } else {
            idle_.push_back(IdleEntry{std::move(connection), std::chrono::steady_clock::now()});
        }
    }
    cv_.notify_one();
}

std::size_t ConnectionPool::TestsPerRun(std::size_t idle) const {
    if (options_.eviction_per_run >= 0) {
        return std::min(idle, static_cast<std::size_t>(options_.eviction_per_run));
    }
    const auto divisor = static_cast<std::size_t>(-static_cast<long long>(options_.eviction_per_run));
    return std::min(idle, (idle + divisor - 1) / divisor);
}

void ConnectionPool::EvictIdle() {
    std::vector<std::unique_ptr<RedisConnection>> doomed;
    std::vector<IdleEntry> to_validate;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = std::chrono::steady_clock::now();
        const std::size_t tests = TestsPerRun(idle_.size());
        std::deque<IdleEntry> kept;
        // 从最旧的空闲连接开始检查
        for (std::size_t i = 0; i < tests && !idle_.empty(); ++i) {
            IdleEntry entry = std::move(idle_.front());
            idle_.pop_front();
            const std::size_t remaining_idle = idle_.size() + kept.size() + to_validate.size();
            if (now - entry.since >= options_.min_evictable_idle && remaining_idle >= options_.min_idle) {
                --total_connections_;
                doomed.push_back(std::move(entry.connection));
            } else if (options_.test_while_idle) {
                to_validate.push_back(std::move(entry));
            } else {
                kept.push_back(std::move(entry));
            }
        }
        while (!kept.empty()) {
            idle_.push_front(std::move(kept.back()));
            kept.pop_back();
        }
    }

    // 空闲检测在锁外进行, 失败的连接在这里才减少计数
    std::vector<IdleEntry> healthy;
    std::size_t failed = 0;
    for (auto& entry : to_validate) {
        if (validator_(*entry.connection)) {
            healthy.push_back(std::move(entry));
        } else {
            ++failed;
            doomed.push_back(std::move(entry.connection));
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = healthy.rbegin(); it != healthy.rend(); ++it) {
            idle_.push_front(std::move(*it));
        }
        total_connections_ -= failed;
    }
    if (!doomed.empty()) {
        SESSION_CACHE_LOG_DEBUG("[ConnectionPool] evicted {} idle connections", doomed.size());
    }
    cv_.notify_all();
    EnsureMinIdle();
}

void ConnectionPool::EnsureMinIdle() {
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_ || idle_.size() >= options_.min_idle ||
                total_connections_ >= options_.max_active) {
                return;
            }
            ++total_connections_;
        }
        auto created = factory_();
        std::lock_guard<std::mutex> lock(mutex_);
        if (!created.IsOk()) {
            --total_connections_;
            SESSION_CACHE_LOG_DEBUG("[ConnectionPool] failed to refill idle connections: {}",
                                    created.GetStatus().Message());
            cv_.notify_one();
            return;
        }
        idle_.push_back(IdleEntry{std::move(created.Value()), std::chrono::steady_clock::now()});
        cv_.notify_one();
    }
}

void ConnectionPool::EvictorLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (stop_cv_.wait_for(lock, options_.eviction_run_interval, [this]() { return stopping_; })) {
            break;
        }
        lock.unlock();
        EvictIdle();
        lock.lock();
    }
}

std::size_t ConnectionPool::IdleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

std::size_t ConnectionPool::TotalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_connections_;
}

} // namespace cache
} // namespace session_cache
