#pragma once

#include "common/logger.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <utility>

namespace session_cache {
namespace common {

// 有界重试策略: 最大尝试次数 + 两次尝试之间的等待时间
struct RetryPolicy {
    std::string name = "operation";
    int max_attempts = 1;
    std::chrono::milliseconds delay{0};
};

// 等待函数, 测试中可替换以避免真实 sleep
using SleepFunction = std::function<void(std::chrono::milliseconds)>;

inline void BlockingSleep(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

// 有界重试组合子
// op(attempt) 返回 Status 或 StatusOr<T>, attempt 从 1 开始.
// retryable(status) 判断失败是否可重试; 不可重试的失败立即返回.
// 尝试耗尽后返回最后一次的失败结果.
template <typename Op, typename Predicate>
auto Retry(const RetryPolicy& policy, Predicate&& retryable, Op&& op,
           const SleepFunction& sleep = BlockingSleep) -> decltype(op(1)) {
    const int max_attempts = policy.max_attempts > 0 ? policy.max_attempts : 1;
    int attempt = 1;
    for (;;) {
        auto result = op(attempt);
        const Status& status = StatusOf(result);
        if (status.IsOk() || !retryable(status)) {
            return result;
        }
        if (attempt >= max_attempts) {
            SESSION_CACHE_LOG_ERROR("[Retry] {} failed after {} attempts: {}",
                                    policy.name, attempt, status.Message());
            return result;
        }
        SESSION_CACHE_LOG_WARN("[Retry] {} connection failed, retry attempt {}: {}",
                               policy.name, attempt, status.Message());
        if (policy.delay.count() > 0 && sleep) {
            sleep(policy.delay);
        }
        ++attempt;
    }
}

}
}
