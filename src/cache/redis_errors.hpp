#pragma once

#include "common/status.hpp"

#include <sw/redis++/redis++.h>

#include <string>

namespace session_cache {
namespace cache {

// 连接层失败: IoError(含 TimeoutError) / ClosedError / 基类 Error
bool IsConnectionFailure(const sw::redis::Error& err);

// 集群故障转移期间的失败: 连接层失败和 MOVED/ASK 重定向
bool IsClusterFailover(const sw::redis::Error& err);

// 单节点: 连接层失败 -> Unavailable, 其余 -> Internal
common::Status FromRedisError(const sw::redis::Error& err, const std::string& context);

// 集群: 故障转移类失败 -> Unavailable, 其余 -> Internal
common::Status FromRedisClusterError(const sw::redis::Error& err, const std::string& context);

} // namespace cache
} // namespace session_cache
