#include "cache/redis_errors.hpp"

#include "common/errors.hpp"

#include <typeinfo>

namespace session_cache {
namespace cache {

bool IsConnectionFailure(const sw::redis::Error& err) {
    if (dynamic_cast<const sw::redis::IoError*>(&err) != nullptr ||
        dynamic_cast<const sw::redis::ClosedError*>(&err) != nullptr) {
        return true;
    }
    // hiredis 的 REDIS_ERR_OTHER (如重连时域名解析失败) 以基类 Error 抛出,
    // 与 RedisConnection::Create 中建立连接失败的处理保持一致
    return typeid(err) == typeid(sw::redis::Error);
}

bool IsClusterFailover(const sw::redis::Error& err) {
    // 基类 Error 还包括重定向次数耗尽和槽位信息不可用
    return IsConnectionFailure(err) ||
           dynamic_cast<const sw::redis::RedirectionError*>(&err) != nullptr;
}

common::Status FromRedisError(const sw::redis::Error& err, const std::string& context) {
    std::string message = context + ": " + err.what();
    if (IsConnectionFailure(err)) {
        return common::FromCacheError(common::CacheErrorCode::kConnectivity, std::move(message));
    }
    return common::Status::Internal(std::move(message));
}

common::Status FromRedisClusterError(const sw::redis::Error& err, const std::string& context) {
    std::string message = context + ": " + err.what();
    if (IsClusterFailover(err)) {
        return common::FromCacheError(common::CacheErrorCode::kConnectivity, std::move(message));
    }
    return common::Status::Internal(std::move(message));
}

} // namespace cache
} // namespace session_cache
