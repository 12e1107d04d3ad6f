#pragma once

#include "common/status.hpp"

#include <string>

namespace session_cache {
namespace common {

// 缓存层对调用方暴露的四类错误
enum class CacheErrorCode {
    kConnectivity = 1,    // 后端不可达, 重试耗尽后才返回
    kEncoding = 2,        // 字节流损坏/截断, 或值不可序列化
    kDeserialization = 3, // 类型名无法通过解析上下文还原
    kConfiguration = 4,   // 启动配置缺失或格式错误
};

// 将 CacheErrorCode 转换为通用 Status
inline Status FromCacheError(CacheErrorCode error, std::string message = "") {
    switch (error) {
        case CacheErrorCode::kConnectivity:
            return Status::Unavailable(message.empty() ? "Cache backend unreachable" : message);
        case CacheErrorCode::kEncoding:
            return Status::DataLoss(message.empty() ? "Malformed session data" : message);
        case CacheErrorCode::kDeserialization:
            return Status::FailedPrecondition(message.empty() ? "Unresolvable session class" : message);
        case CacheErrorCode::kConfiguration:
            return Status::InvalidArgument(message.empty() ? "Invalid cache configuration" : message);
    }
    return Status::Internal("Unknown cache error");
}

inline bool IsConnectivityError(const Status& status) {
    return status.Code() == StatusCode::kUnavailable;
}

inline bool IsEncodingError(const Status& status) {
    return status.Code() == StatusCode::kDataLoss;
}

inline bool IsDeserializationError(const Status& status) {
    return status.Code() == StatusCode::kFailedPrecondition;
}

inline bool IsConfigurationError(const Status& status) {
    return status.Code() == StatusCode::kInvalidArgument;
}

}
}
