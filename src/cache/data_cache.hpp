#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace session_cache {
namespace cache {

// 会话占位值, 首次保存前用 WriteIfAbsent 抢占会话ID
inline constexpr std::string_view kNullSession = "null";

// 将键中的空白字符替换为下划线
std::string NormalizeKey(std::string_view key);

bool IsNullSession(std::string_view value);

// 数据缓存抽象
// 所有实现共用同一套键规范化逻辑, 具体的后端操作由 Do* 实现.
// 连接类失败返回 Unavailable (重试耗尽后), 协议错误返回 Internal.
class DataCache {
public:
    virtual ~DataCache() = default;

    // 无条件写入, 不设置过期时间
    common::Status Write(const std::string& key, const std::string& value);
    // 原子的仅在不存在时写入, 返回是否创建成功
    common::StatusOr<bool> WriteIfAbsent(const std::string& key, const std::string& value);
    // seconds <= 0 视为不修改过期时间
    common::Status SetExpiry(const std::string& key, int seconds);
    // 键不存在时返回 std::nullopt, 不视为错误
    common::StatusOr<std::optional<std::string>> Read(const std::string& key);
    // 删除不存在的键不视为错误
    common::Status Delete(const std::string& key);

    // 用占位值抢占键
    common::StatusOr<bool> ReserveKey(const std::string& key);

protected:
    virtual common::Status DoWrite(const std::string& key, const std::string& value) = 0;
    virtual common::StatusOr<bool> DoWriteIfAbsent(const std::string& key, const std::string& value) = 0;
    virtual common::Status DoSetExpiry(const std::string& key, int seconds) = 0;
    virtual common::StatusOr<std::optional<std::string>> DoRead(const std::string& key) = 0;
    virtual common::Status DoDelete(const std::string& key) = 0;
};

} // namespace cache
} // namespace session_cache
