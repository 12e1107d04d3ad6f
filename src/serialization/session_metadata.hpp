#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "serialization/object_stream.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace session_cache {
namespace serialization {

// 128 位属性摘要
using Fingerprint = std::array<std::uint8_t, 16>;

std::string FingerprintToHex(const Fingerprint& fingerprint);

// 会话元数据
// 解码时通过 CopyFieldsFrom 覆盖到现有实例上, 不替换对象本身
struct SessionMetadata {
    std::string session_id;
    std::int64_t creation_time = 0;      // 毫秒时间戳
    std::int64_t last_accessed_time = 0; // 毫秒时间戳
    std::int32_t max_inactive_interval = 0; // 秒
    Fingerprint attributes_hash{};       // 全零表示未知

    void CopyFieldsFrom(const SessionMetadata& other);

    common::Status WriteTo(ObjectWriter& out) const;
    static common::StatusOr<SessionMetadata> ReadFrom(ObjectReader& in);

    bool operator==(const SessionMetadata& other) const;
    bool operator!=(const SessionMetadata& other) const { return !(*this == other); }
};

} // namespace serialization
} // namespace session_cache
