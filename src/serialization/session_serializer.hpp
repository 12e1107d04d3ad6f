#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "serialization/attribute_value.hpp"
#include "serialization/object_stream.hpp"
#include "serialization/session_metadata.hpp"

#include <functional>
#include <string>
#include <string_view>

namespace session_cache {
namespace serialization {

// 宿主会话自行编码/解码正文, 序列化协议只负责元数据和分段
using BodyWriter = std::function<common::Status(ObjectWriter& out)>;
using BodyReader = std::function<common::Status(ObjectReader& in)>;

// 会话序列化协议
//
// 数据块格式: "RSC" + 版本号(1 字节) + 元数据段 + 正文段.
// 解码严格按写入顺序进行, 段标记不符、截断或多余字节都视为 EncodingError.
//
// 属性摘要使用 MD5, 只用于判断属性是否变化, 不能用于任何安全相关用途.
class SessionSerializer {
public:
    static constexpr std::string_view kMagic = "RSC";
    static constexpr std::uint8_t kVersion = 1;

    explicit SessionSerializer(ClassResolver resolver = {});

    void SetClassResolver(ClassResolver resolver) { resolver_ = std::move(resolver); }

    // 计算属性摘要, 相同内容的属性表总是得到相同摘要
    common::StatusOr<Fingerprint> ComputeFingerprint(const AttributeMap& attributes) const;
    common::StatusOr<Fingerprint> ComputeFingerprint(const AttributeSource& source) const;

    // 先写元数据, 再由 body_writer 写正文
    common::StatusOr<std::string> Encode(const SessionMetadata& metadata,
                                         const BodyWriter& body_writer) const;

    // 先读元数据, 再交给 body_reader 读正文; 成功后才把元数据拷贝到 metadata
    common::Status Decode(std::string_view data, const BodyReader& body_reader,
                          SessionMetadata* metadata) const;
    common::Status Decode(std::string_view data, const BodyReader& body_reader,
                          const ClassResolver& resolver, SessionMetadata* metadata) const;

private:
    ClassResolver resolver_;
};

} // namespace serialization
} // namespace session_cache
