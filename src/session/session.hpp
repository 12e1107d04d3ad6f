#pragma once

#include "common/status.hpp"
#include "serialization/attribute_value.hpp"
#include "serialization/object_stream.hpp"
#include "serialization/session_metadata.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace session_cache {
namespace session {

// 宿主会话的参考实现: 属性表 + 正文编码
// 解码时原地替换属性, 对象本身保持不变
class Session : public serialization::AttributeSource {
public:
    Session() = default;
    explicit Session(std::string id);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& Id() const noexcept { return id_; }

    std::vector<std::string> AttributeNames() const override;
    std::optional<serialization::AttributeValue> GetAttribute(const std::string& name) const override;
    void SetAttribute(const std::string& name, serialization::AttributeValue value);
    void RemoveAttribute(const std::string& name);
    serialization::AttributeMap Attributes() const;

    // 正文编码, 可直接作为 BodyWriter / BodyReader 使用
    common::Status WriteObjectData(serialization::ObjectWriter& out) const;
    common::Status ReadObjectData(serialization::ObjectReader& in);

    // 会话元数据, 解码时由 SessionSerializer 原地覆盖
    serialization::SessionMetadata& Metadata() noexcept { return metadata_; }
    const serialization::SessionMetadata& Metadata() const noexcept { return metadata_; }

private:
    std::string id_;
    mutable std::mutex mutex_;
    serialization::AttributeMap attributes_;
    serialization::SessionMetadata metadata_;
};

} // namespace session
} // namespace session_cache
