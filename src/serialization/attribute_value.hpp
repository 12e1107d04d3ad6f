#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "serialization/object_stream.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace session_cache {
namespace serialization {

// 会话属性值: 空 / 布尔 / 整数 / 浮点 / 字符串 / 字节 / 宿主自定义对象
using AttributeValue = std::variant<std::monostate, bool, std::int64_t, double,
                                    std::string, Bytes, ObjectPtr>;

// 有序映射, 编码结果与插入顺序无关
using AttributeMap = std::map<std::string, AttributeValue>;

// 宿主会话对外暴露的属性访问接口
class AttributeSource {
public:
    virtual ~AttributeSource() = default;

    virtual std::vector<std::string> AttributeNames() const = 0;
    virtual std::optional<AttributeValue> GetAttribute(const std::string& name) const = 0;
};

// 按值比较, 自定义对象走 SerializableObject::Equals
bool ValueEquals(const AttributeValue& lhs, const AttributeValue& rhs);
bool AttributesEqual(const AttributeMap& lhs, const AttributeMap& rhs);

common::Status WriteValue(ObjectWriter& out, const AttributeValue& value);
common::StatusOr<AttributeValue> ReadValue(ObjectReader& in);

// 属性表编码: int32 数量 + (名称, 值) 序列
common::Status WriteAttributes(ObjectWriter& out, const AttributeMap& attributes);
common::StatusOr<AttributeMap> ReadAttributes(ObjectReader& in);

// 从宿主会话收集属性
AttributeMap CollectAttributes(const AttributeSource& source);

} // namespace serialization
} // namespace session_cache
