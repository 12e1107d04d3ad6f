#include "serialization/attribute_value.hpp"

#include "common/errors.hpp"

#include <cstring>
#include <limits>
#include <type_traits>

#include <fmt/format.h>

namespace session_cache {
namespace serialization {

using common::CacheErrorCode;
using common::FromCacheError;
using common::Status;
using common::StatusOr;

namespace {

enum class ValueTag : std::uint8_t {
    kNull = 0,
    kBool = 1,
    kInt64 = 2,
    kDouble = 3,
    kString = 4,
    kBytes = 5,
    kObject = 6,
};

Status WriteObjectValue(ObjectWriter& out, const ObjectPtr& object) {
    if (!object) {
        return FromCacheError(CacheErrorCode::kEncoding, "null object attribute is not serializable");
    }
    const std::string type_name = object->TypeName();
    if (type_name.empty()) {
        return FromCacheError(CacheErrorCode::kEncoding, "object attribute without type name");
    }
    // 对象负载单独成块, 读端可以校验对象是否恰好读完
    ObjectWriter payload;
    auto status = object->WriteObject(payload);
    if (!status.IsOk()) {
        return FromCacheError(CacheErrorCode::kEncoding,
                              fmt::format("failed to serialize {}: {}", type_name, status.Message()));
    }
    out.WriteByte(static_cast<std::uint8_t>(ValueTag::kObject));
    status = out.WriteString(type_name);
    if (!status.IsOk()) {
        return status;
    }
    return out.WriteString(payload.Buffer());
}

StatusOr<AttributeValue> ReadObjectValue(ObjectReader& in) {
    auto type_name = in.ReadString();
    if (!type_name.IsOk()) {
        return type_name.GetStatus();
    }
    auto payload = in.ReadString();
    if (!payload.IsOk()) {
        return payload.GetStatus();
    }

    ObjectFactory factory;
    if (in.Resolver()) {
        factory = in.Resolver()(type_name.Value());
    }
    if (!factory) {
        return FromCacheError(CacheErrorCode::kDeserialization,
                              "class not resolvable: " + type_name.Value());
    }

    ObjectReader nested(payload.Value(), in.Resolver());
    auto object = factory(nested);
    if (!object.IsOk()) {
        return object.GetStatus();
    }
    if (!object.Value()) {
        return FromCacheError(CacheErrorCode::kEncoding,
                              "factory for " + type_name.Value() + " returned no object");
    }
    if (!nested.AtEnd()) {
        return FromCacheError(CacheErrorCode::kEncoding,
                              fmt::format("{} left {} unread payload bytes", type_name.Value(),
                                          nested.Remaining()));
    }
    return StatusOr<AttributeValue>(AttributeValue(std::move(object.Value())));
}

} // namespace

bool ValueEquals(const AttributeValue& lhs, const AttributeValue& rhs) {
    if (lhs.index() != rhs.index()) {
        return false;
    }
    if (const auto* left = std::get_if<ObjectPtr>(&lhs)) {
        const auto& right = std::get<ObjectPtr>(rhs);
        if (!*left || !right) {
            return *left == right;
        }
        return (*left)->TypeName() == right->TypeName() && (*left)->Equals(*right);
    }
    if (const auto* left = std::get_if<double>(&lhs)) {
        // 按编码后的位模式比较, NaN 与其解码结果相等
        const double right = std::get<double>(rhs);
        std::uint64_t left_bits = 0;
        std::uint64_t right_bits = 0;
        std::memcpy(&left_bits, left, sizeof(left_bits));
        std::memcpy(&right_bits, &right, sizeof(right_bits));
        return left_bits == right_bits;
    }
    return lhs == rhs;
}

bool AttributesEqual(const AttributeMap& lhs, const AttributeMap& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    auto it = rhs.begin();
    for (const auto& [name, value] : lhs) {
        if (name != it->first || !ValueEquals(value, it->second)) {
            return false;
        }
        ++it;
    }
    return true;
}

Status WriteValue(ObjectWriter& out, const AttributeValue& value) {
    return std::visit(
        [&out](const auto& v) -> Status {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::monostate>) {
                out.WriteByte(static_cast<std::uint8_t>(ValueTag::kNull));
            } else if constexpr (std::is_same_v<V, bool>) {
                out.WriteByte(static_cast<std::uint8_t>(ValueTag::kBool));
                out.WriteBool(v);
            } else if constexpr (std::is_same_v<V, std::int64_t>) {
                out.WriteByte(static_cast<std::uint8_t>(ValueTag::kInt64));
                out.WriteInt64(v);
            } else if constexpr (std::is_same_v<V, double>) {
                out.WriteByte(static_cast<std::uint8_t>(ValueTag::kDouble));
                out.WriteDouble(v);
            } else if constexpr (std::is_same_v<V, std::string>) {
                out.WriteByte(static_cast<std::uint8_t>(ValueTag::kString));
                return out.WriteString(v);
            } else if constexpr (std::is_same_v<V, Bytes>) {
                out.WriteByte(static_cast<std::uint8_t>(ValueTag::kBytes));
                return out.WriteBytes(v);
            } else {
                return WriteObjectValue(out, v);
            }
            return Status::OK();
        },
        value);
}

StatusOr<AttributeValue> ReadValue(ObjectReader& in) {
    auto tag = in.ReadByte();
    if (!tag.IsOk()) {
        return tag.GetStatus();
    }
    switch (static_cast<ValueTag>(tag.Value())) {
        case ValueTag::kNull:
            return StatusOr<AttributeValue>(AttributeValue{});
        case ValueTag::kBool: {
            auto v = in.ReadBool();
            if (!v.IsOk()) return v.GetStatus();
            return StatusOr<AttributeValue>(AttributeValue(v.Value()));
        }
        case ValueTag::kInt64: {
            auto v = in.ReadInt64();
            if (!v.IsOk()) return v.GetStatus();
            return StatusOr<AttributeValue>(AttributeValue(v.Value()));
        }
        case ValueTag::kDouble: {
            auto v = in.ReadDouble();
            if (!v.IsOk()) return v.GetStatus();
            return StatusOr<AttributeValue>(AttributeValue(v.Value()));
        }
        case ValueTag::kString: {
            auto v = in.ReadString();
            if (!v.IsOk()) return v.GetStatus();
            return StatusOr<AttributeValue>(AttributeValue(std::move(v).Value()));
        }
        case ValueTag::kBytes: {
            auto v = in.ReadBytes();
            if (!v.IsOk()) return v.GetStatus();
            return StatusOr<AttributeValue>(AttributeValue(std::move(v).Value()));
        }
        case ValueTag::kObject:
            return ReadObjectValue(in);
    }
    return FromCacheError(CacheErrorCode::kEncoding,
                          fmt::format("unknown value tag 0x{:02x} at offset {}", tag.Value(),
                                      in.Offset() - 1));
}

Status WriteAttributes(ObjectWriter& out, const AttributeMap& attributes) {
    if (attributes.size() > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
        return FromCacheError(CacheErrorCode::kEncoding, "too many attributes");
    }
    out.WriteInt32(static_cast<std::int32_t>(attributes.size()));
    for (const auto& [name, value] : attributes) {
        auto status = out.WriteString(name);
        if (status.IsOk()) {
            status = WriteValue(out, value);
        }
        if (!status.IsOk()) {
            return FromCacheError(CacheErrorCode::kEncoding,
                                  "attribute '" + name + "': " + status.Message());
        }
    }
    return Status::OK();
}

StatusOr<AttributeMap> ReadAttributes(ObjectReader& in) {
    auto count = in.ReadInt32();
    if (!count.IsOk()) {
        return count.GetStatus();
    }
    if (count.Value() < 0) {
        return FromCacheError(CacheErrorCode::kEncoding,
                              fmt::format("negative attribute count {}", count.Value()));
    }

    AttributeMap attributes;
    for (std::int32_t i = 0; i < count.Value(); ++i) {
        auto name = in.ReadString();
        if (!name.IsOk()) {
            return name.GetStatus();
        }
        auto value = ReadValue(in);
        if (!value.IsOk()) {
            return value.GetStatus();
        }
        attributes[std::move(name).Value()] = std::move(value).Value();
    }
    return StatusOr<AttributeMap>(std::move(attributes));
}

AttributeMap CollectAttributes(const AttributeSource& source) {
    AttributeMap attributes;
    for (const auto& name : source.AttributeNames()) {
        auto value = source.GetAttribute(name);
        if (value) {
            attributes.emplace(name, std::move(*value));
        }
    }
    return attributes;
}

} // namespace serialization
} // namespace session_cache
