#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace session_cache {
namespace serialization {

class ObjectReader;
class ObjectWriter;

using Bytes = std::vector<std::uint8_t>;

// 段标记, 元数据段必须先于正文段
enum class SectionTag : std::uint8_t {
    kMetadata = 0x4D, // 'M'
    kBody = 0x42,     // 'B'
};

const char* SectionTagName(SectionTag tag);

// 宿主应用自定义的可序列化对象
class SerializableObject {
public:
    virtual ~SerializableObject() = default;

    // 类型名, 解码时交给 ClassResolver 查找对应的工厂
    virtual std::string TypeName() const = 0;
    virtual common::Status WriteObject(ObjectWriter& out) const = 0;
    virtual bool Equals(const SerializableObject& other) const = 0;
};

using ObjectPtr = std::shared_ptr<const SerializableObject>;

// 从对象负载中重建对象
using ObjectFactory = std::function<common::StatusOr<ObjectPtr>(ObjectReader& in)>;

// 类型解析上下文: 类型名 -> 工厂, 无法解析时返回空的 ObjectFactory
using ClassResolver = std::function<ObjectFactory(const std::string& type_name)>;

// 大端二进制输出流
class ObjectWriter {
public:
    static constexpr std::size_t kMaxLength = 0xFFFFFFFFu;

    ObjectWriter() = default;

    void WriteByte(std::uint8_t value);
    void WriteBool(bool value);
    void WriteInt32(std::int32_t value);
    void WriteInt64(std::int64_t value);
    void WriteDouble(double value);
    // 长度前缀(uint32) + 原始字节, 超过 kMaxLength 时返回 EncodingError 且不写入
    common::Status WriteString(std::string_view value);
    common::Status WriteBytes(const Bytes& value);
    void WriteRaw(std::string_view data);
    void BeginSection(SectionTag tag);

    const std::string& Buffer() const noexcept { return buffer_; }
    std::string Release() { return std::move(buffer_); }
    std::size_t Size() const noexcept { return buffer_.size(); }

private:
    void WriteUint32(std::uint32_t value);
    void WriteUint64(std::uint64_t value);
    common::Status WriteLength(std::size_t length);

    std::string buffer_;
};

// 输入流, 所有读取在越界时返回 DataLoss, 不会越过缓冲区读取
class ObjectReader {
public:
    explicit ObjectReader(std::string_view data, ClassResolver resolver = {});

    common::StatusOr<std::uint8_t> ReadByte();
    common::StatusOr<bool> ReadBool();
    common::StatusOr<std::int32_t> ReadInt32();
    common::StatusOr<std::int64_t> ReadInt64();
    common::StatusOr<double> ReadDouble();
    common::StatusOr<std::string> ReadString();
    common::StatusOr<Bytes> ReadBytes();
    common::StatusOr<std::string_view> ReadRaw(std::size_t length);

    // 读取段标记, 与期望不符时拒绝继续解码
    common::Status ExpectSection(SectionTag tag);

    bool AtEnd() const noexcept { return offset_ == data_.size(); }
    std::size_t Remaining() const noexcept { return data_.size() - offset_; }
    std::size_t Offset() const noexcept { return offset_; }

    const ClassResolver& Resolver() const noexcept { return resolver_; }
    void SetResolver(ClassResolver resolver) { resolver_ = std::move(resolver); }

private:
    common::StatusOr<std::uint32_t> ReadUint32();
    common::StatusOr<std::uint64_t> ReadUint64();
    common::StatusOr<std::string_view> ReadLengthPrefixed();
    common::Status Truncated(std::size_t wanted) const;

    std::string_view data_;
    std::size_t offset_ = 0;
    ClassResolver resolver_;
};

} // namespace serialization
} // namespace session_cache
