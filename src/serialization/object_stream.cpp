#include "serialization/object_stream.hpp"

#include "common/errors.hpp"

#include <cstring>

#include <fmt/format.h>

namespace session_cache {
namespace serialization {

using common::CacheErrorCode;
using common::FromCacheError;
using common::Status;
using common::StatusOr;

const char* SectionTagName(SectionTag tag) {
    switch (tag) {
        case SectionTag::kMetadata:
            return "metadata";
        case SectionTag::kBody:
            return "body";
    }
    return "unknown";
}

// ---------------- ObjectWriter ----------------

void ObjectWriter::WriteByte(std::uint8_t value) {
    buffer_.push_back(static_cast<char>(value));
}

void ObjectWriter::WriteBool(bool value) {
    WriteByte(value ? 1 : 0);
}

void ObjectWriter::WriteUint32(std::uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        WriteByte(static_cast<std::uint8_t>((value >> shift) & 0xFF));
    }
}

void ObjectWriter::WriteUint64(std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        WriteByte(static_cast<std::uint8_t>((value >> shift) & 0xFF));
    }
}

void ObjectWriter::WriteInt32(std::int32_t value) {
    WriteUint32(static_cast<std::uint32_t>(value));
}

void ObjectWriter::WriteInt64(std::int64_t value) {
    WriteUint64(static_cast<std::uint64_t>(value));
}

void ObjectWriter::WriteDouble(double value) {
    std::uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(value), "double must be 64 bit");
    std::memcpy(&bits, &value, sizeof(bits));
    WriteUint64(bits);
}

Status ObjectWriter::WriteLength(std::size_t length) {
    if (length > kMaxLength) {
        return FromCacheError(CacheErrorCode::kEncoding,
                              fmt::format("value of {} bytes exceeds the {} byte limit", length, kMaxLength));
    }
    WriteUint32(static_cast<std::uint32_t>(length));
    return Status::OK();
}

Status ObjectWriter::WriteString(std::string_view value) {
    auto status = WriteLength(value.size());
    if (!status.IsOk()) {
        return status;
    }
    buffer_.append(value.data(), value.size());
    return Status::OK();
}

Status ObjectWriter::WriteBytes(const Bytes& value) {
    auto status = WriteLength(value.size());
    if (!status.IsOk()) {
        return status;
    }
    buffer_.append(reinterpret_cast<const char*>(value.data()), value.size());
    return Status::OK();
}

void ObjectWriter::WriteRaw(std::string_view data) {
    buffer_.append(data.data(), data.size());
}

void ObjectWriter::BeginSection(SectionTag tag) {
    WriteByte(static_cast<std::uint8_t>(tag));
}

// ---------------- ObjectReader ----------------

ObjectReader::ObjectReader(std::string_view data, ClassResolver resolver)
    : data_(data), resolver_(std::move(resolver)) {}

Status ObjectReader::Truncated(std::size_t wanted) const {
    return FromCacheError(CacheErrorCode::kEncoding,
                          fmt::format("truncated stream: need {} bytes at offset {}, {} remaining",
                                      wanted, offset_, Remaining()));
}

StatusOr<std::uint8_t> ObjectReader::ReadByte() {
    if (Remaining() < 1) {
        return Truncated(1);
    }
    return StatusOr<std::uint8_t>(static_cast<std::uint8_t>(data_[offset_++]));
}

StatusOr<bool> ObjectReader::ReadBool() {
    auto byte = ReadByte();
    if (!byte.IsOk()) {
        return byte.GetStatus();
    }
    if (byte.Value() > 1) {
        return FromCacheError(CacheErrorCode::kEncoding,
                              fmt::format("invalid boolean byte {} at offset {}", byte.Value(), offset_ - 1));
    }
    return StatusOr<bool>(byte.Value() == 1);
}

StatusOr<std::uint32_t> ObjectReader::ReadUint32() {
    if (Remaining() < 4) {
        return Truncated(4);
    }
    std::uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value = (value << 8) | static_cast<std::uint8_t>(data_[offset_++]);
    }
    return StatusOr<std::uint32_t>(value);
}

StatusOr<std::uint64_t> ObjectReader::ReadUint64() {
    if (Remaining() < 8) {
        return Truncated(8);
    }
    std::uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | static_cast<std::uint8_t>(data_[offset_++]);
    }
    return StatusOr<std::uint64_t>(value);
}

StatusOr<std::int32_t> ObjectReader::ReadInt32() {
    auto raw = ReadUint32();
    if (!raw.IsOk()) {
        return raw.GetStatus();
    }
    return StatusOr<std::int32_t>(static_cast<std::int32_t>(raw.Value()));
}

StatusOr<std::int64_t> ObjectReader::ReadInt64() {
    auto raw = ReadUint64();
    if (!raw.IsOk()) {
        return raw.GetStatus();
    }
    return StatusOr<std::int64_t>(static_cast<std::int64_t>(raw.Value()));
}

StatusOr<double> ObjectReader::ReadDouble() {
    auto raw = ReadUint64();
    if (!raw.IsOk()) {
        return raw.GetStatus();
    }
    double value = 0;
    std::uint64_t bits = raw.Value();
    std::memcpy(&value, &bits, sizeof(value));
    return StatusOr<double>(value);
}

StatusOr<std::string_view> ObjectReader::ReadRaw(std::size_t length) {
    if (Remaining() < length) {
        return Truncated(length);
    }
    std::string_view view = data_.substr(offset_, length);
    offset_ += length;
    return StatusOr<std::string_view>(view);
}

StatusOr<std::string_view> ObjectReader::ReadLengthPrefixed() {
    auto length = ReadUint32();
    if (!length.IsOk()) {
        return length.GetStatus();
    }
    return ReadRaw(length.Value());
}

StatusOr<std::string> ObjectReader::ReadString() {
    auto view = ReadLengthPrefixed();
    if (!view.IsOk()) {
        return view.GetStatus();
    }
    return StatusOr<std::string>(std::string(view.Value()));
}

StatusOr<Bytes> ObjectReader::ReadBytes() {
    auto view = ReadLengthPrefixed();
    if (!view.IsOk()) {
        return view.GetStatus();
    }
    const auto& raw = view.Value();
    return StatusOr<Bytes>(Bytes(raw.begin(), raw.end()));
}

Status ObjectReader::ExpectSection(SectionTag tag) {
    auto byte = ReadByte();
    if (!byte.IsOk()) {
        return FromCacheError(CacheErrorCode::kEncoding,
                              fmt::format("missing {} section: {}", SectionTagName(tag),
                                          byte.GetStatus().Message()));
    }
    if (byte.Value() != static_cast<std::uint8_t>(tag)) {
        return FromCacheError(CacheErrorCode::kEncoding,
                              fmt::format("expected {} section at offset {}, found tag 0x{:02x}",
                                          SectionTagName(tag), offset_ - 1, byte.Value()));
    }
    return Status::OK();
}

} // namespace serialization
} // namespace session_cache
