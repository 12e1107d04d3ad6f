#include "serialization/session_metadata.hpp"

namespace session_cache {
namespace serialization {

std::string FingerprintToHex(const Fingerprint& fingerprint) {
    static constexpr char kHexChars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(fingerprint.size() * 2);
    for (std::uint8_t byte : fingerprint) {
        hex.push_back(kHexChars[byte >> 4]);
        hex.push_back(kHexChars[byte & 0x0F]);
    }
    return hex;
}

void SessionMetadata::CopyFieldsFrom(const SessionMetadata& other) {
    session_id = other.session_id;
    creation_time = other.creation_time;
    last_accessed_time = other.last_accessed_time;
    max_inactive_interval = other.max_inactive_interval;
    attributes_hash = other.attributes_hash;
}

common::Status SessionMetadata::WriteTo(ObjectWriter& out) const {
    auto status = out.WriteString(session_id);
    if (!status.IsOk()) {
        return status;
    }
    out.WriteInt64(creation_time);
    out.WriteInt64(last_accessed_time);
    out.WriteInt32(max_inactive_interval);
    out.WriteRaw(std::string_view(reinterpret_cast<const char*>(attributes_hash.data()),
                                  attributes_hash.size()));
    return common::Status::OK();
}

common::StatusOr<SessionMetadata> SessionMetadata::ReadFrom(ObjectReader& in) {
    SessionMetadata metadata;

    auto id = in.ReadString();
    if (!id.IsOk()) {
        return id.GetStatus();
    }
    metadata.session_id = std::move(id).Value();

    auto creation = in.ReadInt64();
    if (!creation.IsOk()) {
        return creation.GetStatus();
    }
    metadata.creation_time = creation.Value();

    auto accessed = in.ReadInt64();
    if (!accessed.IsOk()) {
        return accessed.GetStatus();
    }
    metadata.last_accessed_time = accessed.Value();

    auto interval = in.ReadInt32();
    if (!interval.IsOk()) {
        return interval.GetStatus();
    }
    metadata.max_inactive_interval = interval.Value();

    auto hash = in.ReadRaw(metadata.attributes_hash.size());
    if (!hash.IsOk()) {
        return hash.GetStatus();
    }
    const auto& raw = hash.Value();
    for (std::size_t i = 0; i < metadata.attributes_hash.size(); ++i) {
        metadata.attributes_hash[i] = static_cast<std::uint8_t>(raw[i]);
    }
    return common::StatusOr<SessionMetadata>(std::move(metadata));
}

bool SessionMetadata::operator==(const SessionMetadata& other) const {
    return session_id == other.session_id &&
           creation_time == other.creation_time &&
           last_accessed_time == other.last_accessed_time &&
           max_inactive_interval == other.max_inactive_interval &&
           attributes_hash == other.attributes_hash;
}

} // namespace serialization
} // namespace session_cache
