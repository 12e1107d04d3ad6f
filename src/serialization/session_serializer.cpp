#include "serialization/session_serializer.hpp"

#include "common/errors.hpp"
#include "common/logger.hpp"

#include <openssl/evp.h>

#include <fmt/format.h>

namespace session_cache {
namespace serialization {

using common::CacheErrorCode;
using common::FromCacheError;
using common::Status;
using common::StatusOr;

namespace {

Status ReadHeader(ObjectReader& in) {
    auto magic = in.ReadRaw(SessionSerializer::kMagic.size());
    if (!magic.IsOk() || magic.Value() != SessionSerializer::kMagic) {
        return FromCacheError(CacheErrorCode::kEncoding, "not a session blob: bad magic");
    }
    auto version = in.ReadByte();
    if (!version.IsOk()) {
        return version.GetStatus();
    }
    if (version.Value() != SessionSerializer::kVersion) {
        return FromCacheError(CacheErrorCode::kEncoding,
                              fmt::format("unsupported session blob version {}", version.Value()));
    }
    return Status::OK();
}

} // namespace

SessionSerializer::SessionSerializer(ClassResolver resolver)
    : resolver_(std::move(resolver)) {}

StatusOr<Fingerprint> SessionSerializer::ComputeFingerprint(const AttributeMap& attributes) const {
    ObjectWriter out;
    auto status = WriteAttributes(out, attributes);
    if (!status.IsOk()) {
        return status;
    }

    const std::string& data = out.Buffer();
    Fingerprint digest{};
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len, EVP_md5(), nullptr) != 1 ||
        digest_len != digest.size()) {
        return Status::Internal("MD5 digest failed");
    }
    return StatusOr<Fingerprint>(digest);
}

StatusOr<Fingerprint> SessionSerializer::ComputeFingerprint(const AttributeSource& source) const {
    return ComputeFingerprint(CollectAttributes(source));
}

StatusOr<std::string> SessionSerializer::Encode(const SessionMetadata& metadata,
                                                const BodyWriter& body_writer) const {
    ObjectWriter out;
    out.WriteRaw(kMagic);
    out.WriteByte(kVersion);

    out.BeginSection(SectionTag::kMetadata);
    auto status = metadata.WriteTo(out);
    if (!status.IsOk()) {
        return FromCacheError(CacheErrorCode::kEncoding,
                              "failed to write session metadata: " + status.Message());
    }

    out.BeginSection(SectionTag::kBody);
    if (body_writer) {
        status = body_writer(out);
        if (!status.IsOk()) {
            return FromCacheError(CacheErrorCode::kEncoding,
                                  "failed to write session " + metadata.session_id + ": " + status.Message());
        }
    }
    return StatusOr<std::string>(out.Release());
}

Status SessionSerializer::Decode(std::string_view data, const BodyReader& body_reader,
                                 SessionMetadata* metadata) const {
    return Decode(data, body_reader, resolver_, metadata);
}

Status SessionSerializer::Decode(std::string_view data, const BodyReader& body_reader,
                                 const ClassResolver& resolver, SessionMetadata* metadata) const {
    if (metadata == nullptr) {
        return Status::InvalidArgument("metadata output is null");
    }

    ObjectReader in(data, resolver);
    auto status = ReadHeader(in);
    if (!status.IsOk()) {
        return status;
    }

    status = in.ExpectSection(SectionTag::kMetadata);
    if (!status.IsOk()) {
        return status;
    }
    auto decoded = SessionMetadata::ReadFrom(in);
    if (!decoded.IsOk()) {
        return decoded.GetStatus();
    }

    status = in.ExpectSection(SectionTag::kBody);
    if (!status.IsOk()) {
        return status;
    }
    if (body_reader) {
        status = body_reader(in);
        if (!status.IsOk()) {
            SESSION_CACHE_LOG_WARN("[Serializer] failed to read body of session {}: {}",
                                   decoded.Value().session_id, status.Message());
            return status;
        }
    }
    if (!in.AtEnd()) {
        return FromCacheError(CacheErrorCode::kEncoding,
                              fmt::format("{} trailing bytes after session body", in.Remaining()));
    }

    metadata->CopyFieldsFrom(decoded.Value());
    return Status::OK();
}

} // namespace serialization
} // namespace session_cache
