#include "cache/data_cache.hpp"

#include <cctype>

namespace session_cache {
namespace cache {

std::string NormalizeKey(std::string_view key) {
    std::string normalized(key);
    for (auto& c : normalized) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            c = '_';
        }
    }
    return normalized;
}

bool IsNullSession(std::string_view value) {
    return value == kNullSession;
}

common::Status DataCache::Write(const std::string& key, const std::string& value) {
    return DoWrite(NormalizeKey(key), value);
}

common::StatusOr<bool> DataCache::WriteIfAbsent(const std::string& key, const std::string& value) {
    return DoWriteIfAbsent(NormalizeKey(key), value);
}

common::Status DataCache::SetExpiry(const std::string& key, int seconds) {
    if (seconds <= 0) {
        return common::Status::OK();
    }
    return DoSetExpiry(NormalizeKey(key), seconds);
}

common::StatusOr<std::optional<std::string>> DataCache::Read(const std::string& key) {
    return DoRead(NormalizeKey(key));
}

common::Status DataCache::Delete(const std::string& key) {
    return DoDelete(NormalizeKey(key));
}

common::StatusOr<bool> DataCache::ReserveKey(const std::string& key) {
    return WriteIfAbsent(key, std::string(kNullSession));
}

} // namespace cache
} // namespace session_cache
