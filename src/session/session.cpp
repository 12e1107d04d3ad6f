#include "session/session.hpp"

namespace session_cache {
namespace session {

using serialization::AttributeMap;
using serialization::AttributeValue;

Session::Session(std::string id) : id_(std::move(id)) {
    metadata_.session_id = id_;
}

std::vector<std::string> Session::AttributeNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(attributes_.size());
    for (const auto& entry : attributes_) {
        names.push_back(entry.first);
    }
    return names;
}

std::optional<AttributeValue> Session::GetAttribute(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = attributes_.find(name);
    if (it == attributes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Session::SetAttribute(const std::string& name, AttributeValue value) {
    std::lock_guard<std::mutex> lock(mutex_);
    attributes_[name] = std::move(value);
}

void Session::RemoveAttribute(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    attributes_.erase(name);
}

AttributeMap Session::Attributes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attributes_;
}

common::Status Session::WriteObjectData(serialization::ObjectWriter& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto status = out.WriteString(id_);
    if (!status.IsOk()) {
        return status;
    }
    return serialization::WriteAttributes(out, attributes_);
}

common::Status Session::ReadObjectData(serialization::ObjectReader& in) {
    auto id = in.ReadString();
    if (!id.IsOk()) {
        return id.GetStatus();
    }
    auto attributes = serialization::ReadAttributes(in);
    if (!attributes.IsOk()) {
        return attributes.GetStatus();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    id_ = std::move(id).Value();
    attributes_ = std::move(attributes).Value();
    return common::Status::OK();
}

} // namespace session
} // namespace session_cache
