#include "serialization/type_registry.hpp"

#include <mutex>

namespace session_cache {
namespace serialization {

void TypeRegistry::Register(const std::string& type_name, ObjectFactory factory) {
    std::unique_lock lock(mutex_);
    factories_[type_name] = std::move(factory);
}

bool TypeRegistry::Contains(const std::string& type_name) const {
    std::shared_lock lock(mutex_);
    return factories_.count(type_name) > 0;
}

ObjectFactory TypeRegistry::Resolve(const std::string& type_name) const {
    std::shared_lock lock(mutex_);
    auto it = factories_.find(type_name);
    if (it == factories_.end()) {
        return {};
    }
    return it->second;
}

ClassResolver TypeRegistry::AsResolver() const {
    return [this](const std::string& type_name) { return Resolve(type_name); };
}

} // namespace serialization
} // namespace session_cache
