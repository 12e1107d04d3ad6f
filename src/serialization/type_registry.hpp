#pragma once

#include "serialization/object_stream.hpp"

#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace session_cache {
namespace serialization {

// 宿主应用可直接使用的类型解析上下文: 类型名 -> 工厂
class TypeRegistry {
public:
    TypeRegistry() = default;
    TypeRegistry(const TypeRegistry&) = delete;
    TypeRegistry& operator=(const TypeRegistry&) = delete;

    // 重复注册同名类型时覆盖旧工厂
    void Register(const std::string& type_name, ObjectFactory factory);
    bool Contains(const std::string& type_name) const;
    ObjectFactory Resolve(const std::string& type_name) const;

    // 注册表必须比返回的解析器活得更久
    ClassResolver AsResolver() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, ObjectFactory> factories_;
};

} // namespace serialization
} // namespace session_cache
