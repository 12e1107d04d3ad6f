#pragma once

#include "common/config.hpp"

#include <spdlog/logger.h>
#include <memory>

namespace session_cache {
namespace common {

void InitLogger(const LoggingConfig& config);
void ShutdownLogger();

// 获取全局日志器
std::shared_ptr<spdlog::logger> GetLogger();

// 日志宏定义
#define SESSION_CACHE_LOG_DEBUG(...) ::session_cache::common::GetLogger()->debug(__VA_ARGS__)
#define SESSION_CACHE_LOG_INFO(...)  ::session_cache::common::GetLogger()->info(__VA_ARGS__)
#define SESSION_CACHE_LOG_WARN(...)  ::session_cache::common::GetLogger()->warn(__VA_ARGS__)
#define SESSION_CACHE_LOG_ERROR(...) ::session_cache::common::GetLogger()->error(__VA_ARGS__)

}
}
