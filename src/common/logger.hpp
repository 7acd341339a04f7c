#pragma once

#include "common/config.hpp"

#include <spdlog/logger.h>
#include <memory>

namespace quota {
namespace common {

void InitLogger(const LoggingConfig& config);
void ShutdownLogger();

// 获取全局日志器
std::shared_ptr<spdlog::logger> GetLogger();

// 日志宏定义
#define QUOTA_LOG_DEBUG(...) ::quota::common::GetLogger()->debug(__VA_ARGS__)
#define QUOTA_LOG_INFO(...)  ::quota::common::GetLogger()->info(__VA_ARGS__)
#define QUOTA_LOG_WARN(...)  ::quota::common::GetLogger()->warn(__VA_ARGS__)
#define QUOTA_LOG_ERROR(...) ::quota::common::GetLogger()->error(__VA_ARGS__)

}
}
