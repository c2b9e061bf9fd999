#pragma once

#include "common/config.hpp"

#include <spdlog/logger.h>
#include <memory>

namespace dispatch {
namespace common {

void InitLogger(const LoggingConfig& config);
void ShutdownLogger();

// 获取全局日志器
std::shared_ptr<spdlog::logger> GetLogger();

// 日志宏定义
#define DISPATCH_LOG_DEBUG(...) ::dispatch::common::GetLogger()->debug(__VA_ARGS__)
#define DISPATCH_LOG_INFO(...) ::dispatch::common::GetLogger()->info(__VA_ARGS__)
#define DISPATCH_LOG_WARN(...) ::dispatch::common::GetLogger()->warn(__VA_ARGS__)
#define DISPATCH_LOG_ERROR(...) ::dispatch::common::GetLogger()->error(__VA_ARGS__)

}
}
