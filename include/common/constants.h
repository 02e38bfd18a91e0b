#pragma once

#include <cstdint>
#include <string>

namespace chat_backup::common::constants {

// 备份相关常量
extern const uint64_t MIN_EXPIRE_TIMER_MS;
extern const uint64_t LOCAL_RECIPIENT_ID;

// 配置相关常量
extern const std::string DEFAULT_CONFIG_PATH;
extern const std::string DEFAULT_LOG_LEVEL;

// 数据库相关常量
extern const int DATABASE_CONNECTION_POOL_MIN;
extern const int DATABASE_CONNECTION_POOL_MAX;
extern const int DEFAULT_ENUMERATION_PAGE_SIZE;

} // namespace chat_backup::common::constants
