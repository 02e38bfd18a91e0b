#include "common/constants.h"

namespace chat_backup::common::constants {

// 备份相关常量
const uint64_t MIN_EXPIRE_TIMER_MS = 24ULL * 60 * 60 * 1000;   // 24小时
const uint64_t LOCAL_RECIPIENT_ID = 1;

// 配置相关常量
const std::string DEFAULT_CONFIG_PATH = "config/config.toml";
const std::string DEFAULT_LOG_LEVEL = "info";

// 数据库相关常量
const int DATABASE_CONNECTION_POOL_MIN = 1;
const int DATABASE_CONNECTION_POOL_MAX = 4;
const int DEFAULT_ENUMERATION_PAGE_SIZE = 500;

} // namespace chat_backup::common::constants
