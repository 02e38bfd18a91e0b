#pragma once

#include <cstddef>
#include <string>

#include "core/config/config_manager.h"

namespace chat_backup::core::db {

struct DatabaseOptions {
    std::string connection_string;
    size_t min_connections = 0;
    size_t max_connections = 0;
    // 遍历消息时每页读取的行数，至少为 1
    size_t page_size = 0;

    static DatabaseOptions Defaults();
    static DatabaseOptions FromConfig(const config::ConfigManager& config);
};

} // namespace chat_backup::core::db
