#include "core/db/database_options.h"

#include <spdlog/spdlog.h>

#include "common/constants.h"

namespace chat_backup::core::db {

namespace {

// 小于 minimum 的配置值回退到默认值
size_t ReadAtLeast(const config::ConfigManager& config, const std::string& key,
                   int64_t default_value, int64_t minimum) {
    int64_t value = config.GetInt(key, default_value);
    if (value < minimum) {
        spdlog::warn("Invalid {} ({}), using {}", key, value, default_value);
        value = default_value;
    }
    return static_cast<size_t>(value);
}

} // namespace

DatabaseOptions DatabaseOptions::Defaults() {
    DatabaseOptions options;
    options.min_connections = static_cast<size_t>(common::constants::DATABASE_CONNECTION_POOL_MIN);
    options.max_connections = static_cast<size_t>(common::constants::DATABASE_CONNECTION_POOL_MAX);
    options.page_size = static_cast<size_t>(common::constants::DEFAULT_ENUMERATION_PAGE_SIZE);
    return options;
}

DatabaseOptions DatabaseOptions::FromConfig(const config::ConfigManager& config) {
    DatabaseOptions options = Defaults();

    options.connection_string = config.GetString("database.connection_string", "");
    options.min_connections = ReadAtLeast(config, "database.min_connections",
                                          common::constants::DATABASE_CONNECTION_POOL_MIN, 1);
    options.max_connections = ReadAtLeast(config, "database.max_connections",
                                          common::constants::DATABASE_CONNECTION_POOL_MAX, 1);
    if (options.max_connections < options.min_connections) {
        spdlog::warn("database.max_connections ({}) is below database.min_connections ({}), raising it",
                     options.max_connections, options.min_connections);
        options.max_connections = options.min_connections;
    }
    options.page_size = ReadAtLeast(config, "database.page_size",
                                    common::constants::DEFAULT_ENUMERATION_PAGE_SIZE, 1);

    return options;
}

} // namespace chat_backup::core::db
