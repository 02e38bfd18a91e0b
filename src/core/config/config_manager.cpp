#include "core/config/config_manager.h"

#include <cstdlib>
#include <spdlog/spdlog.h>

#include "core/utils/string_utils.h"

namespace chat_backup::core::config {

ConfigManager& ConfigManager::GetInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::LoadFromFile(const std::string& file_path) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_file_path_ = file_path;
    }
    return Reload();
}

bool ConfigManager::Reload() {
    std::lock_guard<std::mutex> lock(mutex_);

    config_values_.clear();

    if (!ParseTomlFile(config_file_path_)) {
        is_loaded_ = false;
        return false;
    }

    LoadEnvironmentLocked();

    is_loaded_ = true;
    spdlog::debug("Loaded {} configuration keys from {}", config_values_.size(), config_file_path_);
    return true;
}

bool ConfigManager::ParseTomlFile(const std::string& file_path) {
    try {
        auto data = toml::parse(file_path);
        LoadNestedConfig("", data);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse TOML configuration file {}: {}", file_path, e.what());
        return false;
    }
}

void ConfigManager::LoadNestedConfig(const std::string& prefix, const toml::value& value) {
    if (value.is_table()) {
        // 嵌套表展开为 a.b.c 形式的键
        for (const auto& [key, val] : value.as_table()) {
            std::string new_prefix = prefix.empty() ? key : prefix + "." + key;
            LoadNestedConfig(new_prefix, val);
        }
    } else if (value.is_array()) {
        // 只支持字符串数组
        std::vector<std::string> string_list;
        for (const auto& item : value.as_array()) {
            if (item.is_string()) {
                string_list.push_back(item.as_string());
            } else {
                spdlog::warn("Ignoring non-string element in configuration array {}", prefix);
            }
        }
        SetLocked(prefix, string_list);
    } else if (value.is_string()) {
        SetLocked(prefix, std::string(value.as_string()));
    } else if (value.is_integer()) {
        SetLocked(prefix, static_cast<int64_t>(value.as_integer()));
    } else if (value.is_floating()) {
        SetLocked(prefix, static_cast<double>(value.as_floating()));
    } else if (value.is_boolean()) {
        SetLocked(prefix, value.as_boolean());
    }
}

void ConfigManager::LoadFromEnvironment() {
    std::lock_guard<std::mutex> lock(mutex_);
    LoadEnvironmentLocked();
}

void ConfigManager::LoadEnvironmentLocked() {
    const char* log_level = std::getenv("CHAT_BACKUP_LOG_LEVEL");
    if (log_level) {
        SetLocked("log.level", std::string(log_level));
    }

    const char* local_address = std::getenv("CHAT_BACKUP_LOCAL_ADDRESS");
    if (local_address) {
        SetLocked("backup.local_address", std::string(local_address));
    }

    // DATABASE_URL 优先，其次是本工具自己的变量
    const char* database_url = std::getenv("DATABASE_URL");
    if (database_url) {
        std::string db_url(database_url);
        if (utils::StringUtils::StartsWith(db_url, "postgres://")) {
            db_url = "postgresql://" + db_url.substr(11);
        }
        SetLocked("database.connection_string", db_url);
    } else {
        const char* db_url = std::getenv("CHAT_BACKUP_DB_URL");
        if (db_url) {
            SetLocked("database.connection_string", std::string(db_url));
        }
    }
}

void ConfigManager::Set(const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    SetLocked(key, value);
}

void ConfigManager::SetLocked(const std::string& key, const ConfigValue& value) {
    config_values_[key] = value;
}

std::string ConfigManager::GetString(const std::string& key, const std::string& default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = config_values_.find(key);
    if (it != config_values_.end() && std::holds_alternative<std::string>(it->second)) {
        return std::get<std::string>(it->second);
    }

    return default_value;
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = config_values_.find(key);
    if (it != config_values_.end() && std::holds_alternative<int64_t>(it->second)) {
        return std::get<int64_t>(it->second);
    }

    return default_value;
}

double ConfigManager::GetDouble(const std::string& key, double default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = config_values_.find(key);
    if (it != config_values_.end()) {
        if (std::holds_alternative<double>(it->second)) {
            return std::get<double>(it->second);
        }
        if (std::holds_alternative<int64_t>(it->second)) {
            return static_cast<double>(std::get<int64_t>(it->second));
        }
    }

    return default_value;
}

bool ConfigManager::GetBool(const std::string& key, bool default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = config_values_.find(key);
    if (it != config_values_.end() && std::holds_alternative<bool>(it->second)) {
        return std::get<bool>(it->second);
    }

    return default_value;
}

std::vector<std::string> ConfigManager::GetStringList(
    const std::string& key,
    const std::vector<std::string>& default_value) const {

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = config_values_.find(key);
    if (it != config_values_.end() && std::holds_alternative<std::vector<std::string>>(it->second)) {
        return std::get<std::vector<std::string>>(it->second);
    }

    return default_value;
}

bool ConfigManager::HasKey(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_values_.find(key) != config_values_.end();
}

void ConfigManager::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    config_values_.clear();
    is_loaded_ = false;
}

std::vector<std::string> ConfigManager::GetAllKeys() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> keys;
    keys.reserve(config_values_.size());

    for (const auto& [key, _] : config_values_) {
        keys.push_back(key);
    }

    return keys;
}

} // namespace chat_backup::core::config
