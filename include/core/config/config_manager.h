#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>
#include <toml.hpp>

namespace chat_backup::core::config {

// 配置管理器类
class ConfigManager {
public:
    // 配置类型
    using ConfigValue = std::variant<
        std::string,
        int64_t,
        double,
        bool,
        std::vector<std::string>
    >;

    // 获取单例实例
    static ConfigManager& GetInstance();

    // 从文件加载配置，随后应用环境变量覆盖
    bool LoadFromFile(const std::string& file_path);

    // 从环境变量加载配置
    void LoadFromEnvironment();

    // 设置配置值
    void Set(const std::string& key, const ConfigValue& value);

    std::string GetString(const std::string& key, const std::string& default_value = "") const;
    int64_t GetInt(const std::string& key, int64_t default_value = 0) const;
    double GetDouble(const std::string& key, double default_value = 0.0) const;
    bool GetBool(const std::string& key, bool default_value = false) const;
    std::vector<std::string> GetStringList(const std::string& key,
                                           const std::vector<std::string>& default_value = {}) const;

    // 检查键是否存在
    bool HasKey(const std::string& key) const;

    // 清空所有配置
    void Clear();

    std::vector<std::string> GetAllKeys() const;

    // 重新加载配置文件
    bool Reload();

    bool IsLoaded() const { return is_loaded_; }

private:
    ConfigManager() = default;

    // 禁止拷贝和移动
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    // 以下函数要求调用方已持有锁
    bool ParseTomlFile(const std::string& file_path);
    void LoadNestedConfig(const std::string& prefix, const toml::value& value);
    void LoadEnvironmentLocked();
    void SetLocked(const std::string& key, const ConfigValue& value);

private:
    std::string config_file_path_;
    std::unordered_map<std::string, ConfigValue> config_values_;
    mutable std::mutex mutex_;
    std::atomic<bool> is_loaded_{false};
};

} // namespace chat_backup::core::config
