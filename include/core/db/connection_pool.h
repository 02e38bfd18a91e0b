#pragma once

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

#include <pqxx/pqxx>

namespace chat_backup::core::db {

// 数据库连接池类
class ConnectionPool {
public:
    // 单例访问
    static ConnectionPool& GetInstance();

    // 初始化连接池
    bool Initialize(const std::string& connection_string,
                    size_t min_connections = 1,
                    size_t max_connections = 4);

    ~ConnectionPool();

    // 获取连接，连接数达到上限时阻塞等待
    std::shared_ptr<pqxx::connection> GetConnection();

    // 释放连接
    void ReleaseConnection(std::shared_ptr<pqxx::connection> connection);

    // 关闭所有连接
    void CloseAll();

    // 获取连接池状态
    struct PoolStats {
        size_t active_connections;
        size_t idle_connections;
    };
    PoolStats GetStats() const;

private:
    ConnectionPool() = default;

    // 禁止拷贝和移动
    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;
    ConnectionPool(ConnectionPool&&) = delete;
    ConnectionPool& operator=(ConnectionPool&&) = delete;

    std::shared_ptr<pqxx::connection> CreateConnection();

private:
    std::string connection_string_;
    size_t min_connections_ = 1;
    size_t max_connections_ = 4;

    std::deque<std::shared_ptr<pqxx::connection>> idle_connections_;
    std::unordered_set<std::shared_ptr<pqxx::connection>> active_connections_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    bool shutdown_ = false;
    bool initialized_ = false;
};

} // namespace chat_backup::core::db
