#include "core/db/connection_pool.h"

#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace chat_backup::core::db {

ConnectionPool& ConnectionPool::GetInstance() {
    static ConnectionPool instance;
    return instance;
}

ConnectionPool::~ConnectionPool() {
    CloseAll();
}

bool ConnectionPool::Initialize(const std::string& connection_string,
                                size_t min_connections,
                                size_t max_connections) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        spdlog::warn("Connection pool already initialized");
        return false;
    }

    connection_string_ = connection_string;
    min_connections_ = min_connections;
    max_connections_ = std::max(min_connections, max_connections);
    shutdown_ = false;

    try {
        for (size_t i = 0; i < min_connections_; ++i) {
            idle_connections_.push_back(CreateConnection());
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize connection pool: {}", e.what());
        idle_connections_.clear();
        return false;
    }

    initialized_ = true;
    spdlog::info("Database connection pool initialized with {} connections", min_connections_);
    return true;
}

std::shared_ptr<pqxx::connection> ConnectionPool::GetConnection() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (!initialized_) {
        throw std::runtime_error("Connection pool is not initialized");
    }

    condition_.wait(lock, [this]() {
        return !idle_connections_.empty() || active_connections_.size() < max_connections_ || shutdown_;
    });

    if (shutdown_) {
        throw std::runtime_error("Connection pool is shutting down");
    }

    std::shared_ptr<pqxx::connection> conn;
    if (!idle_connections_.empty()) {
        conn = idle_connections_.front();
        idle_connections_.pop_front();
        if (!conn->is_open()) {
            spdlog::warn("Idle connection was closed, creating new connection");
            conn = CreateConnection();
        }
    } else {
        conn = CreateConnection();
    }

    active_connections_.insert(conn);
    return conn;
}

void ConnectionPool::ReleaseConnection(std::shared_ptr<pqxx::connection> connection) {
    if (!connection) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = active_connections_.find(connection);
    if (it == active_connections_.end()) {
        return;
    }
    active_connections_.erase(it);

    // 已断开的连接直接丢弃
    if (connection->is_open() && !shutdown_) {
        idle_connections_.push_back(std::move(connection));
    }
    condition_.notify_one();
}

void ConnectionPool::CloseAll() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return;
    }

    shutdown_ = true;
    initialized_ = false;
    idle_connections_.clear();
    active_connections_.clear();
    condition_.notify_all();

    spdlog::info("Database connection pool shut down");
}

std::shared_ptr<pqxx::connection> ConnectionPool::CreateConnection() {
    try {
        return std::make_shared<pqxx::connection>(connection_string_);
    } catch (const std::exception& e) {
        spdlog::error("Failed to create database connection: {}", e.what());
        throw;
    }
}

ConnectionPool::PoolStats ConnectionPool::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    PoolStats stats;
    stats.active_connections = active_connections_.size();
    stats.idle_connections = idle_connections_.size();
    return stats;
}

} // namespace chat_backup::core::db
