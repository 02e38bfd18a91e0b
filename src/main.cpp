#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

#include "common/constants.h"
#include "core/config/config_manager.h"
#include "core/db/connection_pool.h"
#include "core/db/database_options.h"
#include "core/db/pg_transaction.h"
#include "core/utils/string_utils.h"
#include "services/archive/backup_stream.h"
#include "services/archive/chat_archiver.h"
#include "services/archive/chat_item_archiver.h"
#include "services/archive/interaction_archiver_registry.h"
#include "services/archive/message_contents_archiver.h"
#include "services/archive/reaction_archiver.h"
#include "services/backup/backup_service.h"
#include "storage/pg/pg_interaction_store.h"
#include "storage/pg/pg_reaction_store.h"
#include "storage/pg/pg_thread_store.h"

using namespace chat_backup;

namespace {

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program << " export|import <backup file> [config file]" << std::endl;
}

void ApplyLogLevel(const std::string& configured_level) {
    const std::string log_level = core::utils::StringUtils::ToLower(configured_level);
    if (log_level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (log_level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (log_level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (log_level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (log_level == "critical") {
        spdlog::set_level(spdlog::level::critical);
    } else {
        spdlog::warn("Unknown log level '{}', keeping info", configured_level);
    }
}

int RunExport(services::backup::BackupService& backup_service,
              const std::string& backup_path,
              const std::string& local_address) {
    if (local_address.empty()) {
        spdlog::critical("backup.local_address is not configured");
        return 1;
    }

    services::archive::BackupFileWriter file(backup_path);
    if (!file.IsOpen()) {
        spdlog::critical("Cannot open {} for writing", file.GetTempPath());
        return 1;
    }

    services::archive::JsonlBackupOutputStream stream(file.GetStream());
    core::db::PgTransaction tx(core::db::PgTransaction::Mode::kReadOnly);

    auto result = backup_service.Export(stream, local_address, tx);
    tx.Commit();

    // 完全失败时不提交，临时文件随 file 析构删除
    if (result.IsCompleteFailure()) {
        spdlog::critical("Backup failed: {}", result.GetFatalError().message);
        return 1;
    }

    auto commit_result = file.Commit();
    if (commit_result.IsError()) {
        spdlog::critical("{}", commit_result.GetError());
        return 1;
    }

    if (result.IsPartialSuccess()) {
        spdlog::warn("{} items could not be backed up", result.GetErrors().size());
        for (const auto& error : result.GetErrors()) {
            spdlog::warn("  {}", error.ToString());
        }
    }

    spdlog::info("Wrote {} frames to {}", stream.GetFramesWritten(), backup_path);
    return 0;
}

int RunImport(services::backup::BackupService& backup_service, const std::string& backup_path) {
    std::ifstream input(backup_path);
    if (!input) {
        spdlog::critical("Cannot open {} for reading", backup_path);
        return 1;
    }

    services::archive::JsonlBackupInputStream stream(input);
    core::db::PgTransaction tx(core::db::PgTransaction::Mode::kReadWrite);

    auto summary = backup_service.Import(stream, tx);
    if (summary.fatal_error) {
        spdlog::critical("Backup import aborted, rolling back: {}", *summary.fatal_error);
        tx.Rollback();
        return 1;
    }

    tx.Commit();

    if (!summary.IsComplete()) {
        spdlog::warn("{} frames restored partially, {} frames could not be restored",
                     summary.partial_restores, summary.failures);
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        PrintUsage(argv[0]);
        return 2;
    }

    const std::string command = argv[1];
    const std::string backup_path = argv[2];
    if (command != "export" && command != "import") {
        PrintUsage(argv[0]);
        return 2;
    }

    try {
        // 设置日志
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        spdlog::set_level(spdlog::level::info);

        // 加载配置
        auto& config = core::config::ConfigManager::GetInstance();
        std::string config_path = common::constants::DEFAULT_CONFIG_PATH;
        if (argc > 3) {
            config_path = argv[3];
        }

        if (!config.LoadFromFile(config_path)) {
            spdlog::critical("Failed to load configuration from {}", config_path);
            return 1;
        }

        ApplyLogLevel(config.GetString("log.level", common::constants::DEFAULT_LOG_LEVEL));

        // 初始化数据库连接池
        const auto db_options = core::db::DatabaseOptions::FromConfig(config);
        if (db_options.connection_string.empty()) {
            spdlog::critical("Database connection string not configured");
            return 1;
        }

        auto& db_pool = core::db::ConnectionPool::GetInstance();
        if (!db_pool.Initialize(db_options.connection_string,
                                db_options.min_connections,
                                db_options.max_connections)) {
            spdlog::critical("Failed to initialize database connection pool");
            return 1;
        }

        storage::pg::PgInteractionStore interaction_store(db_options.page_size);
        storage::pg::PgThreadStore thread_store;
        storage::pg::PgReactionStore reaction_store;

        auto reaction_archiver = std::make_shared<services::archive::ReactionArchiver>(reaction_store);
        auto contents_archiver = std::make_shared<services::archive::MessageContentsArchiver>(reaction_archiver);

        services::archive::ChatArchiver chat_archiver(thread_store);
        services::archive::ChatItemArchiver chat_item_archiver(
            [] { return std::chrono::system_clock::now(); },
            interaction_store,
            thread_store,
            services::archive::InteractionArchiverRegistry::CreateDefault(contents_archiver, interaction_store),
            services::archive::ChatItemArchiverOptions::FromConfig(config));

        services::backup::BackupService backup_service(chat_archiver, chat_item_archiver);

        int exit_code = 0;
        if (command == "export") {
            exit_code = RunExport(backup_service, backup_path, config.GetString("backup.local_address", ""));
        } else {
            exit_code = RunImport(backup_service, backup_path);
        }

        auto pool_stats = db_pool.GetStats();
        spdlog::debug("Connection pool at shutdown: {} active, {} idle",
                      pool_stats.active_connections, pool_stats.idle_connections);
        db_pool.CloseAll();
        return exit_code;
    } catch (const std::exception& e) {
        spdlog::critical("Unhandled exception: {}", e.what());
        return 1;
    }
}
