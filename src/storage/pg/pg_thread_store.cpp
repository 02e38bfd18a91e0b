#include "storage/pg/pg_thread_store.h"

#include <nlohmann/json.hpp>
#include <pqxx/pqxx>
#include <spdlog/spdlog.h>

#include "core/db/pg_transaction.h"

namespace chat_backup::storage::pg {

using json = nlohmann::json;

namespace {

models::Thread RowToThread(const pqxx::row& row) {
    models::Thread thread;
    thread.unique_id = row["unique_id"].as<std::string>();
    thread.kind = models::ThreadKindFromString(row["kind"].as<std::string>());
    thread.participant_addresses =
        json::parse(row["participant_addresses"].c_str()).get<std::vector<std::string>>();
    thread.group_id = row["group_id"].as<std::string>();
    thread.name = row["name"].as<std::string>();
    return thread;
}

} // namespace

std::optional<models::Thread> PgThreadStore::FetchThread(const std::string& unique_id,
                                                         const core::db::ReadTransaction& tx) {
    try {
        auto& txn = core::db::PgTransaction::From(tx).GetTxn();
        auto result = txn.exec_params(
            "SELECT unique_id, kind, participant_addresses, group_id, name "
            "FROM threads WHERE unique_id = $1",
            unique_id
        );

        if (result.empty()) {
            return std::nullopt;
        }
        return RowToThread(result[0]);
    } catch (const std::exception& e) {
        spdlog::error("Error in FetchThread for {}: {}", unique_id, e.what());
        return std::nullopt;
    }
}

common::Result<std::vector<models::Thread>>
PgThreadStore::FetchAllThreads(const core::db::ReadTransaction& tx) {
    using ResultType = common::Result<std::vector<models::Thread>>;

    try {
        auto& txn = core::db::PgTransaction::From(tx).GetTxn();
        auto result = txn.exec(
            "SELECT unique_id, kind, participant_addresses, group_id, name "
            "FROM threads ORDER BY created_at ASC, unique_id ASC"
        );

        std::vector<models::Thread> threads;
        threads.reserve(result.size());
        for (const auto& row : result) {
            threads.push_back(RowToThread(row));
        }
        return ResultType::Ok(std::move(threads));
    } catch (const std::exception& e) {
        spdlog::error("Error in FetchAllThreads: {}", e.what());
        return ResultType::Error(std::string("获取会话列表失败: ") + e.what());
    }
}

common::Result<void> PgThreadStore::InsertThread(const models::Thread& thread,
                                                 core::db::WriteTransaction& tx) {
    try {
        auto& txn = core::db::PgTransaction::From(tx).GetTxn();
        txn.exec_params(
            "INSERT INTO threads (unique_id, kind, participant_addresses, group_id, name) "
            "VALUES ($1, $2, $3::jsonb, $4, $5)",
            thread.unique_id,
            models::ToString(thread.kind),
            json(thread.participant_addresses).dump(),
            thread.group_id,
            thread.name
        );
        return common::Result<void>::Ok();
    } catch (const std::exception& e) {
        spdlog::error("Error in InsertThread for {}: {}", thread.unique_id, e.what());
        return common::Result<void>::Error(std::string("创建会话失败: ") + e.what());
    }
}

} // namespace chat_backup::storage::pg
