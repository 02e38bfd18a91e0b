#include "storage/pg/pg_reaction_store.h"

#include <pqxx/pqxx>
#include <spdlog/spdlog.h>

#include "core/db/pg_transaction.h"

namespace chat_backup::storage::pg {

common::Result<std::vector<models::Reaction>>
PgReactionStore::FetchReactions(const std::string& unique_message_id,
                                const core::db::ReadTransaction& tx) {
    using ResultType = common::Result<std::vector<models::Reaction>>;

    try {
        auto& txn = core::db::PgTransaction::From(tx).GetTxn();
        auto result = txn.exec_params(
            "SELECT unique_message_id, reactor_address, emoji, sent_at, received_at "
            "FROM reactions WHERE unique_message_id = $1 ORDER BY id ASC",
            unique_message_id
        );

        std::vector<models::Reaction> reactions;
        reactions.reserve(result.size());
        for (const auto& row : result) {
            models::Reaction reaction;
            reaction.unique_message_id = row[0].as<std::string>();
            reaction.reactor_address = row[1].as<std::string>();
            reaction.emoji = row[2].as<std::string>();
            reaction.sent_at = static_cast<uint64_t>(row[3].as<int64_t>());
            reaction.received_at = static_cast<uint64_t>(row[4].as<int64_t>());
            reactions.push_back(std::move(reaction));
        }
        return ResultType::Ok(std::move(reactions));
    } catch (const std::exception& e) {
        spdlog::error("Error in FetchReactions for {}: {}", unique_message_id, e.what());
        return ResultType::Error(std::string("获取表情回应失败: ") + e.what());
    }
}

common::Result<void> PgReactionStore::InsertReaction(const models::Reaction& reaction,
                                                     core::db::WriteTransaction& tx) {
    try {
        auto& txn = core::db::PgTransaction::From(tx).GetTxn();
        txn.exec_params(
            "INSERT INTO reactions (unique_message_id, reactor_address, emoji, sent_at, received_at) "
            "VALUES ($1, $2, $3, $4, $5)",
            reaction.unique_message_id,
            reaction.reactor_address,
            reaction.emoji,
            static_cast<int64_t>(reaction.sent_at),
            static_cast<int64_t>(reaction.received_at)
        );
        return common::Result<void>::Ok();
    } catch (const std::exception& e) {
        spdlog::error("Error in InsertReaction for {}: {}", reaction.unique_message_id, e.what());
        return common::Result<void>::Error(std::string("写入表情回应失败: ") + e.what());
    }
}

} // namespace chat_backup::storage::pg
