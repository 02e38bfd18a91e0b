#include "storage/pg/pg_interaction_store.h"

#include <deque>
#include <nlohmann/json.hpp>
#include <pqxx/pqxx>
#include <spdlog/spdlog.h>

#include "core/db/pg_transaction.h"

namespace chat_backup::storage::pg {

using json = nlohmann::json;

namespace {

const char* const kInteractionColumns =
    "row_id, unique_id, unique_thread_id, timestamp, received_at_timestamp, kind, "
    "author_address, body, attachments, sticker, contact_share, is_voice_message, "
    "was_remotely_deleted, was_read, was_received_by_ud, is_sms, expire_started_at, "
    "expires_in_seconds, edit_state, latest_revision_id, info_type, info_detail, recipient_states";

models::Interaction RowToInteraction(const pqxx::row& row) {
    models::Interaction interaction;
    interaction.unique_id = row["unique_id"].as<std::string>();
    interaction.unique_thread_id = row["unique_thread_id"].as<std::string>();
    interaction.timestamp = static_cast<uint64_t>(row["timestamp"].as<int64_t>());
    interaction.received_at_timestamp = static_cast<uint64_t>(row["received_at_timestamp"].as<int64_t>());
    interaction.kind = models::InteractionKindFromString(row["kind"].as<std::string>());
    interaction.author_address = row["author_address"].as<std::string>();
    interaction.body = row["body"].as<std::string>();

    for (const auto& item : json::parse(row["attachments"].c_str())) {
        interaction.attachments.push_back(models::Attachment::FromJson(item));
    }
    if (!row["sticker"].is_null()) {
        interaction.sticker = models::StickerInfo::FromJson(json::parse(row["sticker"].c_str()));
    }
    if (!row["contact_share"].is_null()) {
        interaction.contact_share = models::ContactShare::FromJson(json::parse(row["contact_share"].c_str()));
    }

    interaction.is_voice_message = row["is_voice_message"].as<bool>();
    interaction.was_remotely_deleted = row["was_remotely_deleted"].as<bool>();
    interaction.was_read = row["was_read"].as<bool>();
    interaction.was_received_by_ud = row["was_received_by_ud"].as<bool>();
    interaction.is_sms = row["is_sms"].as<bool>();
    interaction.expire_started_at = static_cast<uint64_t>(row["expire_started_at"].as<int64_t>());
    interaction.expires_in_seconds = static_cast<uint32_t>(row["expires_in_seconds"].as<int>());
    interaction.edit_state = models::EditStateFromString(row["edit_state"].as<std::string>());
    interaction.latest_revision_id = row["latest_revision_id"].as<std::string>();
    interaction.info_type = models::InfoMessageTypeFromString(row["info_type"].as<std::string>());
    interaction.info_detail = row["info_detail"].as<std::string>();

    for (const auto& item : json::parse(row["recipient_states"].c_str())) {
        interaction.recipient_states.push_back(models::OutgoingRecipientState::FromJson(item));
    }

    return interaction;
}

// 按 row_id 递增分页读取，避免一次性加载全部消息
class PgInteractionCursor : public InteractionCursor {
public:
    PgInteractionCursor(const core::db::PgTransaction& tx, size_t page_size)
        : tx_(tx), page_size_(page_size) {
    }

    common::Result<std::optional<models::Interaction>> Next() override {
        using ResultType = common::Result<std::optional<models::Interaction>>;

        if (buffer_.empty() && !exhausted_) {
            auto fetch_result = FetchPage();
            if (fetch_result.IsError()) {
                return ResultType::Error(fetch_result.GetError());
            }
        }

        if (buffer_.empty()) {
            return ResultType::Ok(std::nullopt);
        }

        models::Interaction interaction = std::move(buffer_.front());
        buffer_.pop_front();
        return ResultType::Ok(std::move(interaction));
    }

private:
    common::Result<void> FetchPage() {
        try {
            auto result = tx_.GetTxn().exec_params(
                std::string("SELECT ") + kInteractionColumns +
                " FROM interactions WHERE row_id > $1 ORDER BY row_id LIMIT $2",
                last_row_id_, static_cast<int64_t>(page_size_)
            );

            for (const auto& row : result) {
                last_row_id_ = row["row_id"].as<int64_t>();
                buffer_.push_back(RowToInteraction(row));
            }

            if (result.empty() || result.size() < page_size_) {
                exhausted_ = true;
            }

            spdlog::debug("Fetched {} interactions, last row {}", result.size(), last_row_id_);
            return common::Result<void>::Ok();
        } catch (const std::exception& e) {
            spdlog::error("Error fetching interactions after row {}: {}", last_row_id_, e.what());
            return common::Result<void>::Error(std::string("读取消息失败: ") + e.what());
        }
    }

    const core::db::PgTransaction& tx_;
    size_t page_size_;
    int64_t last_row_id_ = 0;
    bool exhausted_ = false;
    std::deque<models::Interaction> buffer_;
};

} // namespace

PgInteractionStore::PgInteractionStore(size_t page_size)
    : page_size_(page_size == 0 ? 1 : page_size) {
}

common::Result<std::unique_ptr<InteractionCursor>>
PgInteractionStore::OpenInteractionCursor(const core::db::ReadTransaction& tx) {
    using ResultType = common::Result<std::unique_ptr<InteractionCursor>>;

    try {
        const auto& pg_tx = core::db::PgTransaction::From(tx);
        return ResultType::Ok(std::make_unique<PgInteractionCursor>(pg_tx, page_size_));
    } catch (const std::exception& e) {
        spdlog::error("Error opening interaction cursor: {}", e.what());
        return ResultType::Error(e.what());
    }
}

common::Result<std::vector<models::Interaction>>
PgInteractionStore::FetchPastRevisions(const models::Interaction& latest_revision,
                                       const core::db::ReadTransaction& tx) {
    using ResultType = common::Result<std::vector<models::Interaction>>;

    try {
        auto& txn = core::db::PgTransaction::From(tx).GetTxn();
        auto result = txn.exec_params(
            std::string("SELECT ") + kInteractionColumns +
            " FROM interactions WHERE latest_revision_id = $1 AND edit_state = 'past_revision' "
            "ORDER BY timestamp ASC, row_id ASC",
            latest_revision.unique_id
        );

        std::vector<models::Interaction> revisions;
        revisions.reserve(result.size());
        for (const auto& row : result) {
            revisions.push_back(RowToInteraction(row));
        }
        return ResultType::Ok(std::move(revisions));
    } catch (const std::exception& e) {
        spdlog::error("Error in FetchPastRevisions for {}: {}", latest_revision.unique_id, e.what());
        return ResultType::Error(std::string("获取历史版本失败: ") + e.what());
    }
}

common::Result<void> PgInteractionStore::InsertInteraction(const models::Interaction& interaction,
                                                           core::db::WriteTransaction& tx) {
    try {
        json attachments = json::array();
        for (const auto& attachment : interaction.attachments) {
            attachments.push_back(attachment.ToJson());
        }

        json recipient_states = json::array();
        for (const auto& state : interaction.recipient_states) {
            recipient_states.push_back(state.ToJson());
        }

        std::optional<std::string> sticker;
        if (interaction.sticker) {
            sticker = interaction.sticker->ToJson().dump();
        }
        std::optional<std::string> contact_share;
        if (interaction.contact_share) {
            contact_share = interaction.contact_share->ToJson().dump();
        }

        auto& txn = core::db::PgTransaction::From(tx).GetTxn();
        txn.exec_params(
            "INSERT INTO interactions (unique_id, unique_thread_id, timestamp, received_at_timestamp, "
            "kind, author_address, body, attachments, sticker, contact_share, is_voice_message, "
            "was_remotely_deleted, was_read, was_received_by_ud, is_sms, expire_started_at, "
            "expires_in_seconds, edit_state, latest_revision_id, info_type, info_detail, recipient_states) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8::jsonb, $9::jsonb, $10::jsonb, $11, $12, $13, $14, "
            "$15, $16, $17, $18, $19, $20, $21, $22::jsonb)",
            interaction.unique_id,
            interaction.unique_thread_id,
            static_cast<int64_t>(interaction.timestamp),
            static_cast<int64_t>(interaction.received_at_timestamp),
            models::ToString(interaction.kind),
            interaction.author_address,
            interaction.body,
            attachments.dump(),
            sticker,
            contact_share,
            interaction.is_voice_message,
            interaction.was_remotely_deleted,
            interaction.was_read,
            interaction.was_received_by_ud,
            interaction.is_sms,
            static_cast<int64_t>(interaction.expire_started_at),
            static_cast<int64_t>(interaction.expires_in_seconds),
            models::ToString(interaction.edit_state),
            interaction.latest_revision_id,
            models::ToString(interaction.info_type),
            interaction.info_detail,
            recipient_states.dump()
        );

        return common::Result<void>::Ok();
    } catch (const std::exception& e) {
        spdlog::error("Error in InsertInteraction for {}: {}", interaction.unique_id, e.what());
        return common::Result<void>::Error(std::string("插入消息失败: ") + e.what());
    }
}

} // namespace chat_backup::storage::pg
