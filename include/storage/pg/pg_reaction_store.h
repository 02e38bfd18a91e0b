#pragma once

#include "storage/reaction_store.h"

namespace chat_backup::storage::pg {

class PgReactionStore : public ReactionStore {
public:
    PgReactionStore() = default;

    common::Result<std::vector<models::Reaction>>
    FetchReactions(const std::string& unique_message_id,
                   const core::db::ReadTransaction& tx) override;

    common::Result<void> InsertReaction(const models::Reaction& reaction,
                                        core::db::WriteTransaction& tx) override;
};

} // namespace chat_backup::storage::pg
