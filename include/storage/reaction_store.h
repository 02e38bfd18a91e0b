#pragma once

#include <string>
#include <vector>

#include "common/result.h"
#include "core/db/transaction.h"
#include "models/thread.h"

namespace chat_backup::storage {

class ReactionStore {
public:
    virtual ~ReactionStore() = default;

    virtual common::Result<std::vector<models::Reaction>>
    FetchReactions(const std::string& unique_message_id,
                   const core::db::ReadTransaction& tx) = 0;

    virtual common::Result<void> InsertReaction(const models::Reaction& reaction,
                                                core::db::WriteTransaction& tx) = 0;
};

} // namespace chat_backup::storage
