#pragma once

#include <cstddef>

#include "storage/interaction_store.h"

namespace chat_backup::storage::pg {

// interactions 表的存储实现，遍历按 row_id 分页
class PgInteractionStore : public InteractionStore {
public:
    explicit PgInteractionStore(size_t page_size);

    common::Result<std::unique_ptr<InteractionCursor>>
    OpenInteractionCursor(const core::db::ReadTransaction& tx) override;

    common::Result<std::vector<models::Interaction>>
    FetchPastRevisions(const models::Interaction& latest_revision,
                       const core::db::ReadTransaction& tx) override;

    common::Result<void> InsertInteraction(const models::Interaction& interaction,
                                           core::db::WriteTransaction& tx) override;

private:
    size_t page_size_;
};

} // namespace chat_backup::storage::pg
