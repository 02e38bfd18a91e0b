#pragma once

#include "storage/thread_store.h"

namespace chat_backup::storage::pg {

class PgThreadStore : public ThreadStore {
public:
    PgThreadStore() = default;

    std::optional<models::Thread> FetchThread(const std::string& unique_id,
                                              const core::db::ReadTransaction& tx) override;

    common::Result<std::vector<models::Thread>>
    FetchAllThreads(const core::db::ReadTransaction& tx) override;

    common::Result<void> InsertThread(const models::Thread& thread,
                                      core::db::WriteTransaction& tx) override;
};

} // namespace chat_backup::storage::pg
