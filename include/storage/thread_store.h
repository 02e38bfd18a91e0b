#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/result.h"
#include "core/db/transaction.h"
#include "models/thread.h"

namespace chat_backup::storage {

class ThreadStore {
public:
    virtual ~ThreadStore() = default;

    virtual std::optional<models::Thread> FetchThread(const std::string& unique_id,
                                                      const core::db::ReadTransaction& tx) = 0;

    virtual common::Result<std::vector<models::Thread>>
    FetchAllThreads(const core::db::ReadTransaction& tx) = 0;

    virtual common::Result<void> InsertThread(const models::Thread& thread,
                                              core::db::WriteTransaction& tx) = 0;
};

} // namespace chat_backup::storage
