#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/result.h"
#include "core/db/transaction.h"
#include "models/interaction.h"

namespace chat_backup::storage {

// 按存储层定义的稳定顺序逐条读取消息
class InteractionCursor {
public:
    virtual ~InteractionCursor() = default;

    // 返回下一条消息；遍历结束时返回空值，查询失败时返回错误
    virtual common::Result<std::optional<models::Interaction>> Next() = 0;
};

class InteractionStore {
public:
    virtual ~InteractionStore() = default;

    // 打开遍历全部消息的游标
    virtual common::Result<std::unique_ptr<InteractionCursor>>
    OpenInteractionCursor(const core::db::ReadTransaction& tx) = 0;

    // 获取某条最新版本消息的历史版本，按时间升序
    virtual common::Result<std::vector<models::Interaction>>
    FetchPastRevisions(const models::Interaction& latest_revision,
                       const core::db::ReadTransaction& tx) = 0;

    virtual common::Result<void> InsertInteraction(const models::Interaction& interaction,
                                                   core::db::WriteTransaction& tx) = 0;
};

} // namespace chat_backup::storage
