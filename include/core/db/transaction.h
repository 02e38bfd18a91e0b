#pragma once

namespace chat_backup::core::db {

// 调用方持有的只读事务，归档期间提供一致的快照
class ReadTransaction {
public:
    virtual ~ReadTransaction() = default;
};

// 调用方持有的读写事务，恢复单条记录时使用
class WriteTransaction : public ReadTransaction {
};

} // namespace chat_backup::core::db
