#pragma once

#include <memory>

#include <pqxx/pqxx>

#include "core/db/transaction.h"

namespace chat_backup::core::db {

// 基于连接池的PostgreSQL事务，析构时未提交的事务自动回滚
class PgTransaction : public WriteTransaction {
public:
    enum class Mode {
        kReadOnly,   // 可重复读快照，用于导出
        kReadWrite   // 用于导入
    };

    explicit PgTransaction(Mode mode);
    ~PgTransaction() override;

    PgTransaction(const PgTransaction&) = delete;
    PgTransaction& operator=(const PgTransaction&) = delete;

    void Commit();
    void Rollback();

    bool IsActive() const { return txn_ != nullptr; }

    pqxx::transaction_base& GetTxn() const;

    // 存储适配器只接受PostgreSQL事务
    static const PgTransaction& From(const ReadTransaction& tx);

private:
    Mode mode_;
    std::shared_ptr<pqxx::connection> conn_;
    std::unique_ptr<pqxx::transaction_base> txn_;
};

} // namespace chat_backup::core::db
