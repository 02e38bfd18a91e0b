#include "core/db/pg_transaction.h"

#include <stdexcept>
#include <spdlog/spdlog.h>

#include "core/db/connection_pool.h"

namespace chat_backup::core::db {

using ReadOnlySnapshot = pqxx::transaction<pqxx::isolation_level::repeatable_read,
                                           pqxx::write_policy::read_only>;

PgTransaction::PgTransaction(Mode mode)
    : mode_(mode) {
    conn_ = ConnectionPool::GetInstance().GetConnection();

    try {
        if (mode_ == Mode::kReadOnly) {
            txn_ = std::make_unique<ReadOnlySnapshot>(*conn_);
        } else {
            txn_ = std::make_unique<pqxx::work>(*conn_);
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to begin transaction: {}", e.what());
        ConnectionPool::GetInstance().ReleaseConnection(conn_);
        throw;
    }
}

PgTransaction::~PgTransaction() {
    if (txn_) {
        try {
            Rollback();
        } catch (const std::exception& e) {
            spdlog::error("Error rolling back transaction in destructor: {}", e.what());
        }
    }

    ConnectionPool::GetInstance().ReleaseConnection(conn_);
}

void PgTransaction::Commit() {
    if (!txn_) {
        throw std::runtime_error("No active transaction to commit");
    }

    txn_->commit();
    txn_.reset();
}

void PgTransaction::Rollback() {
    if (!txn_) {
        throw std::runtime_error("No active transaction to rollback");
    }

    auto txn = std::move(txn_);
    txn->abort();
}

pqxx::transaction_base& PgTransaction::GetTxn() const {
    if (!txn_) {
        throw std::runtime_error("No active transaction");
    }

    return *txn_;
}

const PgTransaction& PgTransaction::From(const ReadTransaction& tx) {
    auto* pg_tx = dynamic_cast<const PgTransaction*>(&tx);
    if (!pg_tx) {
        throw std::invalid_argument("Transaction is not a PostgreSQL transaction");
    }
    return *pg_tx;
}

} // namespace chat_backup::core::db
