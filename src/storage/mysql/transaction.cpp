#include "storage/mysql/transaction.hpp"

#include "common/logger.hpp"

namespace quota {
namespace storage {

Transaction::Transaction(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

Transaction::~Transaction() {
    if (active_) {
        auto status = Rollback();
        if (!status.IsOk()) {
            QUOTA_LOG_WARN("[MySqlTx] rollback on destruction failed: {}", status.Message());
        }
    }
}

quota::common::Status Transaction::Begin() {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    lease_ = std::move(lease_or.Value());
    conn_ = lease_.Raw();
    if (mysql_autocommit(conn_, 0) != 0) {
        lease_.CheckHealth();
        return MapMySqlError(conn_, "begin transaction failed");
    }
    active_ = true;
    return quota::common::Status::OK();
}

quota::common::Status Transaction::Commit() {
    if (!active_) {
        return quota::common::Status::OK();
    }
    if (mysql_commit(conn_) != 0) {
        // 提交失败 (如死锁) 视同回滚
        auto status = MapMySqlError(conn_, "commit failed");
        lease_.CheckHealth();
        auto rollback = Rollback();
        if (!rollback.IsOk()) {
            QUOTA_LOG_WARN("[MySqlTx] rollback after failed commit: {}", rollback.Message());
        }
        return status;
    }
    active_ = false;
    if (mysql_autocommit(conn_, 1) != 0) {
        lease_.CheckHealth();
        return MapMySqlError(conn_, "restore autocommit failed");
    }
    return quota::common::Status::OK();
}

quota::common::Status Transaction::Rollback() {
    if (!active_) {
        return quota::common::Status::OK();
    }
    active_ = false;
    if (mysql_rollback(conn_) != 0) {
        lease_.CheckHealth();
        return MapMySqlError(conn_, "rollback failed");
    }
    if (mysql_autocommit(conn_, 1) != 0) {
        lease_.CheckHealth();
        return MapMySqlError(conn_, "restore autocommit failed");
    }
    return quota::common::Status::OK();
}

quota::common::Status Transaction::Execute(const std::string& sql) {
    auto status = storage::Execute(conn_, sql);
    if (!status.IsOk()) {
        lease_.CheckHealth();
    }
    return status;
}

quota::common::StatusOr<ResultPtr> Transaction::Query(const std::string& sql) {
    auto result = storage::Query(conn_, sql);
    if (!result.IsOk()) {
        lease_.CheckHealth();
    }
    return result;
}

std::uint64_t Transaction::AffectedRows() const {
    return static_cast<std::uint64_t>(mysql_affected_rows(conn_));
}

}
}
