#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "storage/mysql/connection_pool.hpp"
#include "storage/mysql/mysql_utils.hpp"

#include <memory>
#include <string>

namespace quota {
namespace storage {

// MySQL 事务, 析构时未提交则回滚
class Transaction {
public:
    explicit Transaction(std::shared_ptr<ConnectionPool> pool);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    quota::common::Status Begin();
    quota::common::Status Commit();
    quota::common::Status Rollback();

    // 在事务连接上执行语句, 失败时检查连接是否断开
    quota::common::Status Execute(const std::string& sql);
    quota::common::StatusOr<ResultPtr> Query(const std::string& sql);
    std::uint64_t AffectedRows() const;

    MYSQL* Raw() const noexcept {return conn_;}
private:
    std::shared_ptr<ConnectionPool> pool_;
    ConnectionPool::Lease lease_;
    MYSQL* conn_ = nullptr;
    bool active_ = false;
};

}
}
