#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <mysql/mysql.h>

#include <cstdint>
#include <memory>
#include <string>

namespace quota {
namespace storage {

struct ResultDeleter {
    void operator()(MYSQL_RES* res) const {
        if (res) mysql_free_result(res);
    }
};
using ResultPtr = std::unique_ptr<MYSQL_RES, ResultDeleter>;

// 将 MySQL 错误码映射到 Status
// 1062 重复键 -> AlreadyExists; 锁等待超时、死锁、连接断开 -> Unavailable (可重试)
quota::common::Status MapMySqlError(MYSQL* conn, const std::string& context);
bool IsConnectionLost(unsigned int err);

std::string Escape(MYSQL* conn, const std::string& value);
std::string EscapeAndQuote(MYSQL* conn, const std::string& value);

// 执行不返回结果集的语句
quota::common::Status Execute(MYSQL* conn, const std::string& sql);
// 执行查询并取回完整结果集
quota::common::StatusOr<ResultPtr> Query(MYSQL* conn, const std::string& sql);

std::int64_t ParseInt64(const char* field);

}
}
