#include "storage/mysql/mysql_utils.hpp"

#include <fmt/format.h>

#include <cstdlib>

namespace quota {
namespace storage {

namespace {

constexpr unsigned int kErrDuplicateEntry = 1062;
constexpr unsigned int kErrLockWaitTimeout = 1205;
constexpr unsigned int kErrDeadlock = 1213;
constexpr unsigned int kErrServerGone = 2006;
constexpr unsigned int kErrServerLost = 2013;
constexpr unsigned int kErrConnectFailed = 2003;

} // namespace

bool IsConnectionLost(unsigned int err) {
    return err == kErrServerGone || err == kErrServerLost || err == kErrConnectFailed;
}

quota::common::Status MapMySqlError(MYSQL* conn, const std::string& context) {
    if (conn == nullptr) {
        return quota::common::Status::Internal(context);
    }
    const unsigned int err = mysql_errno(conn);
    std::string message = fmt::format("{}: [{}] {}", context, err, mysql_error(conn));
    if (err == kErrDuplicateEntry) {
        return quota::common::Status::AlreadyExists(std::move(message));
    }
    if (err == kErrLockWaitTimeout || err == kErrDeadlock || IsConnectionLost(err)) {
        return quota::common::Status::Unavailable(std::move(message));
    }
    return quota::common::Status::Internal(std::move(message));
}

std::string Escape(MYSQL* conn, const std::string& value) {
    if (!conn) {
        return value;
    }
    std::string buf;
    buf.resize(value.size() * 2 + 1);
    unsigned long escaped_len = mysql_real_escape_string(conn, buf.data(), value.data(), value.size());
    buf.resize(escaped_len);
    return buf;
}

std::string EscapeAndQuote(MYSQL* conn, const std::string& value) {
    return fmt::format("'{}'", Escape(conn, value));
}

quota::common::Status Execute(MYSQL* conn, const std::string& sql) {
    if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
        return MapMySqlError(conn, "query failed");
    }
    return quota::common::Status::OK();
}

quota::common::StatusOr<ResultPtr> Query(MYSQL* conn, const std::string& sql) {
    if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
        return MapMySqlError(conn, "query failed");
    }
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
        return MapMySqlError(conn, "mysql_store_result failed");
    }
    return quota::common::StatusOr<ResultPtr>(ResultPtr(res));
}

std::int64_t ParseInt64(const char* field) {
    if (!field) return 0;
    return std::strtoll(field, nullptr, 10);
}

}
}
