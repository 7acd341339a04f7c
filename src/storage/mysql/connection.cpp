#include "storage/mysql/connection.hpp"

#include "storage/mysql/mysql_utils.hpp"

#include <fmt/format.h>

namespace quota {
namespace storage {

namespace {

unsigned int ToSeconds(std::chrono::milliseconds value) {
    // mysql 客户端超时以秒为单位, 不足一秒按一秒处理
    auto seconds = (value.count() + 999) / 1000;
    return static_cast<unsigned int>(seconds > 0 ? seconds : 1);
}

} // namespace

Connection::Connection(MYSQL* handle, Options options): handle_(handle), options_(std::move(options)) {}

Connection::~Connection() {
    if (handle_ != nullptr) {
        mysql_close(handle_);
        handle_ = nullptr;
    }
}

quota::common::StatusOr<std::unique_ptr<Connection>> Connection::Create(const Options& options) {
    MYSQL* handle = mysql_init(nullptr);
    if (handle == nullptr) {
        return quota::common::Status::Internal("mysql_init failed");
    }

    unsigned int connect_timeout_sec = ToSeconds(options.connect_timeout);
    mysql_options(handle, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_sec);
    unsigned int read_timeout_sec = ToSeconds(options.read_timeout);
    mysql_options(handle, MYSQL_OPT_READ_TIMEOUT, &read_timeout_sec);
    unsigned int write_timeout_sec = ToSeconds(options.write_timeout);
    mysql_options(handle, MYSQL_OPT_WRITE_TIMEOUT, &write_timeout_sec);

    if (!mysql_real_connect(handle,
                           options.host.c_str(),
                           options.user.c_str(),
                           options.password.c_str(),
                           options.database.c_str(),
                           options.port,
                           nullptr,
                           0)) {
        // 数据库不可达属于基础设施故障
        auto status = quota::common::Status::Unavailable(
            fmt::format("mysql_real_connect failed: {}", mysql_error(handle)));
        mysql_close(handle);
        return status;
    }

    if (!options.charset.empty() && mysql_set_character_set(handle, options.charset.c_str()) != 0) {
        auto status = MapMySqlError(handle, "set charset failed");
        mysql_close(handle);
        return status;
    }

    auto sql = fmt::format("SET SESSION innodb_lock_wait_timeout = {}", options.lock_wait_timeout.count());
    auto status = Execute(handle, sql);
    if (!status.IsOk()) {
        mysql_close(handle);
        return status;
    }

    return quota::common::StatusOr<std::unique_ptr<Connection>>(std::unique_ptr<Connection>(new Connection(handle, options)));
}

} // namespace storage
} // namespace quota
