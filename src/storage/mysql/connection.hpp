#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "storage/mysql/options.hpp"

#include <mysql/mysql.h>
#include <memory>

namespace quota {
namespace storage {

class Connection {
public:
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    ~Connection();

    // 建立连接并设置会话级锁等待超时
    static quota::common::StatusOr<std::unique_ptr<Connection>> Create(const Options& options);

    MYSQL* Raw() const noexcept {return handle_;}
    const Options& GetOptions() const noexcept {return options_;}

    // 发生过连接级错误的连接不再归还连接池
    void MarkBroken() noexcept {broken_ = true;}
    bool Broken() const noexcept {return broken_;}
private:
    Connection(MYSQL* handle, Options options);

    MYSQL* handle_ = nullptr;
    Options options_;
    bool broken_ = false;
};

}
}
