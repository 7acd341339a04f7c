#pragma once

#include "common/config.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace quota {
namespace storage {

struct Options {
    std::string host = "127.0.0.1";
    std::uint16_t port = 3306;
    std::string user = "dev";
    std::string password;
    std::string database = "device_quota";
    std::size_t pool_size = 8;
    std::chrono::milliseconds acquire_timeout{500};
    std::chrono::milliseconds connect_timeout{500};
    std::chrono::milliseconds read_timeout{2000};
    std::chrono::milliseconds write_timeout{2000};
    std::chrono::seconds lock_wait_timeout{2}; // 分组行锁等待上限, 超时按瞬时错误重试
    std::string charset = "utf8mb4";

    static Options FromConfig(const quota::common::MysqlConfig& config) {
        Options options;
        options.host = config.host;
        options.port = static_cast<std::uint16_t>(config.port);
        options.user = config.user;
        options.password = config.password;
        options.database = config.database;
        options.pool_size = static_cast<std::size_t>(config.pool_size);
        options.acquire_timeout = std::chrono::milliseconds(config.connection_timeout_ms);
        options.connect_timeout = std::chrono::milliseconds(config.connection_timeout_ms);
        options.read_timeout = std::chrono::milliseconds(config.read_timeout_ms);
        options.write_timeout = std::chrono::milliseconds(config.write_timeout_ms);
        options.lock_wait_timeout = std::chrono::seconds(config.lock_wait_timeout_s);
        return options;
    }
};

}
}
