#pragma once

#include "common/config.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"

// Redis++库头文件
#include <sw/redis++/redis++.h>

#include <memory>
#include <mutex>
#include <string>

namespace quota {
namespace cache {

class RedisClient {
public:
    explicit RedisClient(const quota::common::RedisConfig& config);
    ~RedisClient();

    // 连接到Redis服务器, 已连接时直接返回
    quota::common::Status Connect();

    // 设置键值对并设置过期时间
    quota::common::Status SetEx(const std::string& key, const std::string& value, int ttl_seconds);

    // 获取键对应的值, 键不存在时返回 NotFound
    quota::common::StatusOr<std::string> Get(const std::string& key);

    // 删除键
    quota::common::Status Del(const std::string& key);

    // 检查键是否存在
    quota::common::StatusOr<bool> Exists(const std::string& key);

    const quota::common::RedisConfig& Config() const { return config_; }

private:
    quota::common::RedisConfig config_; // Redis配置
    std::mutex connect_mutex_;
    std::shared_ptr<sw::redis::Redis> redis_; // Redis连接对象, 内部带连接池
};

} // namespace cache
} // namespace quota
