#include "cache/redis_client.hpp"

#include <chrono>

namespace quota {
namespace cache {

RedisClient::RedisClient(const quota::common::RedisConfig& config)
    : config_(config) {}

RedisClient::~RedisClient() = default;

quota::common::Status RedisClient::Connect() {
    if (!config_.enabled) {
        return quota::common::Status::Unavailable("Redis is disabled in the configuration.");
    }
    std::lock_guard<std::mutex> lock(connect_mutex_);
    if (redis_) {
        return quota::common::Status::OK();
    }

    try {
        sw::redis::ConnectionOptions opts;
        opts.host = config_.host;
        opts.port = config_.port;
        if (!config_.password.empty()) {
            opts.password = config_.password;
        }
        opts.db = config_.db;
        opts.connect_timeout = std::chrono::milliseconds(config_.connection_timeout_ms);
        opts.socket_timeout = std::chrono::milliseconds(config_.socket_timeout_ms);

        sw::redis::ConnectionPoolOptions pool_opts;
        pool_opts.size = static_cast<std::size_t>(config_.pool_size);
        pool_opts.wait_timeout = std::chrono::milliseconds(config_.connection_timeout_ms);

        auto redis = std::make_shared<sw::redis::Redis>(opts, pool_opts);
        // 构造时不会真正建连, 用 PING 确认服务可达
        redis->ping();
        redis_ = std::move(redis);
        return quota::common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return quota::common::Status::Unavailable("Failed to connect to Redis: " + std::string(err.what()));
    }
}

quota::common::Status RedisClient::SetEx(const std::string& key, const std::string& value, int ttl_seconds) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }
    if (ttl_seconds <= 0) {
        return quota::common::Status::InvalidArgument("TTL must be positive");
    }

    try {
        redis_->set(key, value, std::chrono::seconds(ttl_seconds));
        return quota::common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return quota::common::Status::Unavailable("Failed to set key with expiration in Redis: " + std::string(err.what()));
    }
}

quota::common::StatusOr<std::string> RedisClient::Get(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        auto val = redis_->get(key);
        if (!val) {
            return quota::common::Status::NotFound("Key not found in Redis: " + key);
        }
        return quota::common::StatusOr<std::string>(*val);
    } catch (const sw::redis::Error& err) {
        return quota::common::Status::Unavailable("Failed to get key from Redis: " + std::string(err.what()));
    }
}

quota::common::Status RedisClient::Del(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        redis_->del(key);
        return quota::common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return quota::common::Status::Unavailable("Failed to delete key from Redis: " + std::string(err.what()));
    }
}

quota::common::StatusOr<bool> RedisClient::Exists(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        auto count = redis_->exists(key);
        return quota::common::StatusOr<bool>(count > 0);
    } catch (const sw::redis::Error& err) {
        return quota::common::Status::Unavailable("Failed to check key existence in Redis: " + std::string(err.what()));
    }
}

} // namespace cache
} // namespace quota
