#include "server/quota_backend.hpp"

#include "common/logger.hpp"
#include "core/device/cached_group_repository.hpp"
#include "storage/mysql/connection_pool.hpp"
#include "storage/mysql/device_session_store.hpp"
#include "storage/mysql/group_repository.hpp"

#include <chrono>

namespace quota {
namespace server {

namespace {

// 根据配置创建Redis客户端, 失败时不使用缓存
std::shared_ptr<quota::cache::RedisClient> CreateRedisClient(const quota::common::RedisConfig& config) {
    if (!config.enabled) {
        return nullptr;
    }
    auto client = std::make_shared<quota::cache::RedisClient>(config);
    auto status = client->Connect();
    if (!status.IsOk()) {
        QUOTA_LOG_WARN("[Backend] Redis init failed, fallback to no cache: {}", status.Message());
        return nullptr;
    }
    return client;
}

} // namespace

quota::common::StatusOr<QuotaBackend> BuildQuotaBackend(const quota::common::AppConfig& config,
                                                        std::shared_ptr<const quota::common::Clock> clock) {
    if (!clock) {
        clock = std::make_shared<quota::common::SystemClock>();
    }
    QuotaBackend backend;
    backend.redis = CreateRedisClient(config.cache.redis);

    std::shared_ptr<quota::core::GroupRepository> primary_groups;
    if (config.storage.mysql.enabled) {
        auto pool = std::make_shared<quota::storage::ConnectionPool>(
            quota::storage::Options::FromConfig(config.storage.mysql));
        auto probe = pool->Acquire();
        if (!probe.IsOk()) {
            QUOTA_LOG_ERROR("[Backend] Failed to initialize MySQL connection: {}", probe.GetStatus().Message());
            return probe.GetStatus();
        }
        backend.store = std::make_shared<quota::storage::MySqlDeviceSessionStore>(pool);
        primary_groups = std::make_shared<quota::storage::MySqlGroupRepository>(pool);
        QUOTA_LOG_INFO("[Backend] using MySQL store {}:{}/{}",
                       config.storage.mysql.host, config.storage.mysql.port, config.storage.mysql.database);
    } else {
        QUOTA_LOG_WARN("[Backend] MySQL backend disabled; using in-memory store (single instance only)");
        backend.store = std::make_shared<quota::core::InMemoryDeviceSessionStore>(
            std::chrono::milliseconds(config.quota.lock_timeout_ms));
        primary_groups = std::make_shared<quota::core::InMemoryGroupRepository>();
    }

    if (backend.redis) {
        backend.groups = std::make_shared<quota::core::CachedGroupRepository>(
            primary_groups, backend.redis, config.cache.redis.group_ttl_seconds);
    } else {
        backend.groups = primary_groups;
    }

    auto seeded = quota::core::SeedGroups(*backend.groups, config.groups, config.quota, clock->NowMillis());
    if (!seeded.IsOk()) {
        return seeded.GetStatus();
    }

    backend.ledger = std::make_shared<quota::core::QuotaLedger>(
        backend.store, backend.groups, quota::core::LedgerConfig::FromQuotaConfig(config.quota), nullptr, clock);
    backend.admin = std::make_shared<quota::core::DeviceAdmin>(backend.ledger);

    quota::core::SweeperConfig sweeper_config;
    sweeper_config.interval = std::chrono::seconds(config.quota.sweep_interval_seconds);
    sweeper_config.purge_after = std::chrono::seconds(config.quota.purge_after_seconds);
    backend.sweeper = std::make_shared<quota::core::ExpirySweeper>(backend.store, sweeper_config, clock);
    return quota::common::StatusOr<QuotaBackend>(std::move(backend));
}

} // namespace server
} // namespace quota
