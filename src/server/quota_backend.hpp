#pragma once

#include "cache/redis_client.hpp"
#include "common/clock.hpp"
#include "common/config.hpp"
#include "common/status_or.hpp"
#include "core/device/device_admin.hpp"
#include "core/device/expiry_sweeper.hpp"
#include "core/device/group_repository.hpp"
#include "core/device/quota_ledger.hpp"
#include "core/device/session_store.hpp"

#include <memory>

namespace quota {
namespace server {

// 服务运行所需的全部组件, 由配置装配
struct QuotaBackend {
    std::shared_ptr<quota::cache::RedisClient> redis;          // 未启用或连接失败时为空
    std::shared_ptr<quota::core::DeviceSessionStore> store;
    std::shared_ptr<quota::core::GroupRepository> groups;
    std::shared_ptr<quota::core::QuotaLedger> ledger;
    std::shared_ptr<quota::core::DeviceAdmin> admin;
    std::shared_ptr<quota::core::ExpirySweeper> sweeper;
};

// 按配置选择 MySQL 或内存存储, 可选挂上 Redis 分组缓存, 并写入预置分组
// MySQL 已启用但不可用时返回错误, 不退回内存存储
quota::common::StatusOr<QuotaBackend> BuildQuotaBackend(const quota::common::AppConfig& config,
                                                        std::shared_ptr<const quota::common::Clock> clock = nullptr);

} // namespace server
} // namespace quota
