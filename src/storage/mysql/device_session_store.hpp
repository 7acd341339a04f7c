#pragma once

#include "core/device/session_store.hpp"
#include "storage/mysql/connection_pool.hpp"
#include "storage/mysql/transaction.hpp"

#include <memory>

namespace quota {
namespace storage {

// 基于 MySQL 的设备会话存储
// ClaimSlot 在事务内先对 quota_groups 行加 FOR UPDATE 锁, 同一分组的准入因此串行,
// 不同分组互不影响; 活跃指纹唯一性由 UNIQUE(group_id, active_fingerprint) 保证
class MySqlDeviceSessionStore : public quota::core::DeviceSessionStore {
public:
    explicit MySqlDeviceSessionStore(std::shared_ptr<ConnectionPool> pool);

    quota::common::StatusOr<quota::core::ClaimResult> ClaimSlot(const quota::core::DeviceSession& candidate,
                                                                int limit,
                                                                std::int64_t now_ms,
                                                                std::int64_t ttl_ms) override;
    quota::common::StatusOr<quota::core::TouchResult> Touch(const std::string& session_id,
                                                            std::int64_t now_ms,
                                                            std::int64_t ttl_ms) override;
    quota::common::StatusOr<quota::core::DeviceSession> GetSession(const std::string& session_id) override;
    quota::common::StatusOr<quota::core::DeviceSession> Deactivate(const std::string& session_id,
                                                                   quota::core::EndReason reason,
                                                                   std::int64_t now_ms) override;
    quota::common::StatusOr<int> DeactivateGroup(const std::string& group_id,
                                                 quota::core::EndReason reason,
                                                 std::int64_t now_ms) override;
    quota::common::StatusOr<std::vector<quota::core::DeviceSession>> ListActive(const std::string& group_id,
                                                                                std::int64_t now_ms) override;
    quota::common::StatusOr<int> CountActive(const std::string& group_id, std::int64_t now_ms) override;
    quota::common::StatusOr<int> ExpireStale(std::int64_t now_ms) override;
    quota::common::StatusOr<int> PurgeInactive(std::int64_t ended_before_ms) override;

private:
    // 在事务内读取单个会话, 可选加行锁
    quota::common::StatusOr<quota::core::DeviceSession> LoadSession(Transaction& tx,
                                                                    const std::string& session_id,
                                                                    bool for_update);
    quota::common::StatusOr<int> CountActiveLocked(Transaction& tx,
                                                   const std::string& group_id,
                                                   std::int64_t now_ms);

    std::shared_ptr<ConnectionPool> pool_;
};

} // namespace storage
} // namespace quota
