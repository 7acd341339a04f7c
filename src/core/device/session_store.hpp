#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/device/device_session.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace quota {
namespace core {

enum class ClaimOutcome {
    kInserted,      // 新设备占用一个名额
    kRenewed,       // 同一设备已有活跃会话, 仅续期
    kLimitReached,  // 名额已满
};

struct ClaimResult {
    ClaimOutcome  outcome = ClaimOutcome::kLimitReached;
    DeviceSession session;          // kInserted/kRenewed 时为最新会话
    int           active_count = 0; // 判定后的活跃数
    int           reclaimed = 0;    // 本次顺带回收的过期会话数
};

enum class TouchOutcome {
    kRenewed,
    kNotFound,
    kExpired,
};

struct TouchResult {
    TouchOutcome  outcome = TouchOutcome::kNotFound;
    DeviceSession session;
};

// 设备会话存储. 唯一的计数来源, 所有实现须保证:
// 1. 同一分组内 (分组, 指纹) 至多一条活跃记录
// 2. ClaimSlot 的 计数 + 插入 为同一个不可分割的步骤
// 3. 不同分组之间互不阻塞
class DeviceSessionStore {
public:
    virtual ~DeviceSessionStore() = default;

    // 原子准入: 回收分组内已过期会话 -> 同指纹续期 -> 未满则插入
    virtual quota::common::StatusOr<ClaimResult> ClaimSlot(const DeviceSession& candidate,
                                                           int limit,
                                                           std::int64_t now_ms,
                                                           std::int64_t ttl_ms) = 0;
    // 心跳续期
    virtual quota::common::StatusOr<TouchResult> Touch(const std::string& session_id,
                                                       std::int64_t now_ms,
                                                       std::int64_t ttl_ms) = 0;
    virtual quota::common::StatusOr<DeviceSession> GetSession(const std::string& session_id) = 0;
    // 将活跃会话置为失效, 会话不存在或已失效时返回 NotFound
    virtual quota::common::StatusOr<DeviceSession> Deactivate(const std::string& session_id,
                                                              EndReason reason,
                                                              std::int64_t now_ms) = 0;
    virtual quota::common::StatusOr<int> DeactivateGroup(const std::string& group_id,
                                                         EndReason reason,
                                                         std::int64_t now_ms) = 0;
    // 按最近活跃时间倒序
    virtual quota::common::StatusOr<std::vector<DeviceSession>> ListActive(const std::string& group_id,
                                                                           std::int64_t now_ms) = 0;
    virtual quota::common::StatusOr<int> CountActive(const std::string& group_id, std::int64_t now_ms) = 0;
    // 清扫: 逐条复核后将过期会话置为失效
    virtual quota::common::StatusOr<int> ExpireStale(std::int64_t now_ms) = 0;
    // 物理删除早于 ended_before_ms 失效的会话
    virtual quota::common::StatusOr<int> PurgeInactive(std::int64_t ended_before_ms) = 0;
};

class InMemoryDeviceSessionStore : public DeviceSessionStore {
public:
    explicit InMemoryDeviceSessionStore(std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(200));

    quota::common::StatusOr<ClaimResult> ClaimSlot(const DeviceSession& candidate,
                                                   int limit,
                                                   std::int64_t now_ms,
                                                   std::int64_t ttl_ms) override;
    quota::common::StatusOr<TouchResult> Touch(const std::string& session_id,
                                               std::int64_t now_ms,
                                               std::int64_t ttl_ms) override;
    quota::common::StatusOr<DeviceSession> GetSession(const std::string& session_id) override;
    quota::common::StatusOr<DeviceSession> Deactivate(const std::string& session_id,
                                                      EndReason reason,
                                                      std::int64_t now_ms) override;
    quota::common::StatusOr<int> DeactivateGroup(const std::string& group_id,
                                                 EndReason reason,
                                                 std::int64_t now_ms) override;
    quota::common::StatusOr<std::vector<DeviceSession>> ListActive(const std::string& group_id,
                                                                   std::int64_t now_ms) override;
    quota::common::StatusOr<int> CountActive(const std::string& group_id, std::int64_t now_ms) override;
    quota::common::StatusOr<int> ExpireStale(std::int64_t now_ms) override;
    quota::common::StatusOr<int> PurgeInactive(std::int64_t ended_before_ms) override;

private:
    // 每个分组一把锁, 持锁范围只覆盖本分组的读写
    struct GroupPartition {
        std::timed_mutex mutex;
        std::unordered_map<std::string, DeviceSession> sessions;              // session_id -> 会话
        std::unordered_map<std::string, std::string> active_by_fingerprint;  // 指纹 -> 活跃 session_id
    };
    using PartitionPtr = std::shared_ptr<GroupPartition>;
    using PartitionLock = std::unique_lock<std::timed_mutex>;

    PartitionPtr FindPartition(const std::string& group_id) const;
    PartitionPtr GetOrCreatePartition(const std::string& group_id);
    PartitionPtr PartitionForSession(const std::string& session_id) const;
    std::vector<PartitionPtr> SnapshotPartitions() const;
    quota::common::StatusOr<PartitionLock> LockPartition(GroupPartition& partition) const;

    // 以下函数要求调用方已持有分组锁
    static int ExpireLocked(GroupPartition& partition, std::int64_t now_ms);
    static void DeactivateLocked(GroupPartition& partition, DeviceSession& session,
                                 EndReason reason, std::int64_t now_ms);
    static int CountLocked(const GroupPartition& partition, std::int64_t now_ms);

    std::chrono::milliseconds lock_timeout_;
    // 锁顺序: 分组锁 -> index_mutex_, 反向不允许
    mutable std::shared_mutex registry_mutex_;
    std::unordered_map<std::string, PartitionPtr> partitions_;
    mutable std::shared_mutex index_mutex_;
    std::unordered_map<std::string, std::string> group_by_session_;
};

} // namespace core
} // namespace quota
