#include "core/device/session_store.hpp"

#include <algorithm>

namespace quota {
namespace core {

using quota::common::Status;
using quota::common::StatusOr;

InMemoryDeviceSessionStore::InMemoryDeviceSessionStore(std::chrono::milliseconds lock_timeout)
    : lock_timeout_(lock_timeout) {}

InMemoryDeviceSessionStore::PartitionPtr InMemoryDeviceSessionStore::FindPartition(const std::string& group_id) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    auto it = partitions_.find(group_id);
    if (it == partitions_.end()) {
        return nullptr;
    }
    return it->second;
}

InMemoryDeviceSessionStore::PartitionPtr InMemoryDeviceSessionStore::GetOrCreatePartition(const std::string& group_id) {
    if (auto existing = FindPartition(group_id)) {
        return existing;
    }
    std::unique_lock<std::shared_mutex> lock(registry_mutex_);
    auto& slot = partitions_[group_id];
    if (!slot) {
        slot = std::make_shared<GroupPartition>();
    }
    return slot;
}

InMemoryDeviceSessionStore::PartitionPtr InMemoryDeviceSessionStore::PartitionForSession(const std::string& session_id) const {
    std::string group_id;
    {
        std::shared_lock<std::shared_mutex> lock(index_mutex_);
        auto it = group_by_session_.find(session_id);
        if (it == group_by_session_.end()) {
            return nullptr;
        }
        group_id = it->second;
    }
    return FindPartition(group_id);
}

std::vector<InMemoryDeviceSessionStore::PartitionPtr> InMemoryDeviceSessionStore::SnapshotPartitions() const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    std::vector<PartitionPtr> out;
    out.reserve(partitions_.size());
    for (const auto& entry : partitions_) {
        out.push_back(entry.second);
    }
    return out;
}

StatusOr<InMemoryDeviceSessionStore::PartitionLock> InMemoryDeviceSessionStore::LockPartition(GroupPartition& partition) const {
    PartitionLock lock(partition.mutex, lock_timeout_);
    if (!lock.owns_lock()) {
        return Status::Unavailable("Timed out waiting for group lock");
    }
    return StatusOr<PartitionLock>(std::move(lock));
}

int InMemoryDeviceSessionStore::ExpireLocked(GroupPartition& partition, std::int64_t now_ms) {
    int expired = 0;
    for (auto& entry : partition.sessions) {
        auto& session = entry.second;
        if (session.is_active && session.expires_at_ms <= now_ms) {
            DeactivateLocked(partition, session, EndReason::kExpired, now_ms);
            ++expired;
        }
    }
    return expired;
}

void InMemoryDeviceSessionStore::DeactivateLocked(GroupPartition& partition, DeviceSession& session,
                                                  EndReason reason, std::int64_t now_ms) {
    session.is_active = false;
    session.ended_at_ms = now_ms;
    session.end_reason = reason;
    auto it = partition.active_by_fingerprint.find(session.fingerprint_hash);
    if (it != partition.active_by_fingerprint.end() && it->second == session.session_id) {
        partition.active_by_fingerprint.erase(it);
    }
}

int InMemoryDeviceSessionStore::CountLocked(const GroupPartition& partition, std::int64_t now_ms) {
    int count = 0;
    for (const auto& entry : partition.active_by_fingerprint) {
        auto it = partition.sessions.find(entry.second);
        if (it != partition.sessions.end() && it->second.CountsAt(now_ms)) {
            ++count;
        }
    }
    return count;
}

StatusOr<ClaimResult> InMemoryDeviceSessionStore::ClaimSlot(const DeviceSession& candidate,
                                                            int limit,
                                                            std::int64_t now_ms,
                                                            std::int64_t ttl_ms) {
    if (candidate.session_id.empty() || candidate.group_id.empty() || candidate.fingerprint_hash.empty()) {
        return Status::InvalidArgument("Session id, group id and fingerprint are required");
    }
    auto partition = GetOrCreatePartition(candidate.group_id);
    auto lock_or = LockPartition(*partition);
    if (!lock_or.IsOk()) {
        return lock_or.GetStatus();
    }

    ClaimResult result;
    // 过期会话不能占名额, 也不能挡住同指纹的重新准入
    result.reclaimed = ExpireLocked(*partition, now_ms);

    // 同一设备: 续期, 不额外占用名额
    auto fp_it = partition->active_by_fingerprint.find(candidate.fingerprint_hash);
    if (fp_it != partition->active_by_fingerprint.end()) {
        auto& existing = partition->sessions.at(fp_it->second);
        existing.last_active_at_ms = now_ms;
        existing.expires_at_ms = now_ms + ttl_ms;
        existing.ip_address = candidate.ip_address;
        existing.user_agent = candidate.user_agent;
        existing.heartbeat_count += 1;
        result.outcome = ClaimOutcome::kRenewed;
        result.session = existing;
        result.active_count = CountLocked(*partition, now_ms);
        return StatusOr<ClaimResult>(std::move(result));
    }

    const int active = CountLocked(*partition, now_ms);
    if (active >= limit) {
        result.outcome = ClaimOutcome::kLimitReached;
        result.active_count = active;
        return StatusOr<ClaimResult>(std::move(result));
    }

    DeviceSession session = candidate;
    session.created_at_ms = now_ms;
    session.last_active_at_ms = now_ms;
    session.expires_at_ms = now_ms + ttl_ms;
    session.is_active = true;
    session.ended_at_ms = 0;
    session.end_reason = EndReason::kNone;
    session.heartbeat_count = 0;

    if (partition->sessions.count(session.session_id) != 0) {
        return Status::AlreadyExists("Session id already used");
    }
    partition->sessions.emplace(session.session_id, session);
    partition->active_by_fingerprint.emplace(session.fingerprint_hash, session.session_id);
    {
        std::unique_lock<std::shared_mutex> index_lock(index_mutex_);
        group_by_session_[session.session_id] = session.group_id;
    }

    result.outcome = ClaimOutcome::kInserted;
    result.session = std::move(session);
    result.active_count = active + 1;
    return StatusOr<ClaimResult>(std::move(result));
}

StatusOr<TouchResult> InMemoryDeviceSessionStore::Touch(const std::string& session_id,
                                                        std::int64_t now_ms,
                                                        std::int64_t ttl_ms) {
    TouchResult result;
    auto partition = PartitionForSession(session_id);
    if (!partition) {
        return StatusOr<TouchResult>(std::move(result));
    }
    auto lock_or = LockPartition(*partition);
    if (!lock_or.IsOk()) {
        return lock_or.GetStatus();
    }
    auto it = partition->sessions.find(session_id);
    if (it == partition->sessions.end()) {
        return StatusOr<TouchResult>(std::move(result));
    }
    auto& session = it->second;
    if (!session.is_active) {
        result.outcome = session.end_reason == EndReason::kExpired ? TouchOutcome::kExpired
                                                                   : TouchOutcome::kNotFound;
        result.session = session;
        return StatusOr<TouchResult>(std::move(result));
    }
    if (session.expires_at_ms <= now_ms) {
        DeactivateLocked(*partition, session, EndReason::kExpired, now_ms);
        result.outcome = TouchOutcome::kExpired;
        result.session = session;
        return StatusOr<TouchResult>(std::move(result));
    }
    session.last_active_at_ms = now_ms;
    session.expires_at_ms = now_ms + ttl_ms;
    session.heartbeat_count += 1;
    result.outcome = TouchOutcome::kRenewed;
    result.session = session;
    return StatusOr<TouchResult>(std::move(result));
}

StatusOr<DeviceSession> InMemoryDeviceSessionStore::GetSession(const std::string& session_id) {
    auto partition = PartitionForSession(session_id);
    if (!partition) {
        return Status::NotFound("Device session not found");
    }
    auto lock_or = LockPartition(*partition);
    if (!lock_or.IsOk()) {
        return lock_or.GetStatus();
    }
    auto it = partition->sessions.find(session_id);
    if (it == partition->sessions.end()) {
        return Status::NotFound("Device session not found");
    }
    return StatusOr<DeviceSession>(it->second);
}

StatusOr<DeviceSession> InMemoryDeviceSessionStore::Deactivate(const std::string& session_id,
                                                               EndReason reason,
                                                               std::int64_t now_ms) {
    auto partition = PartitionForSession(session_id);
    if (!partition) {
        return Status::NotFound("Device session not found");
    }
    auto lock_or = LockPartition(*partition);
    if (!lock_or.IsOk()) {
        return lock_or.GetStatus();
    }
    auto it = partition->sessions.find(session_id);
    if (it == partition->sessions.end() || !it->second.is_active) {
        return Status::NotFound("Device session not found or inactive");
    }
    DeactivateLocked(*partition, it->second, reason, now_ms);
    return StatusOr<DeviceSession>(it->second);
}

StatusOr<int> InMemoryDeviceSessionStore::DeactivateGroup(const std::string& group_id,
                                                          EndReason reason,
                                                          std::int64_t now_ms) {
    auto partition = FindPartition(group_id);
    if (!partition) {
        return StatusOr<int>(0);
    }
    auto lock_or = LockPartition(*partition);
    if (!lock_or.IsOk()) {
        return lock_or.GetStatus();
    }
    int cleared = 0;
    for (auto& entry : partition->sessions) {
        if (entry.second.is_active) {
            DeactivateLocked(*partition, entry.second, reason, now_ms);
            ++cleared;
        }
    }
    return StatusOr<int>(cleared);
}

StatusOr<std::vector<DeviceSession>> InMemoryDeviceSessionStore::ListActive(const std::string& group_id,
                                                                            std::int64_t now_ms) {
    std::vector<DeviceSession> out;
    auto partition = FindPartition(group_id);
    if (!partition) {
        return StatusOr<std::vector<DeviceSession>>(std::move(out));
    }
    auto lock_or = LockPartition(*partition);
    if (!lock_or.IsOk()) {
        return lock_or.GetStatus();
    }
    for (const auto& entry : partition->sessions) {
        if (entry.second.CountsAt(now_ms)) {
            out.push_back(entry.second);
        }
    }
    std::sort(out.begin(), out.end(), [](const DeviceSession& a, const DeviceSession& b) {
        return a.last_active_at_ms > b.last_active_at_ms;
    });
    return StatusOr<std::vector<DeviceSession>>(std::move(out));
}

StatusOr<int> InMemoryDeviceSessionStore::CountActive(const std::string& group_id, std::int64_t now_ms) {
    auto partition = FindPartition(group_id);
    if (!partition) {
        return StatusOr<int>(0);
    }
    auto lock_or = LockPartition(*partition);
    if (!lock_or.IsOk()) {
        return lock_or.GetStatus();
    }
    return StatusOr<int>(CountLocked(*partition, now_ms));
}

StatusOr<int> InMemoryDeviceSessionStore::ExpireStale(std::int64_t now_ms) {
    int expired = 0;
    for (const auto& partition : SnapshotPartitions()) {
        auto lock_or = LockPartition(*partition);
        if (!lock_or.IsOk()) {
            // 分组正忙, 留给下一轮
            continue;
        }
        expired += ExpireLocked(*partition, now_ms);
    }
    return StatusOr<int>(expired);
}

StatusOr<int> InMemoryDeviceSessionStore::PurgeInactive(std::int64_t ended_before_ms) {
    int purged = 0;
    for (const auto& partition : SnapshotPartitions()) {
        auto lock_or = LockPartition(*partition);
        if (!lock_or.IsOk()) {
            continue;
        }
        for (auto it = partition->sessions.begin(); it != partition->sessions.end();) {
            const auto& session = it->second;
            if (!session.is_active && session.ended_at_ms < ended_before_ms) {
                {
                    std::unique_lock<std::shared_mutex> index_lock(index_mutex_);
                    group_by_session_.erase(session.session_id);
                }
                it = partition->sessions.erase(it);
                ++purged;
            } else {
                ++it;
            }
        }
    }
    return StatusOr<int>(purged);
}

} // namespace core
} // namespace quota
