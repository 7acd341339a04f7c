#include "core/device/group_repository.hpp"

#include "common/config_loader.hpp"
#include "common/logger.hpp"

#include <mutex>

namespace quota {
namespace core {

quota::common::StatusOr<QuotaGroup> InMemoryGroupRepository::GetGroup(const std::string& group_id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = groups_.find(group_id);
    if (it == groups_.end()) {
        return quota::common::Status::NotFound("Quota group not found");
    }
    return quota::common::StatusOr<QuotaGroup>(it->second);
}

quota::common::Status InMemoryGroupRepository::UpsertGroup(const QuotaGroup& group) {
    if (group.group_id.empty()) {
        return quota::common::Status::InvalidArgument("Group id cannot be empty");
    }
    if (group.limit <= 0) {
        return quota::common::Status::InvalidArgument("Device limit must be positive");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    groups_[group.group_id] = group;
    return quota::common::Status::OK();
}

quota::common::StatusOr<bool> InMemoryGroupRepository::CreateIfAbsent(const QuotaGroup& group) {
    if (group.group_id.empty()) {
        return quota::common::Status::InvalidArgument("Group id cannot be empty");
    }
    if (group.limit <= 0) {
        return quota::common::Status::InvalidArgument("Device limit must be positive");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const bool created = groups_.emplace(group.group_id, group).second;
    return quota::common::StatusOr<bool>(created);
}

quota::common::StatusOr<QuotaGroup> InMemoryGroupRepository::UpdateLimit(const std::string& group_id,
                                                                         int new_limit,
                                                                         std::int64_t now_ms) {
    if (new_limit <= 0) {
        return quota::common::Status::InvalidArgument("Device limit must be positive");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = groups_.find(group_id);
    if (it == groups_.end()) {
        return quota::common::Status::NotFound("Quota group not found");
    }
    it->second.limit = new_limit;
    it->second.updated_at_ms = now_ms;
    return quota::common::StatusOr<QuotaGroup>(it->second);
}

quota::common::StatusOr<int> SeedGroups(GroupRepository& repository,
                                        const std::vector<quota::common::GroupSeed>& seeds,
                                        const quota::common::QuotaConfig& quota,
                                        std::int64_t now_ms) {
    int seeded = 0;
    for (const auto& seed : seeds) {
        QuotaGroup group;
        group.group_id = seed.group_id;
        group.school_id = seed.school_id;
        group.kind = seed.kind;
        group.limit = seed.limit > 0 ? seed.limit : quota::common::DefaultLimitFor(quota, seed.kind);
        group.enabled = seed.enabled;
        group.updated_at_ms = now_ms;
        auto created = repository.CreateIfAbsent(group);
        if (!created.IsOk()) {
            QUOTA_LOG_ERROR("Failed to seed group {}: {}", seed.group_id, created.GetStatus().Message());
            return created.GetStatus();
        }
        if (!created.Value()) {
            QUOTA_LOG_INFO("Group {} already stored, keeping stored limit", group.group_id);
            continue;
        }
        QUOTA_LOG_INFO("Seeded group={} kind={} limit={} enabled={}",
                       group.group_id, group.kind, group.limit, group.enabled);
        ++seeded;
    }
    return quota::common::StatusOr<int>(seeded);
}

} // namespace core
} // namespace quota
