#include "core/device/cached_group_repository.hpp"

#include "common/logger.hpp"

#include <nlohmann/json.hpp>

#include <string_view>

namespace quota {
namespace core {

namespace {
constexpr std::string_view kPrefix = "device_quota:group:";
} // namespace

CachedGroupRepository::CachedGroupRepository(std::shared_ptr<GroupRepository> primary,
                                             std::shared_ptr<quota::cache::RedisClient> redis,
                                             int ttl_seconds)
    : primary_(std::move(primary)), redis_(std::move(redis)), ttl_seconds_(ttl_seconds) {}

std::string CachedGroupRepository::KeyForGroup(const std::string& group_id) {
    return std::string(kPrefix).append(group_id);
}

// 读逻辑: 先读缓存, 未命中再读主存储库并回填
quota::common::StatusOr<QuotaGroup> CachedGroupRepository::GetGroup(const std::string& group_id) {
    if (HasCache()) {
        auto cached = CacheGet(group_id);
        if (cached.IsOk()) {
            return cached;
        }
        if (cached.GetStatus().Code() != quota::common::StatusCode::kNotFound) {
            QUOTA_LOG_WARN("[GroupCache] get failed: {}", cached.GetStatus().Message());
        }
    }

    auto db_result = primary_->GetGroup(group_id);
    if (!db_result.IsOk() || !HasCache()) {
        return db_result;
    }
    auto put_status = CachePut(db_result.Value());
    if (!put_status.IsOk()) {
        QUOTA_LOG_WARN("[GroupCache] backfill failed: {}", put_status.Message());
    }
    return db_result;
}

// 写逻辑: 先写主存储库, 再删除缓存
quota::common::Status CachedGroupRepository::UpsertGroup(const QuotaGroup& group) {
    auto status = primary_->UpsertGroup(group);
    if (!status.IsOk() || !HasCache()) {
        return status;
    }
    auto del_status = CacheDelete(group.group_id);
    if (!del_status.IsOk()) {
        QUOTA_LOG_WARN("[GroupCache] invalidate failed: {}", del_status.Message());
    }
    return status;
}

quota::common::StatusOr<bool> CachedGroupRepository::CreateIfAbsent(const QuotaGroup& group) {
    auto created = primary_->CreateIfAbsent(group);
    if (!created.IsOk() || !created.Value() || !HasCache()) {
        return created;
    }
    // 清掉可能残留的旧缓存条目
    auto del_status = CacheDelete(group.group_id);
    if (!del_status.IsOk()) {
        QUOTA_LOG_WARN("[GroupCache] invalidate failed: {}", del_status.Message());
    }
    return created;
}

quota::common::StatusOr<QuotaGroup> CachedGroupRepository::UpdateLimit(const std::string& group_id,
                                                                       int new_limit,
                                                                       std::int64_t now_ms) {
    auto result = primary_->UpdateLimit(group_id, new_limit, now_ms);
    if (!result.IsOk() || !HasCache()) {
        return result;
    }
    auto del_status = CacheDelete(group_id);
    if (!del_status.IsOk()) {
        QUOTA_LOG_WARN("[GroupCache] invalidate failed: {}", del_status.Message());
    }
    return result;
}

quota::common::Status CachedGroupRepository::CachePut(const QuotaGroup& group) {
    nlohmann::json j{
        {"group_id", group.group_id},
        {"school_id", group.school_id},
        {"kind", group.kind},
        {"limit", group.limit},
        {"enabled", group.enabled},
        {"updated_at_ms", group.updated_at_ms},
    };
    return redis_->SetEx(KeyForGroup(group.group_id), j.dump(), ttl_seconds_);
}

quota::common::StatusOr<QuotaGroup> CachedGroupRepository::CacheGet(const std::string& group_id) {
    auto resp = redis_->Get(KeyForGroup(group_id));
    if (!resp.IsOk()) {
        return resp.GetStatus();
    }
    auto json = nlohmann::json::parse(resp.Value(), nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        DropInvalid(group_id);
        return quota::common::Status::Unavailable("invalid cache payload");
    }

    QuotaGroup group;
    group.group_id = json.value("group_id", group_id);
    group.school_id = json.value("school_id", "");
    group.kind = json.value("kind", "");
    group.limit = json.value("limit", 0);
    group.enabled = json.value("enabled", true);
    group.updated_at_ms = json.value("updated_at_ms", static_cast<std::int64_t>(0));
    if (group.limit <= 0) {
        DropInvalid(group_id);
        return quota::common::Status::Unavailable("invalid cached limit");
    }
    return quota::common::StatusOr<QuotaGroup>(group);
}

void CachedGroupRepository::DropInvalid(const std::string& group_id) {
    auto status = CacheDelete(group_id);
    if (!status.IsOk()) {
        QUOTA_LOG_WARN("[GroupCache] drop invalid entry failed: {}", status.Message());
    }
}

quota::common::Status CachedGroupRepository::CacheDelete(const std::string& group_id) {
    auto status = redis_->Del(KeyForGroup(group_id));
    if (!status.IsOk() && status.Code() != quota::common::StatusCode::kNotFound) {
        return status;
    }
    return quota::common::Status::OK();
}

} // namespace core
} // namespace quota
