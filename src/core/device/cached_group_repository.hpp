#pragma once

#include "cache/redis_client.hpp"
#include "core/device/group_repository.hpp"

#include <memory>
#include <string>

namespace quota {
namespace core {

// 带 Redis 读缓存的分组仓库包装器
// 只缓存分组定义, 活跃设备数永远从会话存储实时计算
class CachedGroupRepository : public GroupRepository {
public:
    // primary: 主存储库实例
    // redis: Redis 客户端实例, 为空时退化为直通
    // ttl_seconds: 缓存过期时间, 限制其他实例修改限额后的可见延迟
    CachedGroupRepository(std::shared_ptr<GroupRepository> primary,
                          std::shared_ptr<quota::cache::RedisClient> redis,
                          int ttl_seconds = 30);

    quota::common::StatusOr<QuotaGroup> GetGroup(const std::string& group_id) override;
    quota::common::Status UpsertGroup(const QuotaGroup& group) override;
    quota::common::StatusOr<bool> CreateIfAbsent(const QuotaGroup& group) override;
    quota::common::StatusOr<QuotaGroup> UpdateLimit(const std::string& group_id,
                                                    int new_limit,
                                                    std::int64_t now_ms) override;

    // 缓存键, 测试中用于直接检查 Redis
    static std::string KeyForGroup(const std::string& group_id);

private:
    bool HasCache() const { return static_cast<bool>(redis_); }

    quota::common::Status CachePut(const QuotaGroup& group);
    quota::common::Status CacheDelete(const std::string& group_id);
    quota::common::StatusOr<QuotaGroup> CacheGet(const std::string& group_id);
    // 解析失败的缓存条目直接删除
    void DropInvalid(const std::string& group_id);

    std::shared_ptr<GroupRepository> primary_;
    std::shared_ptr<quota::cache::RedisClient> redis_;
    int ttl_seconds_;
};

} // namespace core
} // namespace quota
