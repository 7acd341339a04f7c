#pragma once

#include "common/config.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/device/device_session.hpp"

#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace quota {
namespace core {

// 分组定义存储 (限额、所属学校、启用状态)
class GroupRepository {
public:
    virtual ~GroupRepository() = default;

    virtual quota::common::StatusOr<QuotaGroup> GetGroup(const std::string& group_id) = 0;
    virtual quota::common::Status UpsertGroup(const QuotaGroup& group) = 0;
    // 仅在分组不存在时写入; 返回 true 表示新建, false 表示保留已有记录
    virtual quota::common::StatusOr<bool> CreateIfAbsent(const QuotaGroup& group) = 0;
    // 只修改限额, 返回修改后的分组
    virtual quota::common::StatusOr<QuotaGroup> UpdateLimit(const std::string& group_id,
                                                            int new_limit,
                                                            std::int64_t now_ms) = 0;
};

class InMemoryGroupRepository : public GroupRepository {
public:
    quota::common::StatusOr<QuotaGroup> GetGroup(const std::string& group_id) override;
    quota::common::Status UpsertGroup(const QuotaGroup& group) override;
    quota::common::StatusOr<bool> CreateIfAbsent(const QuotaGroup& group) override;
    quota::common::StatusOr<QuotaGroup> UpdateLimit(const std::string& group_id,
                                                    int new_limit,
                                                    std::int64_t now_ms) override;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, QuotaGroup> groups_;
};

// 按配置预置分组; limit 未配置时取 default_limits[kind]
// 已存在的分组保持原样, 运行期修改的限额和启用状态以存储为准
// 返回新建的分组数
quota::common::StatusOr<int> SeedGroups(GroupRepository& repository,
                                        const std::vector<quota::common::GroupSeed>& seeds,
                                        const quota::common::QuotaConfig& quota,
                                        std::int64_t now_ms);

} // namespace core
} // namespace quota
