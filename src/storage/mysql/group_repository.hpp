#pragma once

#include "core/device/group_repository.hpp"
#include "storage/mysql/connection_pool.hpp"

#include <memory>

namespace quota {
namespace storage {

class MySqlGroupRepository : public quota::core::GroupRepository {
public:
    explicit MySqlGroupRepository(std::shared_ptr<ConnectionPool> pool);

    quota::common::StatusOr<quota::core::QuotaGroup> GetGroup(const std::string& group_id) override;
    quota::common::Status UpsertGroup(const quota::core::QuotaGroup& group) override;
    quota::common::StatusOr<bool> CreateIfAbsent(const quota::core::QuotaGroup& group) override;
    quota::common::StatusOr<quota::core::QuotaGroup> UpdateLimit(const std::string& group_id,
                                                                 int new_limit,
                                                                 std::int64_t now_ms) override;

private:
    std::shared_ptr<ConnectionPool> pool_;
};

} // namespace storage
} // namespace quota
