#include "storage/mysql/group_repository.hpp"

#include "storage/mysql/mysql_utils.hpp"

#include <fmt/format.h>

namespace quota {
namespace storage {

using quota::common::Status;
using quota::common::StatusOr;
using quota::core::QuotaGroup;

MySqlGroupRepository::MySqlGroupRepository(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

StatusOr<QuotaGroup> MySqlGroupRepository::GetGroup(const std::string& group_id) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto res_or = Query(lease.Raw(), fmt::format(
        "SELECT group_id, school_id, kind, device_limit, enabled, updated_at_ms "
        "FROM quota_groups WHERE group_id = {} LIMIT 1",
        EscapeAndQuote(lease.Raw(), group_id)));
    if (!res_or.IsOk()) {
        lease.CheckHealth();
        return res_or.GetStatus();
    }
    MYSQL_ROW row = mysql_fetch_row(res_or.Value().get());
    if (!row) {
        return Status::NotFound("Quota group not found");
    }
    QuotaGroup group;
    group.group_id = row[0] ? row[0] : "";
    group.school_id = row[1] ? row[1] : "";
    group.kind = row[2] ? row[2] : "";
    group.limit = static_cast<int>(ParseInt64(row[3]));
    group.enabled = ParseInt64(row[4]) != 0;
    group.updated_at_ms = ParseInt64(row[5]);
    return StatusOr<QuotaGroup>(std::move(group));
}

Status MySqlGroupRepository::UpsertGroup(const QuotaGroup& group) {
    if (group.group_id.empty()) {
        return Status::InvalidArgument("Group id cannot be empty");
    }
    if (group.limit <= 0) {
        return Status::InvalidArgument("Device limit must be positive");
    }
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    MYSQL* conn = lease.Raw();
    auto status = Execute(conn, fmt::format(
        "INSERT INTO quota_groups (group_id, school_id, kind, device_limit, enabled, updated_at_ms) "
        "VALUES ({}, {}, {}, {}, {}, {}) "
        "ON DUPLICATE KEY UPDATE school_id = VALUES(school_id), kind = VALUES(kind), "
        "device_limit = VALUES(device_limit), enabled = VALUES(enabled), "
        "updated_at_ms = VALUES(updated_at_ms)",
        EscapeAndQuote(conn, group.group_id),
        EscapeAndQuote(conn, group.school_id),
        EscapeAndQuote(conn, group.kind),
        group.limit,
        group.enabled ? 1 : 0,
        group.updated_at_ms));
    if (!status.IsOk()) {
        lease.CheckHealth();
    }
    return status;
}

StatusOr<bool> MySqlGroupRepository::CreateIfAbsent(const QuotaGroup& group) {
    if (group.group_id.empty()) {
        return Status::InvalidArgument("Group id cannot be empty");
    }
    if (group.limit <= 0) {
        return Status::InvalidArgument("Device limit must be positive");
    }
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    MYSQL* conn = lease.Raw();
    // 已存在时 group_id = group_id 不改动任何列, 影响行数为 0
    auto status = Execute(conn, fmt::format(
        "INSERT INTO quota_groups (group_id, school_id, kind, device_limit, enabled, updated_at_ms) "
        "VALUES ({}, {}, {}, {}, {}, {}) "
        "ON DUPLICATE KEY UPDATE group_id = group_id",
        EscapeAndQuote(conn, group.group_id),
        EscapeAndQuote(conn, group.school_id),
        EscapeAndQuote(conn, group.kind),
        group.limit,
        group.enabled ? 1 : 0,
        group.updated_at_ms));
    if (!status.IsOk()) {
        lease.CheckHealth();
        return status;
    }
    return StatusOr<bool>(mysql_affected_rows(conn) > 0);
}

StatusOr<QuotaGroup> MySqlGroupRepository::UpdateLimit(const std::string& group_id,
                                                       int new_limit,
                                                       std::int64_t now_ms) {
    if (new_limit <= 0) {
        return Status::InvalidArgument("Device limit must be positive");
    }
    {
        auto lease_or = pool_->Acquire();
        if (!lease_or.IsOk()) {
            return lease_or.GetStatus();
        }
        auto lease = std::move(lease_or.Value());
        MYSQL* conn = lease.Raw();
        auto status = Execute(conn, fmt::format(
            "UPDATE quota_groups SET device_limit = {}, updated_at_ms = {} WHERE group_id = {}",
            new_limit, now_ms, EscapeAndQuote(conn, group_id)));
        if (!status.IsOk()) {
            lease.CheckHealth();
            return status;
        }
    }
    // 影响行数为 0 既可能是分组不存在, 也可能是限额未变, 以回读结果为准
    return GetGroup(group_id);
}

} // namespace storage
} // namespace quota
