#include "storage/mysql/device_session_store.hpp"

#include "storage/mysql/mysql_utils.hpp"

#include <fmt/format.h>

namespace quota {
namespace storage {

using quota::common::Status;
using quota::common::StatusOr;
using quota::core::ClaimOutcome;
using quota::core::ClaimResult;
using quota::core::DeviceSession;
using quota::core::EndReason;
using quota::core::TouchOutcome;
using quota::core::TouchResult;

namespace {

constexpr const char* kSessionColumns =
    "session_id, group_id, fingerprint_hash, ip_address, user_agent, platform, "
    "device_type, browser, os, created_at_ms, last_active_at_ms, expires_at_ms, "
    "is_active, ended_at_ms, end_reason, heartbeat_count";

DeviceSession RowToSession(MYSQL_ROW row) {
    DeviceSession session;
    session.session_id = row[0] ? row[0] : "";
    session.group_id = row[1] ? row[1] : "";
    session.fingerprint_hash = row[2] ? row[2] : "";
    session.ip_address = row[3] ? row[3] : "";
    session.user_agent = row[4] ? row[4] : "";
    session.platform = row[5] ? row[5] : "";
    session.device_type = row[6] ? row[6] : "";
    session.browser = row[7] ? row[7] : "";
    session.os = row[8] ? row[8] : "";
    session.created_at_ms = ParseInt64(row[9]);
    session.last_active_at_ms = ParseInt64(row[10]);
    session.expires_at_ms = ParseInt64(row[11]);
    session.is_active = ParseInt64(row[12]) != 0;
    session.ended_at_ms = ParseInt64(row[13]);
    session.end_reason = quota::core::EndReasonFromString(row[14] ? row[14] : "");
    session.heartbeat_count = static_cast<std::uint32_t>(ParseInt64(row[15]));
    return session;
}

// 把分组内已到期的活跃会话置为失效, 条件更新只会把 1 改成 0
std::string ExpireGroupSql(MYSQL* conn, const std::string& group_id, std::int64_t now_ms) {
    return fmt::format(
        "UPDATE device_sessions SET is_active = 0, ended_at_ms = {0}, end_reason = 'expired' "
        "WHERE group_id = {1} AND is_active = 1 AND expires_at_ms <= {0}",
        now_ms, EscapeAndQuote(conn, group_id));
}

} // namespace

MySqlDeviceSessionStore::MySqlDeviceSessionStore(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

StatusOr<DeviceSession> MySqlDeviceSessionStore::LoadSession(Transaction& tx,
                                                             const std::string& session_id,
                                                             bool for_update) {
    auto sql = fmt::format("SELECT {} FROM device_sessions WHERE session_id = {} LIMIT 1{}",
                           kSessionColumns, EscapeAndQuote(tx.Raw(), session_id),
                           for_update ? " FOR UPDATE" : "");
    auto res_or = tx.Query(sql);
    if (!res_or.IsOk()) {
        return res_or.GetStatus();
    }
    MYSQL_ROW row = mysql_fetch_row(res_or.Value().get());
    if (!row) {
        return Status::NotFound("Device session not found");
    }
    return StatusOr<DeviceSession>(RowToSession(row));
}

StatusOr<int> MySqlDeviceSessionStore::CountActiveLocked(Transaction& tx,
                                                         const std::string& group_id,
                                                         std::int64_t now_ms) {
    auto sql = fmt::format(
        "SELECT COUNT(*) FROM device_sessions "
        "WHERE group_id = {} AND is_active = 1 AND expires_at_ms > {}",
        EscapeAndQuote(tx.Raw(), group_id), now_ms);
    auto res_or = tx.Query(sql);
    if (!res_or.IsOk()) {
        return res_or.GetStatus();
    }
    MYSQL_ROW row = mysql_fetch_row(res_or.Value().get());
    return StatusOr<int>(row ? static_cast<int>(ParseInt64(row[0])) : 0);
}

StatusOr<ClaimResult> MySqlDeviceSessionStore::ClaimSlot(const DeviceSession& candidate,
                                                         int limit,
                                                         std::int64_t now_ms,
                                                         std::int64_t ttl_ms) {
    if (candidate.session_id.empty() || candidate.group_id.empty() || candidate.fingerprint_hash.empty()) {
        return Status::InvalidArgument("Session id, group id and fingerprint are required");
    }
    Transaction tx(pool_);
    auto status = tx.Begin();
    if (!status.IsOk()) {
        return status;
    }
    MYSQL* conn = tx.Raw();
    const std::string group = EscapeAndQuote(conn, candidate.group_id);

    // 分组行锁: 本分组的 回收 -> 计数 -> 插入 在锁内完成
    auto lock_or = tx.Query(fmt::format(
        "SELECT group_id FROM quota_groups WHERE group_id = {} FOR UPDATE", group));
    if (!lock_or.IsOk()) {
        return lock_or.GetStatus();
    }
    if (!mysql_fetch_row(lock_or.Value().get())) {
        return Status::NotFound("Quota group not found");
    }

    ClaimResult result;
    status = tx.Execute(ExpireGroupSql(conn, candidate.group_id, now_ms));
    if (!status.IsOk()) {
        return status;
    }
    result.reclaimed = static_cast<int>(tx.AffectedRows());

    auto existing_or = tx.Query(fmt::format(
        "SELECT {} FROM device_sessions "
        "WHERE group_id = {} AND active_fingerprint = {} LIMIT 1",
        kSessionColumns, group, EscapeAndQuote(conn, candidate.fingerprint_hash)));
    if (!existing_or.IsOk()) {
        return existing_or.GetStatus();
    }
    MYSQL_ROW existing_row = mysql_fetch_row(existing_or.Value().get());
    if (existing_row) {
        DeviceSession session = RowToSession(existing_row);
        session.last_active_at_ms = now_ms;
        session.expires_at_ms = now_ms + ttl_ms;
        session.ip_address = candidate.ip_address;
        session.user_agent = candidate.user_agent;
        session.heartbeat_count += 1;
        status = tx.Execute(fmt::format(
            "UPDATE device_sessions SET last_active_at_ms = {}, expires_at_ms = {}, "
            "ip_address = {}, user_agent = {}, heartbeat_count = heartbeat_count + 1 "
            "WHERE session_id = {}",
            session.last_active_at_ms, session.expires_at_ms,
            EscapeAndQuote(conn, session.ip_address), EscapeAndQuote(conn, session.user_agent),
            EscapeAndQuote(conn, session.session_id)));
        if (!status.IsOk()) {
            return status;
        }
        auto count_or = CountActiveLocked(tx, candidate.group_id, now_ms);
        if (!count_or.IsOk()) {
            return count_or.GetStatus();
        }
        status = tx.Commit();
        if (!status.IsOk()) {
            return status;
        }
        result.outcome = ClaimOutcome::kRenewed;
        result.session = std::move(session);
        result.active_count = count_or.Value();
        return StatusOr<ClaimResult>(std::move(result));
    }

    auto count_or = CountActiveLocked(tx, candidate.group_id, now_ms);
    if (!count_or.IsOk()) {
        return count_or.GetStatus();
    }
    const int active = count_or.Value();
    if (active >= limit) {
        // 提交以保留本次回收的结果
        status = tx.Commit();
        if (!status.IsOk()) {
            return status;
        }
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
    status = tx.Execute(fmt::format(
        "INSERT INTO device_sessions (session_id, group_id, fingerprint_hash, ip_address, user_agent, "
        "platform, device_type, browser, os, created_at_ms, last_active_at_ms, expires_at_ms, "
        "is_active, ended_at_ms, end_reason, heartbeat_count) "
        "VALUES ({}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, 1, 0, '', 0)",
        EscapeAndQuote(conn, session.session_id),
        group,
        EscapeAndQuote(conn, session.fingerprint_hash),
        EscapeAndQuote(conn, session.ip_address),
        EscapeAndQuote(conn, session.user_agent),
        EscapeAndQuote(conn, session.platform),
        EscapeAndQuote(conn, session.device_type),
        EscapeAndQuote(conn, session.browser),
        EscapeAndQuote(conn, session.os),
        session.created_at_ms,
        session.last_active_at_ms,
        session.expires_at_ms));
    if (!status.IsOk()) {
        return status;
    }
    status = tx.Commit();
    if (!status.IsOk()) {
        return status;
    }
    result.outcome = ClaimOutcome::kInserted;
    result.session = std::move(session);
    result.active_count = active + 1;
    return StatusOr<ClaimResult>(std::move(result));
}

StatusOr<TouchResult> MySqlDeviceSessionStore::Touch(const std::string& session_id,
                                                     std::int64_t now_ms,
                                                     std::int64_t ttl_ms) {
    TouchResult result;
    Transaction tx(pool_);
    auto status = tx.Begin();
    if (!status.IsOk()) {
        return status;
    }
    auto session_or = LoadSession(tx, session_id, true);
    if (!session_or.IsOk()) {
        if (session_or.GetStatus().Code() == quota::common::StatusCode::kNotFound) {
            return StatusOr<TouchResult>(std::move(result));
        }
        return session_or.GetStatus();
    }
    DeviceSession session = std::move(session_or.Value());
    MYSQL* conn = tx.Raw();

    if (!session.is_active) {
        result.outcome = session.end_reason == EndReason::kExpired ? TouchOutcome::kExpired
                                                                   : TouchOutcome::kNotFound;
        result.session = std::move(session);
        return StatusOr<TouchResult>(std::move(result));
    }
    if (session.expires_at_ms <= now_ms) {
        status = tx.Execute(fmt::format(
            "UPDATE device_sessions SET is_active = 0, ended_at_ms = {}, end_reason = 'expired' "
            "WHERE session_id = {} AND is_active = 1",
            now_ms, EscapeAndQuote(conn, session_id)));
        if (!status.IsOk()) {
            return status;
        }
        status = tx.Commit();
        if (!status.IsOk()) {
            return status;
        }
        session.is_active = false;
        session.ended_at_ms = now_ms;
        session.end_reason = EndReason::kExpired;
        result.outcome = TouchOutcome::kExpired;
        result.session = std::move(session);
        return StatusOr<TouchResult>(std::move(result));
    }

    session.last_active_at_ms = now_ms;
    session.expires_at_ms = now_ms + ttl_ms;
    session.heartbeat_count += 1;
    status = tx.Execute(fmt::format(
        "UPDATE device_sessions SET last_active_at_ms = {}, expires_at_ms = {}, "
        "heartbeat_count = heartbeat_count + 1 WHERE session_id = {}",
        session.last_active_at_ms, session.expires_at_ms, EscapeAndQuote(conn, session_id)));
    if (!status.IsOk()) {
        return status;
    }
    status = tx.Commit();
    if (!status.IsOk()) {
        return status;
    }
    result.outcome = TouchOutcome::kRenewed;
    result.session = std::move(session);
    return StatusOr<TouchResult>(std::move(result));
}

StatusOr<DeviceSession> MySqlDeviceSessionStore::GetSession(const std::string& session_id) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto res_or = Query(lease.Raw(), fmt::format(
        "SELECT {} FROM device_sessions WHERE session_id = {} LIMIT 1",
        kSessionColumns, EscapeAndQuote(lease.Raw(), session_id)));
    if (!res_or.IsOk()) {
        lease.CheckHealth();
        return res_or.GetStatus();
    }
    MYSQL_ROW row = mysql_fetch_row(res_or.Value().get());
    if (!row) {
        return Status::NotFound("Device session not found");
    }
    return StatusOr<DeviceSession>(RowToSession(row));
}

StatusOr<DeviceSession> MySqlDeviceSessionStore::Deactivate(const std::string& session_id,
                                                            EndReason reason,
                                                            std::int64_t now_ms) {
    Transaction tx(pool_);
    auto status = tx.Begin();
    if (!status.IsOk()) {
        return status;
    }
    status = tx.Execute(fmt::format(
        "UPDATE device_sessions SET is_active = 0, ended_at_ms = {}, end_reason = {} "
        "WHERE session_id = {} AND is_active = 1",
        now_ms, EscapeAndQuote(tx.Raw(), quota::core::EndReasonToString(reason)),
        EscapeAndQuote(tx.Raw(), session_id)));
    if (!status.IsOk()) {
        return status;
    }
    if (tx.AffectedRows() == 0) {
        return Status::NotFound("Device session not found or inactive");
    }
    auto session_or = LoadSession(tx, session_id, false);
    if (!session_or.IsOk()) {
        return session_or.GetStatus();
    }
    status = tx.Commit();
    if (!status.IsOk()) {
        return status;
    }
    return session_or;
}

StatusOr<int> MySqlDeviceSessionStore::DeactivateGroup(const std::string& group_id,
                                                       EndReason reason,
                                                       std::int64_t now_ms) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    MYSQL* conn = lease.Raw();
    auto status = Execute(conn, fmt::format(
        "UPDATE device_sessions SET is_active = 0, ended_at_ms = {}, end_reason = {} "
        "WHERE group_id = {} AND is_active = 1",
        now_ms, EscapeAndQuote(conn, quota::core::EndReasonToString(reason)),
        EscapeAndQuote(conn, group_id)));
    if (!status.IsOk()) {
        lease.CheckHealth();
        return status;
    }
    return StatusOr<int>(static_cast<int>(mysql_affected_rows(conn)));
}

StatusOr<std::vector<DeviceSession>> MySqlDeviceSessionStore::ListActive(const std::string& group_id,
                                                                         std::int64_t now_ms) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto res_or = Query(lease.Raw(), fmt::format(
        "SELECT {} FROM device_sessions "
        "WHERE group_id = {} AND is_active = 1 AND expires_at_ms > {} "
        "ORDER BY last_active_at_ms DESC",
        kSessionColumns, EscapeAndQuote(lease.Raw(), group_id), now_ms));
    if (!res_or.IsOk()) {
        lease.CheckHealth();
        return res_or.GetStatus();
    }
    std::vector<DeviceSession> sessions;
    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res_or.Value().get())) != nullptr) {
        sessions.push_back(RowToSession(row));
    }
    return StatusOr<std::vector<DeviceSession>>(std::move(sessions));
}

StatusOr<int> MySqlDeviceSessionStore::CountActive(const std::string& group_id, std::int64_t now_ms) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto res_or = Query(lease.Raw(), fmt::format(
        "SELECT COUNT(*) FROM device_sessions "
        "WHERE group_id = {} AND is_active = 1 AND expires_at_ms > {}",
        EscapeAndQuote(lease.Raw(), group_id), now_ms));
    if (!res_or.IsOk()) {
        lease.CheckHealth();
        return res_or.GetStatus();
    }
    MYSQL_ROW row = mysql_fetch_row(res_or.Value().get());
    return StatusOr<int>(row ? static_cast<int>(ParseInt64(row[0])) : 0);
}

StatusOr<int> MySqlDeviceSessionStore::ExpireStale(std::int64_t now_ms) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    MYSQL* conn = lease.Raw();
    // 与准入并发时, 被续期的行不再满足 expires_at_ms <= now, 不会被误伤
    auto status = Execute(conn, fmt::format(
        "UPDATE device_sessions SET is_active = 0, ended_at_ms = {0}, end_reason = 'expired' "
        "WHERE is_active = 1 AND expires_at_ms <= {0}",
        now_ms));
    if (!status.IsOk()) {
        lease.CheckHealth();
        return status;
    }
    return StatusOr<int>(static_cast<int>(mysql_affected_rows(conn)));
}

StatusOr<int> MySqlDeviceSessionStore::PurgeInactive(std::int64_t ended_before_ms) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    MYSQL* conn = lease.Raw();
    auto status = Execute(conn, fmt::format(
        "DELETE FROM device_sessions WHERE is_active = 0 AND ended_at_ms < {}",
        ended_before_ms));
    if (!status.IsOk()) {
        lease.CheckHealth();
        return status;
    }
    return StatusOr<int>(static_cast<int>(mysql_affected_rows(conn)));
}

} // namespace storage
} // namespace quota
