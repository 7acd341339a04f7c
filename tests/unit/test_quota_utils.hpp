#pragma once

#include "common/clock.hpp"
#include "common/config_loader.hpp"
#include "core/device/group_repository.hpp"
#include "core/device/session_store.hpp"
#include "storage/mysql/connection_pool.hpp"

#include <gtest/gtest.h>
#include <mysql/mysql.h>

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>

namespace testutils {

// 手动推进的时钟, 用于过期相关用例
class ManualClock : public quota::common::Clock {
public:
    explicit ManualClock(std::int64_t start_ms = 1'700'000'000'000) : now_ms_(start_ms) {}

    std::int64_t NowMillis() const override { return now_ms_.load(); }
    void Advance(std::int64_t delta_ms) { now_ms_.fetch_add(delta_ms); }
    void Set(std::int64_t now_ms) { now_ms_.store(now_ms); }

private:
    std::atomic<std::int64_t> now_ms_;
};

inline quota::core::QuotaGroup MakeGroup(const std::string& group_id,
                                         int limit,
                                         const std::string& school_id = "school-1",
                                         const std::string& kind = "class_login") {
    quota::core::QuotaGroup group;
    group.group_id = group_id;
    group.school_id = school_id;
    group.kind = kind;
    group.limit = limit;
    group.enabled = true;
    return group;
}

inline quota::core::DeviceSession MakeCandidate(const std::string& session_id,
                                                const std::string& group_id,
                                                const std::string& fingerprint) {
    quota::core::DeviceSession session;
    session.session_id = session_id;
    session.group_id = group_id;
    session.fingerprint_hash = fingerprint;
    session.ip_address = "10.0.0.1";
    session.user_agent = "test-agent";
    return session;
}

// 包装真实存储, 前 N 次 ClaimSlot/GetGroup 返回指定错误
class FlakySessionStore : public quota::core::DeviceSessionStore {
public:
    FlakySessionStore(std::shared_ptr<quota::core::DeviceSessionStore> inner, int failures,
                      quota::common::Status error = quota::common::Status::Unavailable("lock wait timeout"))
        : inner_(std::move(inner)), remaining_failures_(failures), error_(std::move(error)) {}

    int ClaimCalls() const { return claim_calls_.load(); }

    quota::common::StatusOr<quota::core::ClaimResult> ClaimSlot(const quota::core::DeviceSession& candidate,
                                                                int limit,
                                                                std::int64_t now_ms,
                                                                std::int64_t ttl_ms) override {
        claim_calls_.fetch_add(1);
        if (remaining_failures_.load() != 0) {
            remaining_failures_.fetch_sub(1);
            return error_;
        }
        return inner_->ClaimSlot(candidate, limit, now_ms, ttl_ms);
    }
    quota::common::StatusOr<quota::core::TouchResult> Touch(const std::string& session_id,
                                                            std::int64_t now_ms,
                                                            std::int64_t ttl_ms) override {
        return inner_->Touch(session_id, now_ms, ttl_ms);
    }
    quota::common::StatusOr<quota::core::DeviceSession> GetSession(const std::string& session_id) override {
        return inner_->GetSession(session_id);
    }
    quota::common::StatusOr<quota::core::DeviceSession> Deactivate(const std::string& session_id,
                                                                   quota::core::EndReason reason,
                                                                   std::int64_t now_ms) override {
        return inner_->Deactivate(session_id, reason, now_ms);
    }
    quota::common::StatusOr<int> DeactivateGroup(const std::string& group_id,
                                                 quota::core::EndReason reason,
                                                 std::int64_t now_ms) override {
        return inner_->DeactivateGroup(group_id, reason, now_ms);
    }
    quota::common::StatusOr<std::vector<quota::core::DeviceSession>> ListActive(const std::string& group_id,
                                                                                std::int64_t now_ms) override {
        return inner_->ListActive(group_id, now_ms);
    }
    quota::common::StatusOr<int> CountActive(const std::string& group_id, std::int64_t now_ms) override {
        return inner_->CountActive(group_id, now_ms);
    }
    quota::common::StatusOr<int> ExpireStale(std::int64_t now_ms) override {
        return inner_->ExpireStale(now_ms);
    }
    quota::common::StatusOr<int> PurgeInactive(std::int64_t ended_before_ms) override {
        return inner_->PurgeInactive(ended_before_ms);
    }

private:
    std::shared_ptr<quota::core::DeviceSessionStore> inner_;
    std::atomic<int> remaining_failures_; // -1 表示一直失败
    quota::common::Status error_;
    std::atomic<int> claim_calls_{0};
};

// 分组读取在前 failures 次返回错误
class FlakyGroupRepository : public quota::core::GroupRepository {
public:
    FlakyGroupRepository(std::shared_ptr<quota::core::GroupRepository> inner, int failures,
                         quota::common::Status error = quota::common::Status::Unavailable("connection reset"))
        : inner_(std::move(inner)), remaining_failures_(failures), error_(std::move(error)) {}

    int GetCalls() const { return get_calls_.load(); }

    quota::common::StatusOr<quota::core::QuotaGroup> GetGroup(const std::string& group_id) override {
        get_calls_.fetch_add(1);
        if (remaining_failures_.load() != 0) {
            remaining_failures_.fetch_sub(1);
            return error_;
        }
        return inner_->GetGroup(group_id);
    }
    quota::common::Status UpsertGroup(const quota::core::QuotaGroup& group) override {
        return inner_->UpsertGroup(group);
    }
    quota::common::StatusOr<bool> CreateIfAbsent(const quota::core::QuotaGroup& group) override {
        return inner_->CreateIfAbsent(group);
    }
    quota::common::StatusOr<quota::core::QuotaGroup> UpdateLimit(const std::string& group_id,
                                                                 int new_limit,
                                                                 std::int64_t now_ms) override {
        return inner_->UpdateLimit(group_id, new_limit, now_ms);
    }

private:
    std::shared_ptr<quota::core::GroupRepository> inner_;
    std::atomic<int> remaining_failures_;
    std::atomic<int> get_calls_{0};
    quota::common::Status error_;
};

// 集成测试开关
inline bool EnvEnabled(const char* name) {
    const char* value = std::getenv(name);
    return value != nullptr && std::string(value) != "0" && std::string(value) != "";
}

inline std::shared_ptr<quota::storage::ConnectionPool> CreatePoolFromConfig() {
    const auto cfg = quota::common::ConfigLoader::LoadFromEnvOrDefault();
    return std::make_shared<quota::storage::ConnectionPool>(
        quota::storage::Options::FromConfig(cfg.storage.mysql));
}

inline void ExecuteSql(quota::storage::ConnectionPool& pool, const std::string& sql) {
    auto lease_or = pool.Acquire();
    ASSERT_TRUE(lease_or.IsOk()) << lease_or.GetStatus().Message();
    auto lease = std::move(lease_or.Value());
    MYSQL* conn = lease.Raw();
    ASSERT_EQ(0, mysql_real_query(conn, sql.c_str(), sql.size())) << mysql_error(conn);
}

// 清理测试数据, 确保每次用例运行前数据库干净
inline void ClearMysqlTestData(quota::storage::ConnectionPool& pool) {
    ExecuteSql(pool, "DELETE FROM device_sessions WHERE group_id LIKE 'test-%'");
    ExecuteSql(pool, "DELETE FROM quota_groups WHERE group_id LIKE 'test-%'");
}

} // namespace testutils
