#pragma once

#include "common/clock.hpp"
#include "common/config.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/device/device_identity.hpp"
#include "core/device/device_session.hpp"
#include "core/device/group_repository.hpp"
#include "core/device/session_store.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace quota {
namespace core {

struct LedgerConfig {
    std::chrono::milliseconds session_timeout{std::chrono::hours(24)};
    std::chrono::milliseconds operation_timeout{2000}; // 单次操作总时限 (含重试)
    int                       max_attempts = 3;
    std::chrono::milliseconds backoff_initial{20};
    std::chrono::milliseconds backoff_max{200};
    bool                      fail_open = false;

    static LedgerConfig FromQuotaConfig(const quota::common::QuotaConfig& config);
};

enum class AdmitDecision {
    kAdmitted,
    kRenewed,
    kRejected,
};

struct AdmitCommand {
    std::string   group_id;
    DeviceSignals signals;
};

struct AdmitResult {
    AdmitDecision decision = AdmitDecision::kRejected;
    DeviceSession session;       // kAdmitted/kRenewed 时有效
    int           current_count = 0;
    int           limit = 0;
    bool          degraded = false; // fail_open 放行, 没有会话
};

enum class HeartbeatStatus {
    kRenewed,
    kNotFound,
    kExpired,
};

struct HeartbeatResult {
    HeartbeatStatus status = HeartbeatStatus::kNotFound;
    std::int64_t    expires_at_ms = 0;
};

struct GroupUsage {
    std::string group_id;
    int         active_count = 0;
    int         limit = 0;
    int         available_slots = 0;
};

// 配额账本: 准入/续期/拒绝的唯一决策点
// 管理操作同样经由这里修改存储, 不存在旁路
class QuotaLedger {
public:
    using Status = quota::common::Status;

    QuotaLedger(std::shared_ptr<DeviceSessionStore> store,
                std::shared_ptr<GroupRepository> groups,
                LedgerConfig config = LedgerConfig{},
                std::shared_ptr<const DeviceIdentityResolver> resolver = nullptr,
                std::shared_ptr<const quota::common::Clock> clock = nullptr);

    // 准入. 名额不足是正常结果 (kRejected), 只有基础设施故障才返回错误状态
    quota::common::StatusOr<AdmitResult> Admit(const AdmitCommand& command);
    quota::common::StatusOr<HeartbeatResult> Heartbeat(const std::string& session_id);

    // 结束会话并立即释放名额; 会话不存在或已失效时返回 NotFound
    quota::common::StatusOr<DeviceSession> EndSession(const std::string& session_id, EndReason reason);
    quota::common::StatusOr<int> ResetGroup(const std::string& group_id);
    quota::common::StatusOr<QuotaGroup> UpdateLimit(const std::string& group_id, int new_limit);

    // 只读视图, 不得用于准入判断
    quota::common::StatusOr<std::vector<DeviceSession>> ListActive(const std::string& group_id);
    quota::common::StatusOr<GroupUsage> GetUsage(const std::string& group_id);
    quota::common::StatusOr<DeviceSession> GetSession(const std::string& session_id);
    quota::common::StatusOr<QuotaGroup> GetGroup(const std::string& group_id);

    const LedgerConfig& Config() const { return config_; }

private:
    quota::common::StatusOr<AdmitResult> FailOpenOrError(const AdmitCommand& command, const Status& status);

    std::shared_ptr<DeviceSessionStore> store_;
    std::shared_ptr<GroupRepository> groups_;
    LedgerConfig config_;
    std::shared_ptr<const DeviceIdentityResolver> resolver_;
    std::shared_ptr<const quota::common::Clock> clock_;
};

const char* AdmitDecisionToString(AdmitDecision decision);

} // namespace core
} // namespace quota
