#include "core/device/quota_ledger.hpp"

#include "common/logger.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>

namespace quota {
namespace core {

using quota::common::Status;
using quota::common::StatusCode;
using quota::common::StatusOr;

namespace {

const Status& StatusOf(const Status& status) {
    return status;
}

template <typename T>
const Status& StatusOf(const StatusOr<T>& result) {
    return result.GetStatus();
}

// 基础设施类错误; fail_open 只对这类错误生效
bool IsInfrastructureError(const Status& status) {
    switch (status.Code()) {
        case StatusCode::kUnavailable:
        case StatusCode::kDeadlineExceeded:
        case StatusCode::kResourceExhausted:
        case StatusCode::kInternal:
            return true;
        default:
            return false;
    }
}

using Deadline = std::chrono::steady_clock::time_point;

// 一次账本操作的截止时间, 操作内的所有存储调用共用
Deadline OperationDeadline(const LedgerConfig& config) {
    return std::chrono::steady_clock::now() + config.operation_timeout;
}

// 对瞬时错误做有限次数的指数退避重试, 不越过调用方给定的截止时间
template <typename Fn>
auto RetryTransient(const LedgerConfig& config, Deadline deadline, const char* op, Fn&& fn) -> decltype(fn()) {
    auto backoff = config.backoff_initial;
    for (int attempt = 1;; ++attempt) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return Status::DeadlineExceeded(std::string(op) + " timed out");
        }
        auto result = fn();
        const Status& status = StatusOf(result);
        if (status.IsOk() || !status.IsTransient() || attempt >= config.max_attempts) {
            return result;
        }
        if (std::chrono::steady_clock::now() + backoff >= deadline) {
            return Status::DeadlineExceeded(std::string(op) + " timed out: " + status.Message());
        }
        QUOTA_LOG_WARN("[Ledger] {} attempt {} failed: {}; retry in {}ms",
                       op, attempt, status.Message(), backoff.count());
        std::this_thread::sleep_for(backoff);
        backoff = std::min(backoff * 2, config.backoff_max);
    }
}

StatusOr<QuotaGroup> LoadGroup(const LedgerConfig& config, Deadline deadline,
                               GroupRepository& groups, const std::string& group_id) {
    if (group_id.empty()) {
        return Status::InvalidArgument("Group id cannot be empty.");
    }
    return RetryTransient(config, deadline, "load group", [&]() {
        return groups.GetGroup(group_id);
    });
}

} // namespace

LedgerConfig LedgerConfig::FromQuotaConfig(const quota::common::QuotaConfig& config) {
    LedgerConfig out;
    out.session_timeout = std::chrono::seconds(config.session_timeout_seconds);
    out.operation_timeout = std::chrono::milliseconds(config.admit_timeout_ms);
    out.max_attempts = config.max_attempts;
    out.backoff_initial = std::chrono::milliseconds(config.backoff_initial_ms);
    out.backoff_max = std::chrono::milliseconds(config.backoff_max_ms);
    out.fail_open = config.fail_open;
    return out;
}

QuotaLedger::QuotaLedger(std::shared_ptr<DeviceSessionStore> store,
                         std::shared_ptr<GroupRepository> groups,
                         LedgerConfig config,
                         std::shared_ptr<const DeviceIdentityResolver> resolver,
                         std::shared_ptr<const quota::common::Clock> clock)
    : store_(std::move(store))
    , groups_(std::move(groups))
    , config_(config)
    , resolver_(std::move(resolver))
    , clock_(std::move(clock)) {
    if (!resolver_) {
        resolver_ = std::make_shared<HashingIdentityResolver>();
    }
    if (!clock_) {
        clock_ = std::make_shared<quota::common::SystemClock>();
    }
}

StatusOr<AdmitResult> QuotaLedger::Admit(const AdmitCommand& command) {
    if (command.group_id.empty()) {
        return Status::InvalidArgument("Group id cannot be empty.");
    }

    // 读分组和抢占名额共用同一个截止时间
    const auto deadline = OperationDeadline(config_);
    auto group_or = LoadGroup(config_, deadline, *groups_, command.group_id);
    if (!group_or.IsOk()) {
        return FailOpenOrError(command, group_or.GetStatus());
    }
    const QuotaGroup& group = group_or.Value();
    if (!group.enabled) {
        return Status::FailedPrecondition("Quota group is disabled.");
    }

    auto session_id_or = GenerateSessionId();
    if (!session_id_or.IsOk()) {
        return FailOpenOrError(command, session_id_or.GetStatus());
    }

    // 构造候选会话, 时间戳由存储在临界区内填写
    DeviceSession candidate;
    candidate.session_id = std::move(session_id_or.Value());
    candidate.group_id = group.group_id;
    candidate.fingerprint_hash = resolver_->Resolve(command.signals);
    candidate.ip_address = command.signals.source_address;
    candidate.user_agent = command.signals.user_agent;
    candidate.platform = command.signals.platform;
    auto traits = ClassifyUserAgent(command.signals.user_agent);
    candidate.device_type = traits.device_type;
    candidate.browser = traits.browser;
    candidate.os = traits.os;

    const std::int64_t ttl_ms = config_.session_timeout.count();
    auto claim_or = RetryTransient(config_, deadline, "claim slot", [&]() -> StatusOr<ClaimResult> {
        auto result = store_->ClaimSlot(candidate, group.limit, clock_->NowMillis(), ttl_ms);
        if (result.GetStatus().Code() == StatusCode::kAlreadyExists) {
            // 唯一约束拦下了并发的同设备插入, 重试会走续期分支
            return Status::Unavailable("Concurrent admission for the same device");
        }
        return result;
    });
    if (!claim_or.IsOk()) {
        return FailOpenOrError(command, claim_or.GetStatus());
    }

    auto& claim = claim_or.Value();
    AdmitResult result;
    result.limit = group.limit;
    result.current_count = claim.active_count;
    switch (claim.outcome) {
        case ClaimOutcome::kInserted:
            result.decision = AdmitDecision::kAdmitted;
            break;
        case ClaimOutcome::kRenewed:
            result.decision = AdmitDecision::kRenewed;
            break;
        case ClaimOutcome::kLimitReached:
            result.decision = AdmitDecision::kRejected;
            break;
    }
    if (result.decision != AdmitDecision::kRejected) {
        result.session = std::move(claim.session);
    }
    if (claim.reclaimed > 0) {
        QUOTA_LOG_INFO("[Ledger] group={} reclaimed {} expired session(s) during admission",
                       group.group_id, claim.reclaimed);
    }
    QUOTA_LOG_INFO("[Ledger] admit group={} fp={} decision={} count={}/{}",
                   group.group_id, FingerprintPrefix(candidate.fingerprint_hash),
                   AdmitDecisionToString(result.decision), result.current_count, result.limit);
    return StatusOr<AdmitResult>(std::move(result));
}

StatusOr<AdmitResult> QuotaLedger::FailOpenOrError(const AdmitCommand& command, const Status& status) {
    if (!config_.fail_open || !IsInfrastructureError(status)) {
        QUOTA_LOG_ERROR("[Ledger] admit group={} failed: {}", command.group_id, status.Message());
        return status;
    }
    QUOTA_LOG_ERROR("[Ledger] admit group={} failed ({}); fail_open grants degraded access",
                    command.group_id, status.Message());
    AdmitResult result;
    result.decision = AdmitDecision::kAdmitted;
    result.degraded = true;
    return StatusOr<AdmitResult>(std::move(result));
}

StatusOr<HeartbeatResult> QuotaLedger::Heartbeat(const std::string& session_id) {
    HeartbeatResult result;
    if (session_id.empty()) {
        return StatusOr<HeartbeatResult>(result);
    }
    const std::int64_t ttl_ms = config_.session_timeout.count();
    auto touch_or = RetryTransient(config_, OperationDeadline(config_), "heartbeat", [&]() {
        return store_->Touch(session_id, clock_->NowMillis(), ttl_ms);
    });
    if (!touch_or.IsOk()) {
        QUOTA_LOG_ERROR("[Ledger] heartbeat failed: {}", touch_or.GetStatus().Message());
        return touch_or.GetStatus();
    }
    const auto& touch = touch_or.Value();
    switch (touch.outcome) {
        case TouchOutcome::kRenewed:
            result.status = HeartbeatStatus::kRenewed;
            result.expires_at_ms = touch.session.expires_at_ms;
            break;
        case TouchOutcome::kExpired:
            result.status = HeartbeatStatus::kExpired;
            QUOTA_LOG_INFO("[Ledger] heartbeat for expired session group={} session={}...",
                           touch.session.group_id, session_id.substr(0, 8));
            break;
        case TouchOutcome::kNotFound:
            result.status = HeartbeatStatus::kNotFound;
            break;
    }
    return StatusOr<HeartbeatResult>(result);
}

StatusOr<DeviceSession> QuotaLedger::EndSession(const std::string& session_id, EndReason reason) {
    if (session_id.empty()) {
        return Status::NotFound("Device session not found");
    }
    auto ended = RetryTransient(config_, OperationDeadline(config_), "end session", [&]() {
        return store_->Deactivate(session_id, reason, clock_->NowMillis());
    });
    if (ended.IsOk()) {
        QUOTA_LOG_INFO("[Ledger] session ended group={} session={}... reason={}",
                       ended.Value().group_id, session_id.substr(0, 8), EndReasonToString(reason));
    }
    return ended;
}

StatusOr<int> QuotaLedger::ResetGroup(const std::string& group_id) {
    const auto deadline = OperationDeadline(config_);
    auto group_or = LoadGroup(config_, deadline, *groups_, group_id);
    if (!group_or.IsOk()) {
        return group_or.GetStatus();
    }
    auto cleared = RetryTransient(config_, deadline, "reset group", [&]() {
        return store_->DeactivateGroup(group_id, EndReason::kGroupReset, clock_->NowMillis());
    });
    if (cleared.IsOk()) {
        QUOTA_LOG_INFO("[Ledger] group={} reset, cleared {} session(s)", group_id, cleared.Value());
    }
    return cleared;
}

StatusOr<QuotaGroup> QuotaLedger::UpdateLimit(const std::string& group_id, int new_limit) {
    if (new_limit <= 0) {
        return Status::InvalidArgument("Device limit must be positive.");
    }
    // 不回收超出新限额的会话, 它们随过期或登出自然退出
    auto updated = RetryTransient(config_, OperationDeadline(config_), "update limit", [&]() {
        return groups_->UpdateLimit(group_id, new_limit, clock_->NowMillis());
    });
    if (updated.IsOk()) {
        QUOTA_LOG_INFO("[Ledger] group={} limit set to {}", group_id, new_limit);
    }
    return updated;
}

StatusOr<std::vector<DeviceSession>> QuotaLedger::ListActive(const std::string& group_id) {
    return RetryTransient(config_, OperationDeadline(config_), "list active", [&]() {
        return store_->ListActive(group_id, clock_->NowMillis());
    });
}

StatusOr<GroupUsage> QuotaLedger::GetUsage(const std::string& group_id) {
    const auto deadline = OperationDeadline(config_);
    auto group_or = LoadGroup(config_, deadline, *groups_, group_id);
    if (!group_or.IsOk()) {
        return group_or.GetStatus();
    }
    auto count_or = RetryTransient(config_, deadline, "count active", [&]() {
        return store_->CountActive(group_id, clock_->NowMillis());
    });
    if (!count_or.IsOk()) {
        return count_or.GetStatus();
    }
    GroupUsage usage;
    usage.group_id = group_id;
    usage.active_count = count_or.Value();
    usage.limit = group_or.Value().limit;
    usage.available_slots = std::max(0, usage.limit - usage.active_count);
    return StatusOr<GroupUsage>(usage);
}

StatusOr<DeviceSession> QuotaLedger::GetSession(const std::string& session_id) {
    return RetryTransient(config_, OperationDeadline(config_), "get session", [&]() {
        return store_->GetSession(session_id);
    });
}

StatusOr<QuotaGroup> QuotaLedger::GetGroup(const std::string& group_id) {
    return LoadGroup(config_, OperationDeadline(config_), *groups_, group_id);
}

const char* AdmitDecisionToString(AdmitDecision decision) {
    switch (decision) {
        case AdmitDecision::kAdmitted:
            return "ADMITTED";
        case AdmitDecision::kRenewed:
            return "RENEWED";
        case AdmitDecision::kRejected:
            return "REJECTED";
    }
    return "UNKNOWN";
}

} // namespace core
} // namespace quota
