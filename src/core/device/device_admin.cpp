#include "core/device/device_admin.hpp"

#include "common/logger.hpp"
#include "core/device/device_identity.hpp"

namespace quota {
namespace core {

using quota::common::StatusCode;
using quota::common::StatusOr;

DeviceAdmin::DeviceAdmin(std::shared_ptr<QuotaLedger> ledger) : ledger_(std::move(ledger)) {}

StatusOr<bool> DeviceAdmin::Logout(const Caller& caller, const std::string& session_id) {
    if (session_id.empty()) {
        return StatusOr<bool>(false);
    }
    auto session_or = ledger_->GetSession(session_id);
    if (!session_or.IsOk()) {
        if (session_or.GetStatus().Code() == StatusCode::kNotFound) {
            return StatusOr<bool>(false);
        }
        return session_or.GetStatus();
    }
    const auto& session = session_or.Value();
    if (!session.is_active) {
        return StatusOr<bool>(false);
    }

    auto group_or = ledger_->GetGroup(session.group_id);
    if (!group_or.IsOk()) {
        return group_or.GetStatus();
    }
    const bool admin = IsGroupAdmin(caller, group_or.Value());
    if (!admin && !OwnsSession(caller, session)) {
        QUOTA_LOG_WARN("[DeviceAdmin] user={} denied logout of session {}... in group={}",
                       caller.user_id, session_id.substr(0, 8), session.group_id);
        return Status::PermissionDenied("Caller cannot end this session.");
    }

    // 成员登出自己的设备记为 logout, 管理员操作记为 evicted
    const EndReason reason = admin ? EndReason::kEvicted : EndReason::kLogout;
    auto ended = ledger_->EndSession(session_id, reason);
    if (!ended.IsOk()) {
        // 并发下会话可能刚被其他请求结束
        if (ended.GetStatus().Code() == StatusCode::kNotFound) {
            return StatusOr<bool>(false);
        }
        return ended.GetStatus();
    }
    QUOTA_LOG_INFO("[DeviceAdmin] user={} ended session {}... in group={} ({})",
                   caller.user_id, session_id.substr(0, 8), session.group_id, EndReasonToString(reason));
    return StatusOr<bool>(true);
}

StatusOr<int> DeviceAdmin::ResetGroup(const Caller& caller, const std::string& group_id) {
    auto group_or = ledger_->GetGroup(group_id);
    if (!group_or.IsOk()) {
        return group_or.GetStatus();
    }
    auto allowed = AuthorizeGroupAdmin(caller, group_or.Value());
    if (!allowed.IsOk()) {
        QUOTA_LOG_WARN("[DeviceAdmin] user={} denied reset of group={}", caller.user_id, group_id);
        return allowed;
    }
    auto cleared = ledger_->ResetGroup(group_id);
    if (cleared.IsOk()) {
        QUOTA_LOG_INFO("[DeviceAdmin] user={} reset group={} cleared={}", caller.user_id, group_id, cleared.Value());
    }
    return cleared;
}

StatusOr<std::vector<DeviceView>> DeviceAdmin::ListActive(const Caller& caller,
                                                          const std::string& group_id,
                                                          const std::string& current_session_id) {
    auto group_or = ledger_->GetGroup(group_id);
    if (!group_or.IsOk()) {
        return group_or.GetStatus();
    }
    auto allowed = AuthorizeGroupViewer(caller, group_or.Value());
    if (!allowed.IsOk()) {
        return allowed;
    }
    auto sessions_or = ledger_->ListActive(group_id);
    if (!sessions_or.IsOk()) {
        return sessions_or.GetStatus();
    }

    std::vector<DeviceView> views;
    views.reserve(sessions_or.Value().size());
    for (const auto& session : sessions_or.Value()) {
        DeviceView view;
        view.session_id = session.session_id;
        view.fingerprint_prefix = FingerprintPrefix(session.fingerprint_hash);
        view.device_type = session.device_type;
        view.browser = session.browser;
        view.os = session.os;
        view.ip_address = session.ip_address;
        view.last_active_at_ms = session.last_active_at_ms;
        view.expires_at_ms = session.expires_at_ms;
        view.is_current = !current_session_id.empty() && session.session_id == current_session_id;
        views.push_back(std::move(view));
    }
    return StatusOr<std::vector<DeviceView>>(std::move(views));
}

StatusOr<QuotaGroup> DeviceAdmin::UpdateLimit(const Caller& caller, const std::string& group_id, int new_limit) {
    auto group_or = ledger_->GetGroup(group_id);
    if (!group_or.IsOk()) {
        return group_or.GetStatus();
    }
    auto allowed = AuthorizeGroupAdmin(caller, group_or.Value());
    if (!allowed.IsOk()) {
        QUOTA_LOG_WARN("[DeviceAdmin] user={} denied limit change of group={}", caller.user_id, group_id);
        return allowed;
    }
    auto updated = ledger_->UpdateLimit(group_id, new_limit);
    if (updated.IsOk()) {
        QUOTA_LOG_INFO("[DeviceAdmin] user={} changed limit of group={} from {} to {}",
                       caller.user_id, group_id, group_or.Value().limit, new_limit);
    }
    return updated;
}

StatusOr<GroupUsage> DeviceAdmin::GetUsage(const Caller& caller, const std::string& group_id) {
    auto group_or = ledger_->GetGroup(group_id);
    if (!group_or.IsOk()) {
        return group_or.GetStatus();
    }
    auto allowed = AuthorizeGroupViewer(caller, group_or.Value());
    if (!allowed.IsOk()) {
        return allowed;
    }
    return ledger_->GetUsage(group_id);
}

} // namespace core
} // namespace quota
