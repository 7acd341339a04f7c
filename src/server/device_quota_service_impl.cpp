#include "server/device_quota_service_impl.hpp"

#include "common/logger.hpp"
#include "core/device/device_identity.hpp"
#include "core/device/errors.hpp"

#include <string_view>

namespace quota {
namespace server {

namespace {

// 移除IPv6地址的方括号
std::string StripBrackets(std::string_view ip) {
    if (ip.size() >= 2 && ip.front() == '[' && ip.back() == ']') {
        return std::string(ip.substr(1, ip.size() - 2));
    }
    return std::string(ip);
}

std::string_view Trim(std::string_view value) {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
        value.remove_suffix(1);
    }
    return value;
}

proto::quota::AdmitDecision ToProtoDecision(quota::core::AdmitDecision decision) {
    switch (decision) {
        case quota::core::AdmitDecision::kAdmitted:
            return proto::quota::ADMITTED;
        case quota::core::AdmitDecision::kRenewed:
            return proto::quota::RENEWED;
        case quota::core::AdmitDecision::kRejected:
            return proto::quota::REJECTED;
    }
    return proto::quota::ADMIT_DECISION_UNSPECIFIED;
}

proto::quota::HeartbeatStatus ToProtoHeartbeat(quota::core::HeartbeatStatus status) {
    switch (status) {
        case quota::core::HeartbeatStatus::kRenewed:
            return proto::quota::HEARTBEAT_RENEWED;
        case quota::core::HeartbeatStatus::kNotFound:
            return proto::quota::HEARTBEAT_NOT_FOUND;
        case quota::core::HeartbeatStatus::kExpired:
            return proto::quota::HEARTBEAT_EXPIRED;
    }
    return proto::quota::HEARTBEAT_STATUS_UNSPECIFIED;
}

} // namespace

DeviceQuotaServiceImpl::DeviceQuotaServiceImpl(std::shared_ptr<quota::core::QuotaLedger> ledger,
                                               std::shared_ptr<quota::core::DeviceAdmin> admin)
    : ledger_(std::move(ledger)), admin_(std::move(admin)) {}

std::string DeviceQuotaServiceImpl::ExtractIpFromPeer(const std::string& peer) {
    if (peer.empty()) {
        return {};
    }
    std::string_view sv(peer);
    if (sv.rfind("ipv4:", 0) == 0 || sv.rfind("ipv6:", 0) == 0) {
        sv.remove_prefix(5);
    }
    if (!sv.empty() && sv.front() == '[') {
        auto close = sv.find(']');
        if (close != std::string_view::npos) {
            return StripBrackets(sv.substr(0, close + 1));
        }
    }
    auto pos_port = sv.rfind(':');
    // 不带方括号的 IPv6 无法区分端口, 原样返回
    if (pos_port == std::string_view::npos || sv.find(':') != pos_port) {
        return std::string(sv);
    }
    return std::string(sv.substr(0, pos_port));
}

std::string DeviceQuotaServiceImpl::ResolveSourceAddress(const std::string& forwarded_for, const std::string& peer) {
    std::string_view forwarded(forwarded_for);
    auto comma = forwarded.find(',');
    if (comma != std::string_view::npos) {
        forwarded = forwarded.substr(0, comma);
    }
    forwarded = Trim(forwarded);
    if (!forwarded.empty()) {
        return StripBrackets(forwarded);
    }
    return ExtractIpFromPeer(peer);
}

quota::core::Caller DeviceQuotaServiceImpl::ToCaller(const proto::common::CallerIdentity& identity) {
    quota::core::Caller caller;
    caller.user_id = identity.user_id();
    caller.role = identity.role();
    caller.school_id = identity.school_id();
    caller.group_id = identity.group_id();
    caller.session_id = identity.session_id();
    return caller;
}

grpc::Status DeviceQuotaServiceImpl::Admit(grpc::ServerContext* context
                                           , const proto::quota::AdmitRequest* request
                                           , proto::quota::AdmitResponse* response) {
    quota::core::AdmitCommand command;
    command.group_id = request->group_id();
    command.signals.client_fingerprint = request->client_fingerprint();
    command.signals.user_agent = request->device_info().user_agent();
    command.signals.platform = request->device_info().platform();
    command.signals.source_address = ResolveSourceAddress(request->device_info().forwarded_for(),
                                                          context ? context->peer() : std::string());

    auto result_or = ledger_->Admit(command);
    if (!result_or.IsOk()) {
        quota::core::ErrorToProto(result_or.GetStatus(), response->mutable_error());
        return ToGrpcStatus(result_or.GetStatus());
    }
    const auto& result = result_or.Value();
    response->set_decision(ToProtoDecision(result.decision));
    response->set_limit(result.limit);
    response->set_current_count(result.current_count);
    response->set_degraded(result.degraded);
    if (result.decision != quota::core::AdmitDecision::kRejected && !result.degraded) {
        response->set_session_id(result.session.session_id);
        response->set_expires_at(result.session.expires_at_ms);
    }
    quota::core::ErrorToProto(quota::common::Status::OK(), response->mutable_error());
    return grpc::Status::OK;
}

grpc::Status DeviceQuotaServiceImpl::Heartbeat(grpc::ServerContext* context
                                               , const proto::quota::HeartbeatRequest* request
                                               , proto::quota::HeartbeatResponse* response) {
    (void)context;
    auto result_or = ledger_->Heartbeat(request->session_id());
    if (!result_or.IsOk()) {
        quota::core::ErrorToProto(result_or.GetStatus(), response->mutable_error());
        return ToGrpcStatus(result_or.GetStatus());
    }
    response->set_status(ToProtoHeartbeat(result_or.Value().status));
    response->set_expires_at(result_or.Value().expires_at_ms);
    quota::core::ErrorToProto(quota::common::Status::OK(), response->mutable_error());
    return grpc::Status::OK;
}

grpc::Status DeviceQuotaServiceImpl::Logout(grpc::ServerContext* context
                                            , const proto::quota::LogoutRequest* request
                                            , proto::quota::LogoutResponse* response) {
    (void)context;
    auto caller = ToCaller(request->caller());
    QUOTA_LOG_INFO("[DeviceQuotaService] Logout user={} session={}...",
                   caller.user_id, request->session_id().substr(0, 8));
    auto ended_or = admin_->Logout(caller, request->session_id());
    if (!ended_or.IsOk()) {
        quota::core::ErrorToProto(ended_or.GetStatus(), response->mutable_error());
        return ToGrpcStatus(ended_or.GetStatus());
    }
    response->set_success(ended_or.Value());
    quota::core::ErrorToProto(quota::common::Status::OK(), response->mutable_error());
    return grpc::Status::OK;
}

grpc::Status DeviceQuotaServiceImpl::ListDevices(grpc::ServerContext* context
                                                 , const proto::quota::ListDevicesRequest* request
                                                 , proto::quota::ListDevicesResponse* response) {
    (void)context;
    auto devices_or = admin_->ListActive(ToCaller(request->caller()), request->group_id(),
                                         request->current_session_id());
    if (!devices_or.IsOk()) {
        quota::core::ErrorToProto(devices_or.GetStatus(), response->mutable_error());
        return ToGrpcStatus(devices_or.GetStatus());
    }
    for (const auto& view : devices_or.Value()) {
        auto* entry = response->add_devices();
        entry->set_session_id(view.session_id);
        entry->set_fingerprint_prefix(view.fingerprint_prefix);
        entry->set_device_type(view.device_type);
        entry->set_browser(view.browser);
        entry->set_os(view.os);
        entry->set_ip_address(view.ip_address);
        entry->set_last_active_at(view.last_active_at_ms);
        entry->set_expires_at(view.expires_at_ms);
        entry->set_is_current(view.is_current);
    }
    quota::core::ErrorToProto(quota::common::Status::OK(), response->mutable_error());
    return grpc::Status::OK;
}

grpc::Status DeviceQuotaServiceImpl::ResetGroup(grpc::ServerContext* context
                                                , const proto::quota::ResetGroupRequest* request
                                                , proto::quota::ResetGroupResponse* response) {
    (void)context;
    auto caller = ToCaller(request->caller());
    QUOTA_LOG_INFO("[DeviceQuotaService] ResetGroup user={} group={}", caller.user_id, request->group_id());
    auto cleared_or = admin_->ResetGroup(caller, request->group_id());
    if (!cleared_or.IsOk()) {
        quota::core::ErrorToProto(cleared_or.GetStatus(), response->mutable_error());
        return ToGrpcStatus(cleared_or.GetStatus());
    }
    response->set_cleared_count(cleared_or.Value());
    quota::core::ErrorToProto(quota::common::Status::OK(), response->mutable_error());
    return grpc::Status::OK;
}

grpc::Status DeviceQuotaServiceImpl::UpdateLimit(grpc::ServerContext* context
                                                 , const proto::quota::UpdateLimitRequest* request
                                                 , proto::quota::UpdateLimitResponse* response) {
    (void)context;
    auto caller = ToCaller(request->caller());
    QUOTA_LOG_INFO("[DeviceQuotaService] UpdateLimit user={} group={} limit={}",
                   caller.user_id, request->group_id(), request->new_limit());
    auto group_or = admin_->UpdateLimit(caller, request->group_id(), request->new_limit());
    if (!group_or.IsOk()) {
        quota::core::ErrorToProto(group_or.GetStatus(), response->mutable_error());
        return ToGrpcStatus(group_or.GetStatus());
    }
    response->set_group_id(group_or.Value().group_id);
    response->set_limit(group_or.Value().limit);
    quota::core::ErrorToProto(quota::common::Status::OK(), response->mutable_error());
    return grpc::Status::OK;
}

grpc::Status DeviceQuotaServiceImpl::GetUsage(grpc::ServerContext* context
                                              , const proto::quota::GetUsageRequest* request
                                              , proto::quota::GetUsageResponse* response) {
    (void)context;
    auto usage_or = admin_->GetUsage(ToCaller(request->caller()), request->group_id());
    if (!usage_or.IsOk()) {
        quota::core::ErrorToProto(usage_or.GetStatus(), response->mutable_error());
        return ToGrpcStatus(usage_or.GetStatus());
    }
    response->set_active_count(usage_or.Value().active_count);
    response->set_limit(usage_or.Value().limit);
    response->set_available_slots(usage_or.Value().available_slots);
    quota::core::ErrorToProto(quota::common::Status::OK(), response->mutable_error());
    return grpc::Status::OK;
}

// 转换为 gRPC 状态码
grpc::Status DeviceQuotaServiceImpl::ToGrpcStatus(const quota::common::Status& status) {
    using quota::common::StatusCode;
    switch (status.Code()) {
        case StatusCode::kOk:
            return grpc::Status::OK;
        case StatusCode::kInvalidArgument:
            return {grpc::StatusCode::INVALID_ARGUMENT, status.Message()};
        case StatusCode::kDeadlineExceeded:
            return {grpc::StatusCode::DEADLINE_EXCEEDED, status.Message()};
        case StatusCode::kNotFound:
            return {grpc::StatusCode::NOT_FOUND, status.Message()};
        case StatusCode::kAlreadyExists:
            return {grpc::StatusCode::ALREADY_EXISTS, status.Message()};
        case StatusCode::kPermissionDenied:
            return {grpc::StatusCode::PERMISSION_DENIED, status.Message()};
        case StatusCode::kResourceExhausted:
            return {grpc::StatusCode::RESOURCE_EXHAUSTED, status.Message()};
        case StatusCode::kFailedPrecondition:
            return {grpc::StatusCode::FAILED_PRECONDITION, status.Message()};
        case StatusCode::kUnauthenticated:
            return {grpc::StatusCode::UNAUTHENTICATED, status.Message()};
        case StatusCode::kUnavailable:
            return {grpc::StatusCode::UNAVAILABLE, status.Message()};
        case StatusCode::kInternal:
            return {grpc::StatusCode::INTERNAL, status.Message()};
    }
    return {grpc::StatusCode::UNKNOWN, status.Message()};
}

} // namespace server
} // namespace quota
