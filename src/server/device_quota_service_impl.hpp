#pragma once

#include "common/status.hpp"
#include "core/device/access_policy.hpp"
#include "core/device/device_admin.hpp"
#include "core/device/quota_ledger.hpp"

#include "device_quota_service.grpc.pb.h"

#include <grpcpp/grpcpp.h>
#include <memory>
#include <string>

namespace quota {
namespace server {

class DeviceQuotaServiceImpl final : public proto::quota::DeviceQuotaService::Service {
public:
    DeviceQuotaServiceImpl(std::shared_ptr<quota::core::QuotaLedger> ledger,
                           std::shared_ptr<quota::core::DeviceAdmin> admin);

    grpc::Status Admit(grpc::ServerContext* context
                       , const proto::quota::AdmitRequest* request
                       , proto::quota::AdmitResponse* response) override;

    grpc::Status Heartbeat(grpc::ServerContext* context
                           , const proto::quota::HeartbeatRequest* request
                           , proto::quota::HeartbeatResponse* response) override;

    grpc::Status Logout(grpc::ServerContext* context
                        , const proto::quota::LogoutRequest* request
                        , proto::quota::LogoutResponse* response) override;

    grpc::Status ListDevices(grpc::ServerContext* context
                             , const proto::quota::ListDevicesRequest* request
                             , proto::quota::ListDevicesResponse* response) override;

    grpc::Status ResetGroup(grpc::ServerContext* context
                            , const proto::quota::ResetGroupRequest* request
                            , proto::quota::ResetGroupResponse* response) override;

    grpc::Status UpdateLimit(grpc::ServerContext* context
                             , const proto::quota::UpdateLimitRequest* request
                             , proto::quota::UpdateLimitResponse* response) override;

    grpc::Status GetUsage(grpc::ServerContext* context
                          , const proto::quota::GetUsageRequest* request
                          , proto::quota::GetUsageResponse* response) override;

    // 从 gRPC peer 字符串中提取 IP, 例如 "ipv4:127.0.0.1:54321", "ipv6:[::1]:54321"
    static std::string ExtractIpFromPeer(const std::string& peer);
    // forwarded_for 优先, 取第一个地址; 否则使用 peer
    static std::string ResolveSourceAddress(const std::string& forwarded_for, const std::string& peer);

private:
    static grpc::Status ToGrpcStatus(const quota::common::Status& status);
    static quota::core::Caller ToCaller(const proto::common::CallerIdentity& identity);

    std::shared_ptr<quota::core::QuotaLedger> ledger_;
    std::shared_ptr<quota::core::DeviceAdmin> admin_;
};

} // namespace server
} // namespace quota
