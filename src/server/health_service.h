#pragma once

#include "common/clock.hpp"
#include "core/device/expiry_sweeper.hpp"

#include "health.grpc.pb.h"
#include "health.pb.h"

#include <grpcpp/grpcpp.h>
#include <memory>

namespace quota::server {
class HealthServiceImpl final : public proto::health::HealthService::Service {
public:
    explicit HealthServiceImpl(std::shared_ptr<const quota::core::ExpirySweeper> sweeper,
                               std::shared_ptr<const quota::common::Clock> clock = nullptr);

    grpc::Status Check(grpc::ServerContext* context,
                    const proto::health::HealthCheckRequest* request,
                    proto::health::HealthCheckResponse* response) override;
private:
    std::shared_ptr<const quota::core::ExpirySweeper> sweeper_;
    std::shared_ptr<const quota::common::Clock> clock_;
};

}
