#include "server/health_service.h"

#include "common/logger.hpp"

namespace quota::server {

HealthServiceImpl::HealthServiceImpl(std::shared_ptr<const quota::core::ExpirySweeper> sweeper,
                                     std::shared_ptr<const quota::common::Clock> clock)
    : sweeper_(std::move(sweeper)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = std::make_shared<quota::common::SystemClock>();
    }
}

grpc::Status HealthServiceImpl::Check(grpc::ServerContext* /*context*/,
                                      const proto::health::HealthCheckRequest* request,
                                      proto::health::HealthCheckResponse* response) {
    response->set_status("SERVING");
    response->set_timestamp(clock_->NowMillis() / 1000);
    response->set_last_sweep_at(sweeper_ ? sweeper_->LastSweepAtMs() : 0);
    QUOTA_LOG_DEBUG("[health] Check handled for '{}'", request->source());
    return grpc::Status::OK;
}

}
