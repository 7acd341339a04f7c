#include "core/device/expiry_sweeper.hpp"

#include "common/logger.hpp"

namespace quota {
namespace core {

ExpirySweeper::ExpirySweeper(std::shared_ptr<DeviceSessionStore> store,
                             SweeperConfig config,
                             std::shared_ptr<const quota::common::Clock> clock)
    : store_(std::move(store)), config_(config), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = std::make_shared<quota::common::SystemClock>();
    }
}

ExpirySweeper::~ExpirySweeper() {
    Stop();
}

void ExpirySweeper::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.load(std::memory_order_acquire)) {
        return;
    }
    stop_requested_ = false;
    running_.store(true, std::memory_order_release);
    worker_ = std::thread([this] {
        Loop();
    });
    QUOTA_LOG_INFO("[Sweeper] started, interval={}ms purge_after={}ms",
                   config_.interval.count(), config_.purge_after.count());
}

void ExpirySweeper::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load(std::memory_order_acquire)) {
            return;
        }
        stop_requested_ = true;
    }
    cv_.notify_all();
    // 避免在清扫线程自身上 join
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
    running_.store(false, std::memory_order_release);
    QUOTA_LOG_INFO("[Sweeper] stopped");
}

quota::common::StatusOr<SweepReport> ExpirySweeper::RunOnce() {
    const std::int64_t now_ms = clock_->NowMillis();
    SweepReport report;

    auto expired_or = store_->ExpireStale(now_ms);
    if (!expired_or.IsOk()) {
        return expired_or.GetStatus();
    }
    report.expired = expired_or.Value();

    auto purged_or = store_->PurgeInactive(now_ms - config_.purge_after.count());
    if (!purged_or.IsOk()) {
        return purged_or.GetStatus();
    }
    report.purged = purged_or.Value();
    report.finished_at_ms = clock_->NowMillis();
    last_sweep_at_ms_.store(report.finished_at_ms, std::memory_order_release);

    if (report.expired > 0 || report.purged > 0) {
        QUOTA_LOG_INFO("[Sweeper] expired={} purged={}", report.expired, report.purged);
    }
    return quota::common::StatusOr<SweepReport>(report);
}

void ExpirySweeper::Loop() {
    std::unique_lock<std::mutex> lk(mutex_);
    while (!stop_requested_) {
        cv_.wait_for(lk, config_.interval, [this] {
            return stop_requested_;
        });
        if (stop_requested_) {
            break;
        }
        // 清扫期间不持有 mutex_, Stop() 可以随时请求退出
        lk.unlock();
        auto report = RunOnce();
        if (!report.IsOk()) {
            QUOTA_LOG_ERROR("[Sweeper] sweep failed: {}", report.GetStatus().Message());
        }
        lk.lock();
    }
}

} // namespace core
} // namespace quota
