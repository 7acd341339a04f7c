#pragma once

#include "common/clock.hpp"
#include "common/status_or.hpp"
#include "core/device/session_store.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace quota {
namespace core {

struct SweeperConfig {
    std::chrono::milliseconds interval{std::chrono::seconds(60)};
    std::chrono::milliseconds purge_after{std::chrono::hours(24 * 7)};
};

struct SweepReport {
    int          expired = 0;
    int          purged = 0;
    std::int64_t finished_at_ms = 0;
};

// 后台过期清扫: 与请求流量无关地按固定间隔运行
// 只把逐条复核为已过期的会话从活跃改为失效, 可与准入/心跳并发, 可重复执行
class ExpirySweeper {
public:
    ExpirySweeper(std::shared_ptr<DeviceSessionStore> store,
                  SweeperConfig config,
                  std::shared_ptr<const quota::common::Clock> clock = nullptr);
    ~ExpirySweeper();

    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    void Start();
    void Stop();
    bool Running() const noexcept { return running_.load(std::memory_order_acquire); }

    // 执行一轮清扫, 测试和后台线程共用
    quota::common::StatusOr<SweepReport> RunOnce();

    // 最近一次成功清扫的完成时间, 从未运行时为 0
    std::int64_t LastSweepAtMs() const noexcept { return last_sweep_at_ms_.load(std::memory_order_acquire); }

private:
    void Loop();

    std::shared_ptr<DeviceSessionStore> store_;
    SweeperConfig config_;
    std::shared_ptr<const quota::common::Clock> clock_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::atomic<bool> running_{false};
    std::atomic<std::int64_t> last_sweep_at_ms_{0};
    std::thread worker_;
};

} // namespace core
} // namespace quota
