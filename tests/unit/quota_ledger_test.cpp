#include "core/device/quota_ledger.hpp"

#include "test_quota_utils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <set>
#include <thread>
#include <vector>

using quota::common::StatusCode;
using quota::core::AdmitCommand;
using quota::core::AdmitDecision;
using quota::core::EndReason;
using quota::core::HeartbeatStatus;
using quota::core::InMemoryDeviceSessionStore;
using quota::core::InMemoryGroupRepository;
using quota::core::LedgerConfig;
using quota::core::QuotaLedger;

namespace {

constexpr std::int64_t kTtlMs = 60'000;

AdmitCommand Device(const std::string& group_id, const std::string& fingerprint) {
    AdmitCommand command;
    command.group_id = group_id;
    command.signals.client_fingerprint = fingerprint;
    command.signals.user_agent = "Mozilla/5.0 (Windows NT 10.0; Win64; x64) Chrome/120.0 Safari/537.36";
    command.signals.source_address = "10.0.0.1";
    return command;
}

LedgerConfig FastConfig() {
    LedgerConfig config;
    config.session_timeout = std::chrono::milliseconds(kTtlMs);
    config.operation_timeout = std::chrono::milliseconds(2000);
    config.max_attempts = 3;
    config.backoff_initial = std::chrono::milliseconds(1);
    config.backoff_max = std::chrono::milliseconds(4);
    return config;
}

} // namespace

class QuotaLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<testutils::ManualClock>();
        store_ = std::make_shared<InMemoryDeviceSessionStore>();
        groups_ = std::make_shared<InMemoryGroupRepository>();
        ASSERT_TRUE(groups_->UpsertGroup(testutils::MakeGroup("G", 2)).IsOk());
        ASSERT_TRUE(groups_->UpsertGroup(testutils::MakeGroup("single", 1)).IsOk());
        ledger_ = std::make_shared<QuotaLedger>(store_, groups_, FastConfig(), nullptr, clock_);
    }

    std::shared_ptr<testutils::ManualClock> clock_;
    std::shared_ptr<InMemoryDeviceSessionStore> store_;
    std::shared_ptr<InMemoryGroupRepository> groups_;
    std::shared_ptr<QuotaLedger> ledger_;
};

// F1, F2 准入, F3 被拒; F1 登出后 F3 准入
TEST_F(QuotaLedgerTest, ConcreteScenario) {
    auto f1 = ledger_->Admit(Device("G", "F1"));
    ASSERT_TRUE(f1.IsOk()) << f1.GetStatus().Message();
    EXPECT_EQ(f1.Value().decision, AdmitDecision::kAdmitted);
    EXPECT_EQ(f1.Value().current_count, 1);

    auto f2 = ledger_->Admit(Device("G", "F2"));
    ASSERT_TRUE(f2.IsOk());
    EXPECT_EQ(f2.Value().decision, AdmitDecision::kAdmitted);
    EXPECT_EQ(f2.Value().current_count, 2);

    auto f3 = ledger_->Admit(Device("G", "F3"));
    ASSERT_TRUE(f3.IsOk());
    EXPECT_EQ(f3.Value().decision, AdmitDecision::kRejected);
    EXPECT_EQ(f3.Value().current_count, 2);
    EXPECT_EQ(f3.Value().limit, 2);
    EXPECT_TRUE(f3.Value().session.session_id.empty());

    auto ended = ledger_->EndSession(f1.Value().session.session_id, EndReason::kLogout);
    ASSERT_TRUE(ended.IsOk()) << ended.GetStatus().Message();

    auto f3_again = ledger_->Admit(Device("G", "F3"));
    ASSERT_TRUE(f3_again.IsOk());
    EXPECT_EQ(f3_again.Value().decision, AdmitDecision::kAdmitted);
    EXPECT_EQ(f3_again.Value().current_count, 2);

    auto active = ledger_->ListActive("G");
    ASSERT_TRUE(active.IsOk());
    std::set<std::string> ids;
    for (const auto& session : active.Value()) {
        ids.insert(session.session_id);
    }
    EXPECT_EQ(ids, (std::set<std::string>{f2.Value().session.session_id, f3_again.Value().session.session_id}));
}

// 同一设备重复准入只续期
TEST_F(QuotaLedgerTest, SameDeviceRenewsWithoutExtraSlot) {
    auto first = ledger_->Admit(Device("single", "A"));
    ASSERT_TRUE(first.IsOk());
    ASSERT_EQ(first.Value().decision, AdmitDecision::kAdmitted);

    for (int i = 0; i < 3; ++i) {
        clock_->Advance(1000);
        auto again = ledger_->Admit(Device("single", "A"));
        ASSERT_TRUE(again.IsOk());
        EXPECT_EQ(again.Value().decision, AdmitDecision::kRenewed);
        EXPECT_EQ(again.Value().session.session_id, first.Value().session.session_id);
        EXPECT_EQ(again.Value().current_count, 1);
        EXPECT_EQ(again.Value().session.expires_at_ms, clock_->NowMillis() + kTtlMs);
    }
}

// 无客户端指纹时, 相同 地址+UA 视为同一设备
TEST_F(QuotaLedgerTest, HeaderFingerprintDeduplicates) {
    auto command = Device("single", "");
    auto first = ledger_->Admit(command);
    ASSERT_TRUE(first.IsOk());
    EXPECT_EQ(first.Value().decision, AdmitDecision::kAdmitted);
    EXPECT_EQ(first.Value().session.device_type, "desktop");
    EXPECT_EQ(first.Value().session.browser, "Chrome");

    auto second = ledger_->Admit(command);
    ASSERT_TRUE(second.IsOk());
    EXPECT_EQ(second.Value().decision, AdmitDecision::kRenewed);

    command.signals.source_address = "10.0.0.2";
    auto other = ledger_->Admit(command);
    ASSERT_TRUE(other.IsOk());
    EXPECT_EQ(other.Value().decision, AdmitDecision::kRejected);
}

TEST_F(QuotaLedgerTest, ExpiryReclaimsCapacity) {
    auto a = ledger_->Admit(Device("single", "A"));
    ASSERT_TRUE(a.IsOk());
    ASSERT_EQ(a.Value().decision, AdmitDecision::kAdmitted);

    auto blocked = ledger_->Admit(Device("single", "B"));
    ASSERT_TRUE(blocked.IsOk());
    EXPECT_EQ(blocked.Value().decision, AdmitDecision::kRejected);

    clock_->Advance(kTtlMs);
    auto b = ledger_->Admit(Device("single", "B"));
    ASSERT_TRUE(b.IsOk());
    EXPECT_EQ(b.Value().decision, AdmitDecision::kAdmitted);

    auto hb = ledger_->Heartbeat(a.Value().session.session_id);
    ASSERT_TRUE(hb.IsOk());
    EXPECT_EQ(hb.Value().status, HeartbeatStatus::kExpired);
}

// 心跳持续时不会过期, 停止心跳后过期
TEST_F(QuotaLedgerTest, HeartbeatExtendsLife) {
    auto a = ledger_->Admit(Device("single", "A"));
    ASSERT_TRUE(a.IsOk());
    const auto session_id = a.Value().session.session_id;

    for (int i = 0; i < 5; ++i) {
        clock_->Advance(kTtlMs - 1000);
        auto hb = ledger_->Heartbeat(session_id);
        ASSERT_TRUE(hb.IsOk());
        EXPECT_EQ(hb.Value().status, HeartbeatStatus::kRenewed);
        EXPECT_EQ(hb.Value().expires_at_ms, clock_->NowMillis() + kTtlMs);

        auto other = ledger_->Admit(Device("single", "B"));
        ASSERT_TRUE(other.IsOk());
        EXPECT_EQ(other.Value().decision, AdmitDecision::kRejected);
    }

    EXPECT_EQ(store_->ExpireStale(clock_->NowMillis()).Value(), 0);
    clock_->Advance(kTtlMs);
    EXPECT_EQ(store_->ExpireStale(clock_->NowMillis()).Value(), 1);

    auto hb = ledger_->Heartbeat(session_id);
    ASSERT_TRUE(hb.IsOk());
    EXPECT_EQ(hb.Value().status, HeartbeatStatus::kExpired);
}

TEST_F(QuotaLedgerTest, LogoutFreesCapacityImmediately) {
    auto a = ledger_->Admit(Device("single", "A"));
    ASSERT_TRUE(a.IsOk());
    const auto session_id = a.Value().session.session_id;

    ASSERT_TRUE(ledger_->EndSession(session_id, EndReason::kLogout).IsOk());
    auto b = ledger_->Admit(Device("single", "B"));
    ASSERT_TRUE(b.IsOk());
    EXPECT_EQ(b.Value().decision, AdmitDecision::kAdmitted);

    // 已登出的会话心跳返回 NOT_FOUND, 重复登出返回 NotFound
    auto hb = ledger_->Heartbeat(session_id);
    ASSERT_TRUE(hb.IsOk());
    EXPECT_EQ(hb.Value().status, HeartbeatStatus::kNotFound);
    EXPECT_EQ(ledger_->EndSession(session_id, EndReason::kLogout).GetStatus().Code(), StatusCode::kNotFound);
}

TEST_F(QuotaLedgerTest, HeartbeatUnknownSession) {
    auto hb = ledger_->Heartbeat("does-not-exist");
    ASSERT_TRUE(hb.IsOk());
    EXPECT_EQ(hb.Value().status, HeartbeatStatus::kNotFound);

    auto empty = ledger_->Heartbeat("");
    ASSERT_TRUE(empty.IsOk());
    EXPECT_EQ(empty.Value().status, HeartbeatStatus::kNotFound);
}

TEST_F(QuotaLedgerTest, AdmitValidatesGroup) {
    EXPECT_EQ(ledger_->Admit(Device("", "A")).GetStatus().Code(), StatusCode::kInvalidArgument);
    EXPECT_EQ(ledger_->Admit(Device("missing", "A")).GetStatus().Code(), StatusCode::kNotFound);

    auto disabled = testutils::MakeGroup("disabled", 3);
    disabled.enabled = false;
    ASSERT_TRUE(groups_->UpsertGroup(disabled).IsOk());
    EXPECT_EQ(ledger_->Admit(Device("disabled", "A")).GetStatus().Code(), StatusCode::kFailedPrecondition);
}

// 多线程并发准入, 活跃数永不超过限额
TEST_F(QuotaLedgerTest, ConcurrentAdmitsNeverExceedLimit) {
    constexpr int kLimit = 5;
    constexpr int kThreads = 32;
    ASSERT_TRUE(groups_->UpsertGroup(testutils::MakeGroup("busy", kLimit)).IsOk());

    std::atomic<int> admitted{0};
    std::atomic<int> rejected{0};
    std::atomic<int> errors{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i]() {
            for (int round = 0; round < 3; ++round) {
                auto result = ledger_->Admit(Device("busy", "device-" + std::to_string(i)));
                if (!result.IsOk()) {
                    errors.fetch_add(1);
                    continue;
                }
                if (result.Value().decision == AdmitDecision::kAdmitted) {
                    admitted.fetch_add(1);
                } else if (result.Value().decision == AdmitDecision::kRejected) {
                    rejected.fetch_add(1);
                }
                auto count = store_->CountActive("busy", clock_->NowMillis());
                if (count.IsOk()) {
                    EXPECT_LE(count.Value(), kLimit);
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(errors.load(), 0);
    EXPECT_EQ(admitted.load(), kLimit);
    EXPECT_EQ(store_->CountActive("busy", clock_->NowMillis()).Value(), kLimit);

    auto usage = ledger_->GetUsage("busy");
    ASSERT_TRUE(usage.IsOk());
    EXPECT_EQ(usage.Value().active_count, kLimit);
    EXPECT_EQ(usage.Value().available_slots, 0);
}

// 降低限额不回收已有会话
TEST_F(QuotaLedgerTest, UpdateLimitDoesNotEvict) {
    auto a = ledger_->Admit(Device("G", "A"));
    auto b = ledger_->Admit(Device("G", "B"));
    ASSERT_TRUE(a.IsOk());
    ASSERT_TRUE(b.IsOk());

    auto updated = ledger_->UpdateLimit("G", 1);
    ASSERT_TRUE(updated.IsOk()) << updated.GetStatus().Message();
    EXPECT_EQ(updated.Value().limit, 1);

    auto usage = ledger_->GetUsage("G");
    ASSERT_TRUE(usage.IsOk());
    EXPECT_EQ(usage.Value().active_count, 2);
    EXPECT_EQ(usage.Value().limit, 1);
    EXPECT_EQ(usage.Value().available_slots, 0);

    ASSERT_TRUE(ledger_->EndSession(a.Value().session.session_id, EndReason::kLogout).IsOk());
    auto c = ledger_->Admit(Device("G", "C"));
    ASSERT_TRUE(c.IsOk());
    EXPECT_EQ(c.Value().decision, AdmitDecision::kRejected);

    ASSERT_TRUE(ledger_->EndSession(b.Value().session.session_id, EndReason::kEvicted).IsOk());
    auto c_again = ledger_->Admit(Device("G", "C"));
    ASSERT_TRUE(c_again.IsOk());
    EXPECT_EQ(c_again.Value().decision, AdmitDecision::kAdmitted);

    EXPECT_EQ(ledger_->UpdateLimit("G", 0).GetStatus().Code(), StatusCode::kInvalidArgument);
    EXPECT_EQ(ledger_->UpdateLimit("missing", 3).GetStatus().Code(), StatusCode::kNotFound);
}

TEST_F(QuotaLedgerTest, ResetGroupClearsSessions) {
    ASSERT_TRUE(ledger_->Admit(Device("G", "A")).IsOk());
    ASSERT_TRUE(ledger_->Admit(Device("G", "B")).IsOk());

    auto cleared = ledger_->ResetGroup("G");
    ASSERT_TRUE(cleared.IsOk());
    EXPECT_EQ(cleared.Value(), 2);
    EXPECT_EQ(ledger_->GetUsage("G").Value().active_count, 0);
    EXPECT_EQ(ledger_->ResetGroup("missing").GetStatus().Code(), StatusCode::kNotFound);
}

class QuotaLedgerRetryTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<testutils::ManualClock>();
        groups_ = std::make_shared<InMemoryGroupRepository>();
        ASSERT_TRUE(groups_->UpsertGroup(testutils::MakeGroup("G", 1)).IsOk());
    }

    std::shared_ptr<QuotaLedger> MakeLedger(std::shared_ptr<testutils::FlakySessionStore> store,
                                            LedgerConfig config = FastConfig()) {
        return std::make_shared<QuotaLedger>(store, groups_, config, nullptr, clock_);
    }

    std::shared_ptr<testutils::ManualClock> clock_;
    std::shared_ptr<InMemoryGroupRepository> groups_;
};

// 瞬时错误在重试次数内恢复
TEST_F(QuotaLedgerRetryTest, TransientFailureIsRetried) {
    auto store = std::make_shared<testutils::FlakySessionStore>(std::make_shared<InMemoryDeviceSessionStore>(), 2);
    auto ledger = MakeLedger(store);

    auto result = ledger->Admit(Device("G", "A"));
    ASSERT_TRUE(result.IsOk()) << result.GetStatus().Message();
    EXPECT_EQ(result.Value().decision, AdmitDecision::kAdmitted);
    EXPECT_FALSE(result.Value().degraded);
    EXPECT_EQ(store->ClaimCalls(), 3);
}

// 重试耗尽时返回最后一次错误, 默认不放行
TEST_F(QuotaLedgerRetryTest, ExhaustedRetriesFailClosed) {
    auto store = std::make_shared<testutils::FlakySessionStore>(std::make_shared<InMemoryDeviceSessionStore>(), -1);
    auto ledger = MakeLedger(store);

    auto result = ledger->Admit(Device("G", "A"));
    ASSERT_FALSE(result.IsOk());
    EXPECT_EQ(result.GetStatus().Code(), StatusCode::kUnavailable);
    EXPECT_EQ(store->ClaimCalls(), 3);
}

// 超过总时限返回 DEADLINE_EXCEEDED
TEST_F(QuotaLedgerRetryTest, DeadlineStopsRetrying) {
    auto store = std::make_shared<testutils::FlakySessionStore>(std::make_shared<InMemoryDeviceSessionStore>(), -1);
    auto config = FastConfig();
    config.operation_timeout = std::chrono::milliseconds(5);
    config.backoff_initial = std::chrono::milliseconds(50);
    config.backoff_max = std::chrono::milliseconds(50);
    config.max_attempts = 10;
    auto ledger = MakeLedger(store, config);

    auto result = ledger->Admit(Device("G", "A"));
    ASSERT_FALSE(result.IsOk());
    EXPECT_EQ(result.GetStatus().Code(), StatusCode::kDeadlineExceeded);
    EXPECT_EQ(store->ClaimCalls(), 1);
}

// 读分组和抢占名额都在重试时, 整个准入仍受同一个时限约束
TEST_F(QuotaLedgerRetryTest, DeadlineCoversWholeAdmission) {
    auto store = std::make_shared<testutils::FlakySessionStore>(std::make_shared<InMemoryDeviceSessionStore>(), 3);
    auto groups = std::make_shared<testutils::FlakyGroupRepository>(groups_, 3);
    auto config = FastConfig();
    config.operation_timeout = std::chrono::milliseconds(100);
    config.backoff_initial = std::chrono::milliseconds(30);
    config.backoff_max = std::chrono::milliseconds(30);
    config.max_attempts = 10;
    auto ledger = std::make_shared<QuotaLedger>(store, groups, config, nullptr, clock_);

    const auto started = std::chrono::steady_clock::now();
    auto result = ledger->Admit(Device("G", "A"));
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    ASSERT_FALSE(result.IsOk());
    EXPECT_EQ(result.GetStatus().Code(), StatusCode::kDeadlineExceeded);
    EXPECT_GE(groups->GetCalls(), 2);
    EXPECT_LE(store->ClaimCalls(), 1);
    // 分开计时的话会接近两倍时限
    EXPECT_LT(elapsed.count(), 180);
}

// 非瞬时错误不重试
TEST_F(QuotaLedgerRetryTest, PermanentFailureIsNotRetried) {
    auto store = std::make_shared<testutils::FlakySessionStore>(
        std::make_shared<InMemoryDeviceSessionStore>(), -1, quota::common::Status::Internal("disk full"));
    auto ledger = MakeLedger(store);

    auto result = ledger->Admit(Device("G", "A"));
    EXPECT_EQ(result.GetStatus().Code(), StatusCode::kInternal);
    EXPECT_EQ(store->ClaimCalls(), 1);
}

// 显式开启 fail_open 时降级放行, 不产生会话
TEST_F(QuotaLedgerRetryTest, FailOpenGrantsDegradedAdmission) {
    auto store = std::make_shared<testutils::FlakySessionStore>(std::make_shared<InMemoryDeviceSessionStore>(), -1);
    auto config = FastConfig();
    config.fail_open = true;
    auto ledger = MakeLedger(store, config);

    auto result = ledger->Admit(Device("G", "A"));
    ASSERT_TRUE(result.IsOk()) << result.GetStatus().Message();
    EXPECT_EQ(result.Value().decision, AdmitDecision::kAdmitted);
    EXPECT_TRUE(result.Value().degraded);
    EXPECT_TRUE(result.Value().session.session_id.empty());

    // 业务错误不受 fail_open 影响
    EXPECT_EQ(ledger->Admit(Device("missing", "A")).GetStatus().Code(), StatusCode::kNotFound);
}
