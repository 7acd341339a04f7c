#include "cache/redis_client.hpp"
#include "core/device/cached_group_repository.hpp"
#include "test_quota_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using quota::common::StatusCode;
using quota::core::CachedGroupRepository;
using quota::core::InMemoryGroupRepository;

// 没有 Redis 时退化为直通
TEST(CachedGroupRepositoryTest, PassThroughWithoutRedis) {
    auto primary = std::make_shared<InMemoryGroupRepository>();
    CachedGroupRepository repo(primary, nullptr, 30);

    ASSERT_TRUE(repo.UpsertGroup(testutils::MakeGroup("test-g1", 3)).IsOk());
    auto group = repo.GetGroup("test-g1");
    ASSERT_TRUE(group.IsOk());
    EXPECT_EQ(group.Value().limit, 3);

    auto updated = repo.UpdateLimit("test-g1", 5, 1'700'000'000'000);
    ASSERT_TRUE(updated.IsOk());
    EXPECT_EQ(repo.GetGroup("test-g1").Value().limit, 5);
    EXPECT_EQ(repo.GetGroup("test-missing").GetStatus().Code(), StatusCode::kNotFound);
}

// 需要本地 Redis, 设置 DEVICE_QUOTA_REDIS_TESTS=1 开启
class RedisGroupCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!testutils::EnvEnabled("DEVICE_QUOTA_REDIS_TESTS")) {
            GTEST_SKIP() << "DEVICE_QUOTA_REDIS_TESTS not set";
        }
        auto cfg = quota::common::ConfigLoader::LoadFromEnvOrDefault();
        redis_ = std::make_shared<quota::cache::RedisClient>(cfg.cache.redis);
        auto status = redis_->Connect();
        ASSERT_TRUE(status.IsOk()) << status.Message();
        ASSERT_TRUE(redis_->Del(CachedGroupRepository::KeyForGroup("test-g1")).IsOk());

        primary_ = std::make_shared<InMemoryGroupRepository>();
        repo_ = std::make_unique<CachedGroupRepository>(primary_, redis_, 30);
    }

    void TearDown() override {
        if (redis_) {
            auto status = redis_->Del(CachedGroupRepository::KeyForGroup("test-g1"));
            EXPECT_TRUE(status.IsOk()) << status.Message();
        }
    }

    std::shared_ptr<quota::cache::RedisClient> redis_;
    std::shared_ptr<InMemoryGroupRepository> primary_;
    std::unique_ptr<CachedGroupRepository> repo_;
};

TEST_F(RedisGroupCacheTest, ReadBackfillsCache) {
    ASSERT_TRUE(primary_->UpsertGroup(testutils::MakeGroup("test-g1", 3)).IsOk());
    const auto key = CachedGroupRepository::KeyForGroup("test-g1");
    EXPECT_FALSE(redis_->Exists(key).Value());

    auto group = repo_->GetGroup("test-g1");
    ASSERT_TRUE(group.IsOk());
    EXPECT_EQ(group.Value().limit, 3);
    EXPECT_TRUE(redis_->Exists(key).Value());

    auto raw = redis_->Get(key);
    ASSERT_TRUE(raw.IsOk());
    auto json = nlohmann::json::parse(raw.Value());
    EXPECT_EQ(json["limit"].get<int>(), 3);
    EXPECT_EQ(json["school_id"].get<std::string>(), "school-1");
}

// 修改限额后缓存失效, 下一次读取拿到新值
TEST_F(RedisGroupCacheTest, UpdateLimitInvalidates) {
    ASSERT_TRUE(repo_->UpsertGroup(testutils::MakeGroup("test-g1", 3)).IsOk());
    ASSERT_EQ(repo_->GetGroup("test-g1").Value().limit, 3);

    ASSERT_TRUE(repo_->UpdateLimit("test-g1", 6, 1'700'000'000'000).IsOk());
    EXPECT_FALSE(redis_->Exists(CachedGroupRepository::KeyForGroup("test-g1")).Value());
    EXPECT_EQ(repo_->GetGroup("test-g1").Value().limit, 6);
}

TEST_F(RedisGroupCacheTest, InvalidPayloadFallsBackToPrimary) {
    ASSERT_TRUE(primary_->UpsertGroup(testutils::MakeGroup("test-g1", 2)).IsOk());
    const auto key = CachedGroupRepository::KeyForGroup("test-g1");
    ASSERT_TRUE(redis_->SetEx(key, "{not-json", 30).IsOk());

    auto group = repo_->GetGroup("test-g1");
    ASSERT_TRUE(group.IsOk());
    EXPECT_EQ(group.Value().limit, 2);

    ASSERT_TRUE(redis_->SetEx(key, R"({"group_id":"test-g1","limit":0})", 30).IsOk());
    EXPECT_EQ(repo_->GetGroup("test-g1").Value().limit, 2);
}
