#include <gtest/gtest.h>

#include "cache/redis_client.hpp"
#include "cache/redis_location_cache.hpp"
#include "cache/redis_presence_store.hpp"
#include "cache/redis_queue_store.hpp"
#include "common/config.hpp"
#include "common/scheduler.hpp"
#include "core/auth/cached_session_repository.hpp"
#include "core/auth/session_repository.hpp"

#include <chrono>
#include <cstdlib>
#include <random>
#include <string>

using dispatch::cache::RedisClient;
using dispatch::common::RedisConfig;
using dispatch::core::CachedSessionRepository;
using dispatch::core::InMemorySessionRepository;
using dispatch::core::SessionRecord;

namespace {

std::string RandomToken() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    static constexpr char kChars[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    std::uniform_int_distribution<int> dist(0, sizeof(kChars) - 2);
    std::string out;
    out.reserve(24);
    for (int i = 0; i < 24; ++i) out.push_back(kChars[dist(rng)]);
    return out;
}

RedisConfig LoadRedisConfig() {
    RedisConfig cfg;
    cfg.enabled = true;
    if (const char* host = std::getenv("REDIS_HOST")) cfg.host = host;
    if (const char* port = std::getenv("REDIS_PORT")) cfg.port = std::atoi(port);
    if (const char* pass = std::getenv("REDIS_PASSWORD")) cfg.password = pass;
    return cfg;
}

// Redis 不可达时返回空指针, 由用例跳过
std::shared_ptr<RedisClient> ConnectRedis() {
    auto client = std::make_shared<RedisClient>(LoadRedisConfig());
    auto st = client->Connect();
    if (!st.IsOk()) {
        return {};
    }
    return client;
}

} // namespace

class RedisFlowTest : public ::testing::Test {
protected:
    void SetUp() override {
        redis_ = ConnectRedis();
        if (!redis_) {
            GTEST_SKIP() << "Redis unavailable";
        }
    }

    std::shared_ptr<RedisClient> redis_;
};

TEST_F(RedisFlowTest, SessionCacheEndToEnd) {
    auto primary = std::make_shared<InMemorySessionRepository>();
    CachedSessionRepository repo(primary, redis_);

    SessionRecord rec;
    rec.token = "test:" + RandomToken();
    rec.user_id = "driver-redis-flow";
    rec.role = dispatch::core::Role::kDriver;
    rec.expires_at = dispatch::core::NowSeconds() + 300;

    // Create -> should populate cache
    auto st = repo.CreateSession(rec);
    ASSERT_TRUE(st.IsOk()) << st.Message();
    auto exists = redis_->Exists("dispatch:session:" + rec.token);
    ASSERT_TRUE(exists.IsOk()) << exists.GetStatus().Message();
    EXPECT_TRUE(exists.Value());

    // Delete cache to force miss, then Validate should hit primary and backfill
    ASSERT_TRUE(redis_->Del("dispatch:session:" + rec.token).IsOk());
    auto validated = repo.ValidateSession(rec.token);
    ASSERT_TRUE(validated.IsOk()) << validated.GetStatus().Message();
    EXPECT_EQ(validated.Value().user_id, rec.user_id);
    EXPECT_EQ(validated.Value().role, dispatch::core::Role::kDriver);
    auto exists_after = redis_->Exists("dispatch:session:" + rec.token);
    ASSERT_TRUE(exists_after.IsOk()) << exists_after.GetStatus().Message();
    EXPECT_TRUE(exists_after.Value());

    // Delete session -> cache should be removed
    auto del = repo.DeleteSession(rec.token);
    ASSERT_TRUE(del.IsOk()) << del.Message();
    auto exists_final = redis_->Exists("dispatch:session:" + rec.token);
    ASSERT_TRUE(exists_final.IsOk()) << exists_final.GetStatus().Message();
    EXPECT_FALSE(exists_final.Value());
}

TEST_F(RedisFlowTest, QueueStoreDrainsInOrder) {
    dispatch::cache::RedisQueueStore store(redis_, 60);
    const std::string user = "consumer-" + RandomToken();
    for (int i = 0; i < 3; ++i) {
        proto::dispatch::QueuedMessage message;
        message.set_sequence(i);
        message.set_enqueued_at_ms(1000 + i);
        message.mutable_event()->mutable_ping()->set_server_time(i);
        ASSERT_TRUE(store.Append(user, message).IsOk());
    }

    auto taken = store.TakeAll(user);
    ASSERT_TRUE(taken.IsOk()) << taken.GetStatus().Message();
    ASSERT_EQ(taken.Value().size(), 3u);
    EXPECT_EQ(taken.Value()[0].sequence(), 0);
    EXPECT_EQ(taken.Value()[2].sequence(), 2);

    auto again = store.TakeAll(user);
    ASSERT_TRUE(again.IsOk());
    EXPECT_TRUE(again.Value().empty());
}

TEST_F(RedisFlowTest, PresenceStoreSeesOtherNodes) {
    dispatch::cache::RedisPresenceStore store(redis_, 60);
    const std::string user = "driver-" + RandomToken();
    ASSERT_TRUE(store.SetOnline(user, "node-a").IsOk());

    auto from_a = store.IsOnlineElsewhere(user, "node-a");
    ASSERT_TRUE(from_a.IsOk());
    EXPECT_FALSE(from_a.Value());
    auto from_b = store.IsOnlineElsewhere(user, "node-b");
    ASSERT_TRUE(from_b.IsOk());
    EXPECT_TRUE(from_b.Value());

    ASSERT_TRUE(store.SetOffline(user, "node-a").IsOk());
    auto after = store.IsOnlineElsewhere(user, "node-b");
    ASSERT_TRUE(after.IsOk());
    EXPECT_FALSE(after.Value());
}

TEST_F(RedisFlowTest, LocationCacheKeepsOptionalFields) {
    dispatch::cache::RedisLocationCache cache(redis_, 60);
    const std::string driver = "driver-" + RandomToken();

    dispatch::core::DriverLocation location;
    location.point = dispatch::geo::GeoPoint::Create(31.2304, 121.4737).Value();
    location.speed_kmh = 32.0;
    location.updated_at_ms = dispatch::common::UnixMillis();
    ASSERT_TRUE(cache.Put(driver, location).IsOk());

    auto loaded = cache.Get(driver);
    ASSERT_TRUE(loaded.IsOk()) << loaded.GetStatus().Message();
    EXPECT_NEAR(loaded.Value().point.Latitude(), 31.2304, 1e-9);
    EXPECT_NEAR(loaded.Value().point.Longitude(), 121.4737, 1e-9);
    ASSERT_TRUE(loaded.Value().speed_kmh.has_value());
    EXPECT_DOUBLE_EQ(*loaded.Value().speed_kmh, 32.0);
    EXPECT_FALSE(loaded.Value().heading.has_value());

    EXPECT_FALSE(cache.Get("driver-missing-" + RandomToken()).IsOk());
}
