#include <gtest/gtest.h>

#include "core/auth/session_repository.hpp"
#include "storage/mysql/dispatch_repository.hpp"
#include "storage/mysql/session_repository.hpp"
#include "test_mysql_utils.hpp"

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using dispatch::core::DeliveryRequest;
using dispatch::core::RequestState;
using dispatch::geo::GeoPoint;

namespace {

class MySqlDispatchTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool_ = testutils::CreatePoolFromEnv();
        if (!pool_) {
            GTEST_SKIP() << "MySQL unavailable";
        }
        testutils::ClearMysqlTestData(*pool_);
        repo_ = std::make_shared<dispatch::storage::MySqlDispatchRepository>(pool_);
    }

    void TearDown() override {
        if (pool_) {
            testutils::ClearMysqlTestData(*pool_);
        }
    }

    void InsertDriver(const std::string& id, double lat, double lon) {
        testutils::ExecuteSql(*pool_,
            "INSERT INTO drivers (driver_id, latitude, longitude, rating, completed_jobs, "
            "is_online, is_available, is_verified) VALUES ('" + id + "', " + std::to_string(lat) + ", " +
            std::to_string(lon) + ", 4.5, 10, 1, 1, 1)");
    }

    DeliveryRequest MakeRequest(const std::string& id) {
        DeliveryRequest request;
        request.request_id = id;
        request.requester_id = "consumer-1";
        request.pickup = GeoPoint::Create(31.2304, 121.4737).Value();
        request.created_at_ms = 1000;
        return request;
    }

    std::shared_ptr<dispatch::storage::ConnectionPool> pool_;
    std::shared_ptr<dispatch::storage::MySqlDispatchRepository> repo_;
};

} // namespace

TEST_F(MySqlDispatchTest, FetchEligibleDriversReadsLocation) {
    InsertDriver("d-1", 31.23, 121.47);
    auto drivers = repo_->FetchEligibleDrivers();
    ASSERT_TRUE(drivers.IsOk()) << drivers.GetStatus().Message();
    ASSERT_EQ(drivers.Value().size(), 1u);
    const auto& driver = drivers.Value().front();
    EXPECT_EQ(driver.driver_id, "d-1");
    ASSERT_TRUE(driver.location.has_value());
    EXPECT_NEAR(driver.location->Latitude(), 31.23, 1e-6);
    EXPECT_TRUE(driver.available);
}

TEST_F(MySqlDispatchTest, ClaimIsExclusiveAcrossThreads) {
    constexpr int kDrivers = 6;
    for (int i = 0; i < kDrivers; ++i) {
        InsertDriver("d-" + std::to_string(i), 31.23, 121.47);
    }
    ASSERT_TRUE(repo_->RegisterRequest(MakeRequest("r-1")).IsOk());

    std::atomic<int> wins{0};
    std::atomic<int> errors{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kDrivers; ++i) {
        threads.emplace_back([this, i, &wins, &errors]() {
            auto claimed = repo_->ConditionalClaim("r-1", "d-" + std::to_string(i));
            if (!claimed.IsOk()) {
                ++errors;
            } else if (claimed.Value()) {
                ++wins;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_LT(errors.load(), kDrivers);
    EXPECT_EQ(wins.load(), 1);

    auto request = repo_->GetRequest("r-1");
    ASSERT_TRUE(request.IsOk());
    EXPECT_EQ(request.Value().state, RequestState::kClaimed);
    ASSERT_TRUE(request.Value().driver_id.has_value());
}

TEST_F(MySqlDispatchTest, ClaimUnknownRequestIsNotFound) {
    InsertDriver("d-1", 31.23, 121.47);
    auto claimed = repo_->ConditionalClaim("missing", "d-1");
    ASSERT_FALSE(claimed.IsOk());
    EXPECT_EQ(claimed.GetStatus().Code(), dispatch::common::StatusCode::kNotFound);
}

TEST_F(MySqlDispatchTest, ReleaseAndAcceptRequireHolder) {
    InsertDriver("d-1", 31.23, 121.47);
    InsertDriver("d-2", 31.23, 121.47);
    ASSERT_TRUE(repo_->RegisterRequest(MakeRequest("r-2")).IsOk());
    auto claimed = repo_->ConditionalClaim("r-2", "d-1");
    ASSERT_TRUE(claimed.IsOk());
    ASSERT_TRUE(claimed.Value());

    auto wrong = repo_->MarkAccepted("r-2", "d-2");
    ASSERT_TRUE(wrong.IsOk());
    EXPECT_FALSE(wrong.Value());

    auto released = repo_->ReleaseClaim("r-2", "d-1");
    ASSERT_TRUE(released.IsOk());
    EXPECT_TRUE(released.Value());
    auto request = repo_->GetRequest("r-2");
    ASSERT_TRUE(request.IsOk());
    EXPECT_EQ(request.Value().state, RequestState::kUnassigned);
    EXPECT_FALSE(request.Value().driver_id.has_value());
}

TEST_F(MySqlDispatchTest, SessionRoundTrip) {
    dispatch::storage::MySqlSessionRepository sessions(pool_);
    dispatch::core::SessionRecord record;
    record.token = "mysql-test-token";
    record.user_id = "driver-9";
    record.role = dispatch::core::Role::kDriver;
    record.reconnect = true;
    record.expires_at = dispatch::core::NowSeconds() + 60;
    ASSERT_TRUE(sessions.CreateSession(record).IsOk());

    auto loaded = sessions.ValidateSession(record.token);
    ASSERT_TRUE(loaded.IsOk()) << loaded.GetStatus().Message();
    EXPECT_EQ(loaded.Value().user_id, "driver-9");
    EXPECT_EQ(loaded.Value().role, dispatch::core::Role::kDriver);
    EXPECT_TRUE(loaded.Value().reconnect);

    ASSERT_TRUE(sessions.DeleteSession(record.token).IsOk());
    EXPECT_FALSE(sessions.ValidateSession(record.token).IsOk());
}
