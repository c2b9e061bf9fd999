#include "core/auth/authenticator.hpp"
#include "core/auth/session_repository.hpp"

#include <gtest/gtest.h>

#include <memory>

using dispatch::common::StatusCode;
using dispatch::core::Authenticator;
using dispatch::core::Identity;
using dispatch::core::InMemorySessionRepository;
using dispatch::core::Role;
using dispatch::core::SessionRecord;

namespace {

class AuthenticatorTest : public ::testing::Test {
protected:
    AuthenticatorTest() : sessions_(std::make_shared<InMemorySessionRepository>()) {}

    Authenticator Make(bool allow_dev_tokens) {
        dispatch::common::AuthConfig config;
        config.allow_dev_tokens = allow_dev_tokens;
        config.reconnect_token_ttl_seconds = 60;
        return Authenticator(sessions_, config);
    }

    void AddSession(const std::string& token, const std::string& user_id, Role role,
                    std::int64_t expires_at = 0) {
        SessionRecord record;
        record.token = token;
        record.user_id = user_id;
        record.role = role;
        record.expires_at = expires_at;
        ASSERT_TRUE(sessions_->CreateSession(record).IsOk());
    }

    std::shared_ptr<InMemorySessionRepository> sessions_;
};

} // namespace

TEST_F(AuthenticatorTest, AcceptsStoredSession) {
    AddSession("tok-1", "driver-7", Role::kDriver);
    auto auth = Make(false);
    auto identity = auth.Authenticate("tok-1");
    ASSERT_TRUE(identity.IsOk());
    EXPECT_EQ(identity.Value().user_id, "driver-7");
    EXPECT_EQ(identity.Value().role, Role::kDriver);
}

TEST_F(AuthenticatorTest, RejectsEmptyAndUnknownTokens) {
    auto auth = Make(false);
    EXPECT_EQ(auth.Authenticate("").GetStatus().Code(), StatusCode::kUnauthenticated);
    EXPECT_EQ(auth.Authenticate("nope").GetStatus().Code(), StatusCode::kUnauthenticated);
}

TEST_F(AuthenticatorTest, RejectsExpiredSession) {
    AddSession("old", "consumer-1", Role::kConsumer, dispatch::core::NowSeconds() - 10);
    auto auth = Make(false);
    EXPECT_EQ(auth.Authenticate("old").GetStatus().Code(), StatusCode::kUnauthenticated);
}

TEST_F(AuthenticatorTest, RejectsSessionWithoutRole) {
    AddSession("norole", "u-1", Role::kUnknown);
    auto auth = Make(false);
    EXPECT_FALSE(auth.Authenticate("norole").IsOk());
}

TEST_F(AuthenticatorTest, DevTokensOnlyWhenEnabled) {
    auto disabled = Make(false);
    EXPECT_FALSE(disabled.Authenticate("admin:ops-1").IsOk());

    auto enabled = Make(true);
    auto identity = enabled.Authenticate("Admin:ops-1");
    ASSERT_TRUE(identity.IsOk());
    EXPECT_EQ(identity.Value().user_id, "ops-1");
    EXPECT_EQ(identity.Value().role, Role::kAdmin);

    EXPECT_FALSE(enabled.Authenticate("pilot:ops-1").IsOk());
    EXPECT_FALSE(enabled.Authenticate("driver:").IsOk());
}

TEST_F(AuthenticatorTest, ReconnectTokenResumesIdentity) {
    auto auth = Make(false);
    auto token = auth.IssueReconnectToken(Identity{"merchant-3", Role::kMerchant});
    ASSERT_TRUE(token.IsOk());
    EXPECT_EQ(token.Value().size(), 64u);
    EXPECT_EQ(token.Value().find_first_not_of("0123456789abcdef"), std::string::npos);

    auto resumed = auth.Resume(token.Value());
    ASSERT_TRUE(resumed.IsOk());
    EXPECT_EQ(resumed.Value().user_id, "merchant-3");
    EXPECT_EQ(resumed.Value().role, Role::kMerchant);

    auto other = auth.IssueReconnectToken(Identity{"merchant-3", Role::kMerchant});
    ASSERT_TRUE(other.IsOk());
    EXPECT_NE(other.Value(), token.Value());
}

TEST_F(AuthenticatorTest, ReconnectAndAccessTokensAreNotInterchangeable) {
    AddSession("access", "driver-1", Role::kDriver);
    auto auth = Make(false);
    auto reconnect = auth.IssueReconnectToken(Identity{"driver-1", Role::kDriver});
    ASSERT_TRUE(reconnect.IsOk());

    EXPECT_EQ(auth.Authenticate(reconnect.Value()).GetStatus().Code(), StatusCode::kUnauthenticated);
    EXPECT_EQ(auth.Resume("access").GetStatus().Code(), StatusCode::kUnauthenticated);
    EXPECT_EQ(auth.Resume("").GetStatus().Code(), StatusCode::kUnauthenticated);
}

TEST_F(AuthenticatorTest, IssueFailsForEmptyUser) {
    auto auth = Make(false);
    auto token = auth.IssueReconnectToken(Identity{"", Role::kDriver});
    EXPECT_EQ(token.GetStatus().Code(), StatusCode::kInvalidArgument);
}

TEST_F(AuthenticatorTest, ReconnectTokenIsSingleUse) {
    auto auth = Make(false);
    auto token = auth.IssueReconnectToken(Identity{"driver-1", Role::kDriver});
    ASSERT_TRUE(token.IsOk());
    ASSERT_TRUE(auth.Resume(token.Value()).IsOk());
    EXPECT_EQ(auth.Resume(token.Value()).GetStatus().Code(), StatusCode::kUnauthenticated);
    EXPECT_EQ(sessions_->SessionCount(), 0u);
}

TEST_F(AuthenticatorTest, RepeatedResumeKeepsOneLiveToken) {
    auto auth = Make(false);
    const Identity who{"consumer-1", Role::kConsumer};
    auto token = auth.IssueReconnectToken(who);
    ASSERT_TRUE(token.IsOk());
    std::string current = token.Value();
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(auth.Resume(current).IsOk());
        auto next = auth.IssueReconnectToken(who);
        ASSERT_TRUE(next.IsOk());
        current = next.Value();
    }
    EXPECT_EQ(sessions_->SessionCount(), 1u);
}

TEST(InMemorySessionRepositoryTest, ExpiredSessionsArePurgedOnWrite) {
    InMemorySessionRepository sessions;
    SessionRecord stale;
    stale.token = "stale";
    stale.user_id = "u-1";
    stale.role = Role::kConsumer;
    stale.expires_at = dispatch::core::NowSeconds() - 5;
    ASSERT_TRUE(sessions.CreateSession(stale).IsOk());

    SessionRecord permanent = stale;
    permanent.token = "permanent";
    permanent.expires_at = 0;
    ASSERT_TRUE(sessions.CreateSession(permanent).IsOk());

    EXPECT_EQ(sessions.SessionCount(), 1u);
    EXPECT_TRUE(sessions.ValidateSession("permanent").IsOk());
    EXPECT_EQ(sessions.ValidateSession("stale").GetStatus().Code(), StatusCode::kUnauthenticated);
}
