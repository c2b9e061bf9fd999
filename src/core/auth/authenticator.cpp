#include "core/auth/authenticator.hpp"

#include "common/logger.hpp"

#include <openssl/rand.h>

#include <iomanip>
#include <random>
#include <sstream>

namespace dispatch {
namespace core {

using dispatch::common::Status;
using dispatch::common::StatusOr;

Authenticator::Authenticator(std::shared_ptr<SessionRepository> sessions, dispatch::common::AuthConfig config)
    : sessions_(std::move(sessions)), config_(std::move(config)) {}

StatusOr<Identity> Authenticator::Authenticate(const std::string& token) {
    if (token.empty()) {
        return Status::Unauthenticated("Token is required");
    }
    // 调试令牌 "<role>:<user_id>"
    if (config_.allow_dev_tokens) {
        auto pos = token.find(':');
        if (pos != std::string::npos && pos + 1 < token.size()) {
            auto role = RoleFromString(token.substr(0, pos));
            if (role.IsOk()) {
                return StatusOr<Identity>(Identity{token.substr(pos + 1), role.Value()});
            }
        }
    }

    auto record = sessions_->ValidateSession(token);
    if (!record.IsOk()) {
        if (record.GetStatus().Code() == dispatch::common::StatusCode::kUnavailable) {
            DISPATCH_LOG_WARN("[Auth] Session store unavailable: {}", record.GetStatus().Message());
        }
        return record.GetStatus();
    }
    const auto& session = record.Value();
    if (session.reconnect) {
        return Status::Unauthenticated("Reconnect token used as access token");
    }
    if (session.role == Role::kUnknown) {
        return Status::Unauthenticated("Session has no role");
    }
    return StatusOr<Identity>(Identity{session.user_id, session.role});
}

StatusOr<Identity> Authenticator::Resume(const std::string& reconnect_token) {
    if (reconnect_token.empty()) {
        return Status::Unauthenticated("Reconnect token is required");
    }
    auto record = sessions_->ValidateSession(reconnect_token);
    if (!record.IsOk()) {
        return record.GetStatus();
    }
    if (!record.Value().reconnect) {
        return Status::Unauthenticated("Not a reconnect token");
    }
    // 重连令牌只能使用一次, 成功后会签发新令牌
    auto deleted = sessions_->DeleteSession(reconnect_token);
    if (!deleted.IsOk()) {
        DISPATCH_LOG_WARN("[Auth] Consumed reconnect token of {} not deleted: {}",
                          record.Value().user_id, deleted.Message());
    }
    return StatusOr<Identity>(Identity{record.Value().user_id, record.Value().role});
}

StatusOr<std::string> Authenticator::IssueReconnectToken(const Identity& identity) {
    SessionRecord record;
    record.token = GenerateToken();
    record.user_id = identity.user_id;
    record.role = identity.role;
    record.reconnect = true;
    record.expires_at = NowSeconds() + config_.reconnect_token_ttl_seconds;
    auto status = sessions_->CreateSession(record);
    if (!status.IsOk()) {
        return status;
    }
    return StatusOr<std::string>(record.token);
}

std::string Authenticator::GenerateToken() {
    constexpr int kTokenBytes = 32;
    unsigned char bytes[kTokenBytes];
    // 使用 OpenSSL 的加密安全随机数生成器
    if (RAND_bytes(bytes, kTokenBytes) != 1) {
        DISPATCH_LOG_WARN("[Auth] RAND_bytes failed, fallback to std::random_device");
        static thread_local std::mt19937_64 rng(std::random_device{}());
        std::uniform_int_distribution<int> dist(0, 255);
        for (int i = 0; i < kTokenBytes; ++i) {
            bytes[i] = static_cast<unsigned char>(dist(rng));
        }
    }
    std::stringstream ss;
    for (int i = 0; i < kTokenBytes; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

} // namespace core
} // namespace dispatch
