#include "core/auth/cached_session_repository.hpp"

#include "common/logger.hpp"

#include <nlohmann/json.hpp>

#include <string_view>

namespace dispatch {
namespace core {

namespace {
constexpr std::string_view kPrefix = "dispatch:session:";
} // namespace

CachedSessionRepository::CachedSessionRepository(std::shared_ptr<SessionRepository> primary,
                                                 std::shared_ptr<dispatch::cache::RedisClient> redis)
    : primary_(std::move(primary)), redis_(std::move(redis)) {}

// 写逻辑: 先写主存储库, 再写缓存
dispatch::common::Status CachedSessionRepository::CreateSession(const SessionRecord& record) {
    auto status = primary_->CreateSession(record);
    if (!status.IsOk() || !HasCache()) {
        return status;
    }
    auto cache_status = CachePut(record);
    if (!cache_status.IsOk()) {
        DISPATCH_LOG_WARN("[SessionCache] DegradedCache: put failed: {}", cache_status.Message());
    }
    return status;
}

// 读逻辑: 先读缓存, 未命中再读主存储库并回填
dispatch::common::StatusOr<SessionRecord> CachedSessionRepository::ValidateSession(const std::string& token) {
    if (HasCache()) {
        auto cached = CacheGet(token);
        if (cached.IsOk()) {
            return cached;
        }
        if (cached.GetStatus().Code() == dispatch::common::StatusCode::kUnauthenticated) {
            return cached;
        }
        if (cached.GetStatus().Code() != dispatch::common::StatusCode::kNotFound) {
            DISPATCH_LOG_WARN("[SessionCache] DegradedCache: get failed: {}", cached.GetStatus().Message());
        }
    }

    auto db_result = primary_->ValidateSession(token);
    if (!db_result.IsOk() || !HasCache()) {
        return db_result;
    }
    auto cache_status = CachePut(db_result.Value());
    if (!cache_status.IsOk()) {
        DISPATCH_LOG_WARN("[SessionCache] DegradedCache: backfill failed: {}", cache_status.Message());
    }
    return db_result;
}

dispatch::common::Status CachedSessionRepository::DeleteSession(const std::string& token) {
    auto status = primary_->DeleteSession(token);
    if (!HasCache()) {
        return status;
    }
    auto del_status = CacheDelete(token);
    if (!del_status.IsOk()) {
        DISPATCH_LOG_WARN("[SessionCache] DegradedCache: delete failed: {}", del_status.Message());
    }
    return status;
}

std::string CachedSessionRepository::KeyForToken(const std::string& token) const {
    return std::string(kPrefix).append(token);
}

dispatch::common::Status CachedSessionRepository::CachePut(const SessionRecord& record) {
    // 会话剩余存活时间, 已过期或永不过期的会话不缓存
    std::int64_t ttl = record.expires_at > 0 ? record.expires_at - NowSeconds() : 0;
    if (ttl <= 0) {
        return dispatch::common::Status::OK();
    }

    nlohmann::json j{
        {"token", record.token},
        {"user_id", record.user_id},
        {"role", RoleToString(record.role)},
        {"reconnect", record.reconnect},
        {"expires_at", record.expires_at},
    };
    return redis_->SetEx(KeyForToken(record.token), j.dump(), static_cast<int>(ttl));
}

dispatch::common::StatusOr<SessionRecord> CachedSessionRepository::CacheGet(const std::string& token) {
    auto resp = redis_->Get(KeyForToken(token));
    if (!resp.IsOk()) {
        return resp.GetStatus();
    }
    auto json = nlohmann::json::parse(resp.Value(), nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return dispatch::common::Status::Unavailable("invalid cache payload");
    }

    SessionRecord rec;
    rec.token = json.value("token", token);
    rec.user_id = json.value("user_id", std::string());
    auto role = RoleFromString(json.value("role", std::string()));
    rec.role = role.IsOk() ? role.Value() : Role::kUnknown;
    rec.reconnect = json.value("reconnect", false);
    rec.expires_at = json.value("expires_at", static_cast<std::int64_t>(0));

    if (rec.expires_at != 0 && rec.expires_at < NowSeconds()) {
        auto status = CacheDelete(token);
        if (!status.IsOk()) {
            DISPATCH_LOG_WARN("[SessionCache] DegradedCache: evict failed: {}", status.Message());
        }
        return dispatch::common::Status::Unauthenticated("Session expired");
    }
    return dispatch::common::StatusOr<SessionRecord>(rec);
}

dispatch::common::Status CachedSessionRepository::CacheDelete(const std::string& token) {
    auto status = redis_->Del(KeyForToken(token));
    if (!status.IsOk() && status.Code() != dispatch::common::StatusCode::kNotFound) {
        return status;
    }
    return dispatch::common::Status::OK();
}

} // namespace core
} // namespace dispatch
