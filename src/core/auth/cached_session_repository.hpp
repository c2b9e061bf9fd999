#pragma once

#include "cache/redis_client.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/auth/session_repository.hpp"

#include <memory>
#include <string>

namespace dispatch {
namespace core {

// 带 Redis 读写的 Session 仓库包装器
class CachedSessionRepository : public SessionRepository {
public:
    // primary: 主存储库实例
    // redis: Redis 客户端实例
    CachedSessionRepository(std::shared_ptr<SessionRepository> primary,
                            std::shared_ptr<dispatch::cache::RedisClient> redis);

    dispatch::common::Status CreateSession(const SessionRecord& record) override;
    dispatch::common::StatusOr<SessionRecord> ValidateSession(const std::string& token) override;
    dispatch::common::Status DeleteSession(const std::string& token) override;

private:
    bool HasCache() const { return static_cast<bool>(redis_); }
    std::string KeyForToken(const std::string& token) const;

    dispatch::common::Status CachePut(const SessionRecord& record);
    dispatch::common::Status CacheDelete(const std::string& token);
    dispatch::common::StatusOr<SessionRecord> CacheGet(const std::string& token);

private:
    std::shared_ptr<SessionRepository> primary_; // 主存储库
    std::shared_ptr<dispatch::cache::RedisClient> redis_; // Redis 客户端
};

} // namespace core
} // namespace dispatch
