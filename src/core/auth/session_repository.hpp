#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/connection/connection.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace dispatch {
namespace core {

struct SessionRecord {
    std::string token;
    std::string user_id;
    Role role = Role::kUnknown;
    bool reconnect = false;      // 重连令牌, 只能用于恢复会话
    std::int64_t expires_at = 0; // Unix 秒, 0 表示不过期
};

class SessionRepository {
public:
    virtual ~SessionRepository() = default;

    virtual dispatch::common::Status CreateSession(const SessionRecord& record) = 0;
    virtual dispatch::common::StatusOr<SessionRecord> ValidateSession(const std::string& token) = 0;
    virtual dispatch::common::Status DeleteSession(const std::string& token) = 0;
};

class InMemorySessionRepository : public SessionRepository {
public:
    dispatch::common::Status CreateSession(const SessionRecord& record) override;
    dispatch::common::StatusOr<SessionRecord> ValidateSession(const std::string& token) override;
    dispatch::common::Status DeleteSession(const std::string& token) override;

    std::size_t SessionCount() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, SessionRecord> sessions_;
};

// 当前 Unix 秒
std::int64_t NowSeconds();

} // namespace core
} // namespace dispatch
