#include "core/auth/session_repository.hpp"

#include <chrono>
#include <mutex>

namespace dispatch {
namespace core {

std::int64_t NowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

dispatch::common::Status InMemorySessionRepository::CreateSession(const SessionRecord& record) {
    if (record.token.empty() || record.user_id.empty()) {
        return dispatch::common::Status::InvalidArgument("Session token and user id are required");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    // 写入时顺带清理过期会话
    const auto now = NowSeconds();
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->second.expires_at != 0 && it->second.expires_at < now) {
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
    sessions_[record.token] = record;
    return dispatch::common::Status::OK();
}

dispatch::common::StatusOr<SessionRecord> InMemorySessionRepository::ValidateSession(const std::string& token) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(token);
    if (it == sessions_.end()) {
        return dispatch::common::Status::Unauthenticated("Session not found");
    }
    const auto& rec = it->second;
    if (rec.expires_at != 0 && rec.expires_at < NowSeconds()) {
        return dispatch::common::Status::Unauthenticated("Session expired");
    }
    return dispatch::common::StatusOr<SessionRecord>(rec);
}

std::size_t InMemorySessionRepository::SessionCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sessions_.size();
}

dispatch::common::Status InMemorySessionRepository::DeleteSession(const std::string& token) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(token);
    if (it == sessions_.end()) {
        return dispatch::common::Status::NotFound("Session not found");
    }
    sessions_.erase(it);
    return dispatch::common::Status::OK();
}

} // namespace core
} // namespace dispatch
