#include "storage/mysql/session_repository.hpp"

#include <fmt/format.h>

#include <cstdlib>

namespace dispatch {
namespace storage {

using dispatch::common::Status;
using dispatch::common::StatusOr;
using dispatch::core::SessionRecord;

MySqlSessionRepository::MySqlSessionRepository(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

Status MySqlSessionRepository::CreateSession(const SessionRecord& record) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto sql = fmt::format(
        "INSERT INTO user_sessions (token, user_id, role, is_reconnect, expires_at) "
        "VALUES ('{}', '{}', '{}', {}, {})",
        lease->Escape(record.token),
        lease->Escape(record.user_id),
        dispatch::core::RoleToString(record.role),
        record.reconnect ? 1 : 0,
        record.expires_at);
    auto result = lease->Execute(sql);
    if (!result.IsOk()) {
        if (result.GetStatus().Code() == dispatch::common::StatusCode::kUnavailable) {
            lease.Invalidate();
        }
        return result.GetStatus();
    }
    return Status::OK();
}

StatusOr<SessionRecord> MySqlSessionRepository::ValidateSession(const std::string& token) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto sql = fmt::format(
        "SELECT user_id, role, is_reconnect, expires_at FROM user_sessions WHERE token = '{}' LIMIT 1",
        lease->Escape(token));
    auto query = lease->Query(sql);
    if (!query.IsOk()) {
        if (query.GetStatus().Code() == dispatch::common::StatusCode::kUnavailable) {
            lease.Invalidate();
        }
        return query.GetStatus();
    }
    auto res = std::move(query).Value();
    MYSQL_ROW row = mysql_fetch_row(res.get());
    if (!row || !row[0]) {
        return Status::Unauthenticated("Session not found");
    }

    SessionRecord rec;
    rec.token = token;
    rec.user_id = row[0];
    auto role = dispatch::core::RoleFromString(row[1] ? row[1] : "");
    rec.role = role.IsOk() ? role.Value() : dispatch::core::Role::kUnknown;
    rec.reconnect = row[2] && std::strtol(row[2], nullptr, 10) != 0;
    rec.expires_at = row[3] ? std::strtoll(row[3], nullptr, 10) : 0;
    if (rec.expires_at != 0 && rec.expires_at < dispatch::core::NowSeconds()) {
        return Status::Unauthenticated("Session expired");
    }
    return StatusOr<SessionRecord>(rec);
}

Status MySqlSessionRepository::DeleteSession(const std::string& token) {
    auto lease_or = pool_->Acquire();
    if (!lease_or.IsOk()) {
        return lease_or.GetStatus();
    }
    auto lease = std::move(lease_or.Value());
    auto result = lease->Execute(fmt::format("DELETE FROM user_sessions WHERE token = '{}'", lease->Escape(token)));
    if (!result.IsOk()) {
        return result.GetStatus();
    }
    if (result.Value() == 0) {
        return Status::NotFound("Session not found");
    }
    return Status::OK();
}

} // namespace storage
} // namespace dispatch
