#pragma once

#include "core/auth/session_repository.hpp"
#include "storage/mysql/connection_pool.hpp"

#include <memory>

namespace dispatch {
namespace storage {

// user_sessions 表由外部认证服务写入访问令牌, 本服务写入重连令牌
class MySqlSessionRepository : public dispatch::core::SessionRepository {
public:
    explicit MySqlSessionRepository(std::shared_ptr<ConnectionPool> pool);

    dispatch::common::Status CreateSession(const dispatch::core::SessionRecord& record) override;
    dispatch::common::StatusOr<dispatch::core::SessionRecord> ValidateSession(const std::string& token) override;
    dispatch::common::Status DeleteSession(const std::string& token) override;

private:
    std::shared_ptr<ConnectionPool> pool_;
};

} // namespace storage
} // namespace dispatch
