#pragma once

#include "common/config.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"
#include "core/auth/session_repository.hpp"
#include "core/connection/connection.hpp"

#include <memory>
#include <string>

namespace dispatch {
namespace core {

struct Identity {
    std::string user_id;
    Role role = Role::kUnknown;
};

// 校验连接上送的令牌, 并签发短期重连令牌.
// 访问令牌由外部认证服务写入会话存储, 这里只读取.
class Authenticator {
public:
    Authenticator(std::shared_ptr<SessionRepository> sessions, dispatch::common::AuthConfig config);

    dispatch::common::StatusOr<Identity> Authenticate(const std::string& token);
    dispatch::common::StatusOr<Identity> Resume(const std::string& reconnect_token);
    // 签发 64 位十六进制重连令牌
    dispatch::common::StatusOr<std::string> IssueReconnectToken(const Identity& identity);

private:
    static std::string GenerateToken();

    std::shared_ptr<SessionRepository> sessions_;
    dispatch::common::AuthConfig config_;
};

} // namespace core
} // namespace dispatch
