#include "storage/mysql/connection.hpp"

#include <mysql/errmsg.h>
#include <mysql/mysqld_error.h>

#include <fmt/format.h>

#include <algorithm>

namespace dispatch {
namespace storage {

dispatch::common::Status MapMySqlError(MYSQL* handle, const std::string& context) {
    std::string message = context;
    unsigned int err = 0;
    if (handle != nullptr) {
        err = mysql_errno(handle);
        message += ": ";
        message += mysql_error(handle);
    }
    switch (err) {
        case ER_DUP_ENTRY:
            return dispatch::common::Status::AlreadyExists(message);
        case CR_CONNECTION_ERROR:
        case CR_CONN_HOST_ERROR:
        case CR_SERVER_GONE_ERROR:
        case CR_SERVER_LOST:
        case ER_LOCK_WAIT_TIMEOUT:
        case ER_LOCK_DEADLOCK:
            return dispatch::common::Status::Unavailable(message);
        default:
            break;
    }
    return dispatch::common::Status::Internal(message);
}

Connection::Connection(MYSQL* handle, Options options): handle_(handle), options_(std::move(options)) {}

Connection::~Connection() {
    if (handle_ != nullptr) {
        mysql_close(handle_);
        handle_ = nullptr;
    }
}

// 静态工厂方法, 创建并初始化 MySQL 连接
dispatch::common::StatusOr<std::unique_ptr<Connection>> Connection::Create(const Options& options) {
    MYSQL* handle = mysql_init(nullptr);
    if (handle == nullptr) {
        return dispatch::common::Status::Internal("mysql_init failed");
    }

    // 超时单位为秒, 不足一秒按一秒计
    auto to_seconds = [](std::chrono::milliseconds timeout) {
        return static_cast<unsigned int>(std::max<long long>(1, (timeout.count() + 999) / 1000));
    };
    unsigned int connect_timeout_sec = to_seconds(options.connect_timeout);
    unsigned int read_timeout_sec = to_seconds(options.read_timeout);
    unsigned int write_timeout_sec = to_seconds(options.write_timeout);
    mysql_options(handle, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_sec);
    mysql_options(handle, MYSQL_OPT_READ_TIMEOUT, &read_timeout_sec);
    mysql_options(handle, MYSQL_OPT_WRITE_TIMEOUT, &write_timeout_sec);

    if (!mysql_real_connect(handle,
                           options.host.c_str(),
                           options.user.c_str(),
                           options.password.c_str(),
                           options.database.c_str(),
                           options.port,
                           nullptr,
                           0)) {
        // 建连失败一律按暂时不可用处理, 由调用方决定是否重试
        auto status = dispatch::common::Status::Unavailable(
            fmt::format("mysql_real_connect failed: {}", mysql_error(handle)));
        mysql_close(handle);
        return status;
    }

    if (!options.charset.empty()) {
        mysql_set_character_set(handle, options.charset.c_str());
    }

    return dispatch::common::StatusOr<std::unique_ptr<Connection>>(std::unique_ptr<Connection>(new Connection(handle, options)));
}

dispatch::common::StatusOr<std::uint64_t> Connection::Execute(const std::string& sql) {
    if (mysql_real_query(handle_, sql.c_str(), sql.size()) != 0) {
        return MapMySqlError(handle_, "execute failed");
    }
    return dispatch::common::StatusOr<std::uint64_t>(static_cast<std::uint64_t>(mysql_affected_rows(handle_)));
}

dispatch::common::StatusOr<ResultPtr> Connection::Query(const std::string& sql) {
    if (mysql_real_query(handle_, sql.c_str(), sql.size()) != 0) {
        return MapMySqlError(handle_, "query failed");
    }
    MYSQL_RES* res = mysql_store_result(handle_);
    if (res == nullptr) {
        return MapMySqlError(handle_, "store result failed");
    }
    return dispatch::common::StatusOr<ResultPtr>(ResultPtr(res, mysql_free_result));
}

std::string Connection::Escape(const std::string& value) {
    std::string escaped(value.size() * 2 + 1, '\0');
    auto length = mysql_real_escape_string(handle_, escaped.data(), value.c_str(),
                                           static_cast<unsigned long>(value.size()));
    escaped.resize(length);
    return escaped;
}

} // namespace storage
} // namespace dispatch
