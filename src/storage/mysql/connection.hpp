#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "storage/mysql/options.hpp"

#include <mysql/mysql.h>
#include <memory>
#include <string>

namespace dispatch {
namespace storage {

using ResultPtr = std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)>;

class Connection {
public:
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    ~Connection();

    static dispatch::common::StatusOr<std::unique_ptr<Connection>> Create(const Options& options);

    // 执行不返回结果集的语句, 返回受影响行数
    dispatch::common::StatusOr<std::uint64_t> Execute(const std::string& sql);
    // 执行查询并取回完整结果集
    dispatch::common::StatusOr<ResultPtr> Query(const std::string& sql);
    // 转义字符串字面量, 结果可直接放入单引号中
    std::string Escape(const std::string& value);

    MYSQL* Raw() const noexcept {return handle_;}
    const Options& GetOptions() const noexcept {return options_;}
private:
    Connection(MYSQL* handle, Options options);

    MYSQL* handle_ = nullptr;
    Options options_;
};

// 根据 MySQL 错误码映射为通用状态: 连接类错误视为暂时不可用
dispatch::common::Status MapMySqlError(MYSQL* handle, const std::string& context);

}
}
