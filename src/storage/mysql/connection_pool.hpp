#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "storage/mysql/connection.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>

namespace dispatch {
namespace storage {

class ConnectionPool {
public:
    explicit ConnectionPool(Options options);

    // 连接租赁类, RAII管理连接的获取和归还
    class Lease {
    public:
        Lease() = default;
        Lease(ConnectionPool* pool, std::unique_ptr<Connection> connection);
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        ~Lease();

        Connection* operator->() noexcept { return connection_.get(); }
        Connection& operator*() noexcept { return *connection_; }
        MYSQL* Raw() const noexcept { return connection_ ? connection_->Raw() : nullptr; }
        explicit operator bool() const noexcept { return connection_ != nullptr; }
        // 连接出现网络错误后调用, 归还时直接丢弃
        void Invalidate() noexcept { broken_ = true; }
    private:
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        void Release();

        ConnectionPool* pool_ = nullptr;
        std::unique_ptr<Connection> connection_;
        bool broken_ = false;
    };

    // 获取连接, 池满时最多等待 acquire_timeout
    dispatch::common::StatusOr<Lease> Acquire();
    const Options& GetOptions() const noexcept { return options_; }

private:
    void Return(std::unique_ptr<Connection> connection, bool broken);

    Options options_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::unique_ptr<Connection>> idle_;
    std::size_t total_connections_ = 0;
};

} // namespace storage
} // namespace dispatch
