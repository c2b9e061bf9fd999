#include "storage/mysql/connection_pool.hpp"

#include <chrono>

namespace dispatch {
namespace storage {

ConnectionPool::ConnectionPool(Options options): options_(std::move(options)) {}

ConnectionPool::Lease::Lease(ConnectionPool* pool, std::unique_ptr<Connection> connection)
    : pool_(pool), connection_(std::move(connection)) {}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), connection_(std::move(other.connection_)), broken_(other.broken_) {
    other.pool_ = nullptr;
}

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        Release();
        pool_ = other.pool_;
        connection_ = std::move(other.connection_);
        broken_ = other.broken_;
        other.pool_ = nullptr;
    }
    return *this;
}

ConnectionPool::Lease::~Lease() {
    Release();
}

void ConnectionPool::Lease::Release() {
    if (pool_ && connection_) {
        pool_->Return(std::move(connection_), broken_);
    }
    pool_ = nullptr;
}

dispatch::common::StatusOr<ConnectionPool::Lease> ConnectionPool::Acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + options_.acquire_timeout;
    while (true) {
        // 有空闲连接 -> 直接使用
        if (!idle_.empty()) {
            auto connection = std::move(idle_.front());
            idle_.pop();
            return dispatch::common::StatusOr<Lease>(Lease(this, std::move(connection)));
        }
        // 未达上限 -> 在锁外创建新连接
        if (total_connections_ < options_.pool_size) {
            ++total_connections_;
            lock.unlock();
            auto created = Connection::Create(options_);
            if (!created.IsOk()) {
                std::lock_guard<std::mutex> guard(mutex_);
                --total_connections_;
                cv_.notify_one();
                return created.GetStatus();
            }
            return dispatch::common::StatusOr<Lease>(Lease(this, std::move(created).Value()));
        }
        // 达到上限 -> 等待归还或超时
        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout && idle_.empty()
            && total_connections_ >= options_.pool_size) {
            return dispatch::common::Status::Unavailable("Acquire connection timeout");
        }
    }
}

void ConnectionPool::Return(std::unique_ptr<Connection> connection, bool broken) {
    // 已断开的连接直接丢弃, 让出名额
    if (broken || mysql_ping(connection->Raw()) != 0) {
        connection.reset();
        std::lock_guard<std::mutex> lock(mutex_);
        --total_connections_;
        cv_.notify_one();
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push(std::move(connection));
    }
    cv_.notify_one();
}

} // namespace storage
} // namespace dispatch
