#include "cache/redis_client.hpp"
#include "common/logger.hpp"

// 标准库头文件
#include <chrono>
#include <iterator>

namespace dispatch {
namespace cache {

using dispatch::common::Status;
using dispatch::common::StatusOr;

// 构造函数
RedisClient::RedisClient(const dispatch::common::RedisConfig& config)
    : config_(config) {}

// 析构函数
RedisClient::~RedisClient() {
    StopSubscriber();
}

// 连接到Redis服务器
Status RedisClient::Connect() {
    if (!config_.enabled) {
        return Status::Unavailable("Redis is disabled in the configuration.");
    }
    if (redis_) {
        return Status::OK(); // 已经连接
    }

    try {
        sw::redis::ConnectionOptions opts; // Redis连接选项
        opts.host = config_.host;
        opts.port = config_.port;
        if (!config_.password.empty()) {
            opts.password = config_.password;
        }
        opts.db = config_.db;
        opts.connect_timeout = std::chrono::milliseconds(config_.connection_timeout_ms);
        opts.socket_timeout = std::chrono::milliseconds(config_.socket_timeout_ms);

        // 创建连接池选项
        sw::redis::ConnectionPoolOptions pool_opts;
        pool_opts.size = static_cast<size_t>(config_.pool_size);
        pool_opts.wait_timeout = std::chrono::milliseconds(config_.connection_timeout_ms);

        auto redis = std::make_shared<sw::redis::Redis>(opts, pool_opts);
        // 连接池惰性建连, 这里主动探测一次, 让不可达的Redis在启动时暴露
        redis->ping();
        redis_ = std::move(redis);
        return Status::OK();
    } catch (const sw::redis::Error& err) {
        return Status::Unavailable("Failed to connect to Redis: " + std::string(err.what()));
    }
}

// 设置键值对
Status RedisClient::Set(const std::string& key, const std::string& value) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        redis_->set(key, value);
        return Status::OK();
    } catch (const sw::redis::Error& err) {
        return Status::Unavailable("Failed to set key in Redis: " + std::string(err.what()));
    }
}

// 设置键值对并设置过期时间
Status RedisClient::SetEx(const std::string& key, const std::string& value, int ttl_seconds) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        redis_->set(key, value, std::chrono::seconds(ttl_seconds));
        return Status::OK();
    } catch (const sw::redis::Error& err) {
        return Status::Unavailable("Failed to set key with expiration in Redis: " + std::string(err.what()));
    }
}

// 获取键对应的值
StatusOr<std::string> RedisClient::Get(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        auto val = redis_->get(key);
        if (!val) {
            return Status::NotFound("Key not found in Redis: " + key);
        }
        return StatusOr<std::string>(*val);
    } catch (const sw::redis::Error& err) {
        return Status::Unavailable("Failed to get key from Redis: " + std::string(err.what()));
    }
}

// 删除键
Status RedisClient::Del(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        redis_->del(key);
        return Status::OK();
    } catch (const sw::redis::Error& err) {
        return Status::Unavailable("Failed to delete key from Redis: " + std::string(err.what()));
    }
}

// 检查键是否存在
StatusOr<bool> RedisClient::Exists(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        auto count = redis_->exists(key);
        return StatusOr<bool>(count > 0);
    } catch (const sw::redis::Error& err) {
        return Status::Unavailable("Failed to check key existence in Redis: " + std::string(err.what()));
    }
}

Status RedisClient::Expire(const std::string& key, int ttl_seconds) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        redis_->expire(key, std::chrono::seconds(ttl_seconds));
        return Status::OK();
    } catch (const sw::redis::Error& err) {
        return Status::Unavailable("Failed to set expiration in Redis: " + std::string(err.what()));
    }
}

Status RedisClient::RPush(const std::string& key, const std::string& value) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        redis_->rpush(key, value);
        return Status::OK();
    } catch (const sw::redis::Error& err) {
        return Status::Unavailable("Failed to push list item to Redis: " + std::string(err.what()));
    }
}

// LRANGE + DEL 放在 MULTI/EXEC 中, 保证并发取出时每条消息只被一个节点拿到
StatusOr<std::vector<std::string>> RedisClient::DrainList(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        auto tx = redis_->transaction();
        auto replies = tx.lrange(key, 0, -1).del(key).exec();
        std::vector<std::string> items;
        replies.get(0, std::back_inserter(items));
        return StatusOr<std::vector<std::string>>(std::move(items));
    } catch (const sw::redis::Error& err) {
        return Status::Unavailable("Failed to drain list from Redis: " + std::string(err.what()));
    }
}

StatusOr<long long> RedisClient::LLen(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        return StatusOr<long long>(redis_->llen(key));
    } catch (const sw::redis::Error& err) {
        return Status::Unavailable("Failed to read list length from Redis: " + std::string(err.what()));
    }
}

Status RedisClient::HSet(const std::string& key, const std::string& field, const std::string& value) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        redis_->hset(key, field, value);
        return Status::OK();
    } catch (const sw::redis::Error& err) {
        return Status::Unavailable("Failed to set hash field in Redis: " + std::string(err.what()));
    }
}

Status RedisClient::HDel(const std::string& key, const std::string& field) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        redis_->hdel(key, field);
        return Status::OK();
    } catch (const sw::redis::Error& err) {
        return Status::Unavailable("Failed to delete hash field in Redis: " + std::string(err.what()));
    }
}

StatusOr<long long> RedisClient::HLen(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        return StatusOr<long long>(redis_->hlen(key));
    } catch (const sw::redis::Error& err) {
        return Status::Unavailable("Failed to read hash length from Redis: " + std::string(err.what()));
    }
}

StatusOr<std::unordered_map<std::string, std::string>> RedisClient::HGetAll(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        std::unordered_map<std::string, std::string> fields;
        redis_->hgetall(key, std::inserter(fields, fields.begin()));
        return StatusOr<std::unordered_map<std::string, std::string>>(std::move(fields));
    } catch (const sw::redis::Error& err) {
        return Status::Unavailable("Failed to read hash from Redis: " + std::string(err.what()));
    }
}

Status RedisClient::Publish(const std::string& channel, const std::string& message) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }

    try {
        redis_->publish(channel, message);
        return Status::OK();
    } catch (const sw::redis::Error& err) {
        return Status::Unavailable("Failed to publish to Redis: " + std::string(err.what()));
    }
}

Status RedisClient::Subscribe(const std::vector<std::string>& channels, MessageHandler handler) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }
    if (subscribing_.exchange(true)) {
        return Status::AlreadyExists("Redis subscriber already running");
    }
    handler_ = std::move(handler);
    subscriber_thread_ = std::thread(&RedisClient::ConsumeLoop, this, channels);
    return Status::OK();
}

void RedisClient::StopSubscriber() {
    subscribing_.store(false);
    if (subscriber_thread_.joinable()) {
        subscriber_thread_.join();
    }
}

// 订阅线程: consume() 在 socket_timeout 到期时抛出 TimeoutError, 借此检查停止标志
void RedisClient::ConsumeLoop(std::vector<std::string> channels) {
    while (subscribing_.load()) {
        try {
            auto subscriber = redis_->subscriber();
            subscriber.on_message([this](std::string channel, std::string message) {
                if (handler_) {
                    handler_(channel, message);
                }
            });
            subscriber.subscribe(channels.begin(), channels.end());
            while (subscribing_.load()) {
                try {
                    subscriber.consume();
                } catch (const sw::redis::TimeoutError&) {
                    continue;
                }
            }
        } catch (const sw::redis::Error& err) {
            DISPATCH_LOG_WARN("[RedisCache] Subscriber error, reconnecting: {}", err.what());
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.connection_timeout_ms));
        }
    }
}

} // namespace cache
} // namespace dispatch
