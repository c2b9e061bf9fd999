#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "common/config.hpp"

// Redis++库头文件
#include <sw/redis++/redis++.h>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace dispatch {
namespace cache {

class RedisClient {
public:
    // 订阅回调, 在订阅线程上调用
    using MessageHandler = std::function<void(const std::string& channel, const std::string& message)>;

    explicit RedisClient(const dispatch::common::RedisConfig& config);
    ~RedisClient();

    RedisClient(const RedisClient&) = delete;
    RedisClient& operator=(const RedisClient&) = delete;

    // 连接到Redis服务器
    dispatch::common::Status Connect();

    // 设置键值对
    dispatch::common::Status Set(const std::string& key, const std::string& value);
    // 设置键值对并设置过期时间
    dispatch::common::Status SetEx(const std::string& key, const std::string& value, int ttl_seconds);
    // 获取键对应的值
    dispatch::common::StatusOr<std::string> Get(const std::string& key);
    // 删除键
    dispatch::common::Status Del(const std::string& key);
    // 检查键是否存在
    dispatch::common::StatusOr<bool> Exists(const std::string& key);
    // 设置键的过期时间
    dispatch::common::Status Expire(const std::string& key, int ttl_seconds);

    // 列表: 追加到尾部
    dispatch::common::Status RPush(const std::string& key, const std::string& value);
    // 列表: 在一个事务中读取全部元素并删除键
    dispatch::common::StatusOr<std::vector<std::string>> DrainList(const std::string& key);
    dispatch::common::StatusOr<long long> LLen(const std::string& key);

    // 哈希表操作
    dispatch::common::Status HSet(const std::string& key, const std::string& field, const std::string& value);
    dispatch::common::Status HDel(const std::string& key, const std::string& field);
    dispatch::common::StatusOr<long long> HLen(const std::string& key);
    dispatch::common::StatusOr<std::unordered_map<std::string, std::string>> HGetAll(const std::string& key);

    // 发布订阅
    dispatch::common::Status Publish(const std::string& channel, const std::string& message);
    // 启动后台订阅线程, 同一客户端只允许订阅一次
    dispatch::common::Status Subscribe(const std::vector<std::string>& channels, MessageHandler handler);
    void StopSubscriber();

private:
    void ConsumeLoop(std::vector<std::string> channels);

private:
    dispatch::common::RedisConfig config_; // Redis配置
    std::shared_ptr<sw::redis::Redis> redis_; // Redis连接对象
    MessageHandler handler_;
    std::atomic<bool> subscribing_{false};
    std::thread subscriber_thread_;
};

} // namespace cache
} // namespace dispatch
