#pragma once

#include "cache/redis_client.hpp"
#include "core/presence/presence_store.hpp"

#include <memory>
#include <string>

namespace dispatch {
namespace cache {

// 在线记录: HSET dispatch:presence:<user> <node_id> <unix_ms>, 整个键带 TTL
class RedisPresenceStore : public dispatch::core::PresenceStore {
public:
    RedisPresenceStore(std::shared_ptr<RedisClient> redis, int ttl_seconds);

    dispatch::common::Status SetOnline(const std::string& user_id, const std::string& node_id) override;
    dispatch::common::Status SetOffline(const std::string& user_id, const std::string& node_id) override;
    dispatch::common::StatusOr<bool> IsOnlineElsewhere(const std::string& user_id,
                                                       const std::string& node_id) override;
    dispatch::common::Status Publish(const std::string& channel, const std::string& payload) override;
    dispatch::common::Status Subscribe(MessageHandler handler) override;

private:
    static std::string KeyForUser(const std::string& user_id);

    std::shared_ptr<RedisClient> redis_;
    int ttl_seconds_;
};

} // namespace cache
} // namespace dispatch
