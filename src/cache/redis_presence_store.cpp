#include "cache/redis_presence_store.hpp"

#include "common/scheduler.hpp"

namespace dispatch {
namespace cache {

using dispatch::common::Status;
using dispatch::common::StatusOr;

RedisPresenceStore::RedisPresenceStore(std::shared_ptr<RedisClient> redis, int ttl_seconds)
    : redis_(std::move(redis)), ttl_seconds_(ttl_seconds) {}

std::string RedisPresenceStore::KeyForUser(const std::string& user_id) {
    return "dispatch:presence:" + user_id;
}

Status RedisPresenceStore::SetOnline(const std::string& user_id, const std::string& node_id) {
    const auto key = KeyForUser(user_id);
    auto status = redis_->HSet(key, node_id, std::to_string(dispatch::common::UnixMillis()));
    if (!status.IsOk()) {
        return status;
    }
    return redis_->Expire(key, ttl_seconds_);
}

Status RedisPresenceStore::SetOffline(const std::string& user_id, const std::string& node_id) {
    return redis_->HDel(KeyForUser(user_id), node_id);
}

StatusOr<bool> RedisPresenceStore::IsOnlineElsewhere(const std::string& user_id, const std::string& node_id) {
    auto fields = redis_->HGetAll(KeyForUser(user_id));
    if (!fields.IsOk()) {
        return fields.GetStatus();
    }
    for (const auto& entry : fields.Value()) {
        if (entry.first != node_id) {
            return StatusOr<bool>(true);
        }
    }
    return StatusOr<bool>(false);
}

Status RedisPresenceStore::Publish(const std::string& channel, const std::string& payload) {
    return redis_->Publish(channel, payload);
}

Status RedisPresenceStore::Subscribe(MessageHandler handler) {
    return redis_->Subscribe({dispatch::core::kPresenceChannel, dispatch::core::kUserEventsChannel},
                             std::move(handler));
}

} // namespace cache
} // namespace dispatch
