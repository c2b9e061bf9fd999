#include "cache/redis_queue_store.hpp"

#include "common/logger.hpp"

namespace dispatch {
namespace cache {

using dispatch::common::Status;
using dispatch::common::StatusOr;

RedisQueueStore::RedisQueueStore(std::shared_ptr<RedisClient> redis, int ttl_seconds)
    : redis_(std::move(redis)), ttl_seconds_(ttl_seconds) {}

std::string RedisQueueStore::KeyForUser(const std::string& user_id) {
    return "dispatch:queue:" + user_id;
}

Status RedisQueueStore::Append(const std::string& user_id, const proto::dispatch::QueuedMessage& message) {
    std::string payload;
    if (!message.SerializeToString(&payload)) {
        return Status::Internal("Failed to serialize queued message");
    }
    const auto key = KeyForUser(user_id);
    auto status = redis_->RPush(key, payload);
    if (!status.IsOk()) {
        return status;
    }
    return redis_->Expire(key, ttl_seconds_);
}

StatusOr<std::vector<proto::dispatch::QueuedMessage>> RedisQueueStore::TakeAll(const std::string& user_id) {
    auto drained = redis_->DrainList(KeyForUser(user_id));
    if (!drained.IsOk()) {
        return drained.GetStatus();
    }
    std::vector<proto::dispatch::QueuedMessage> messages;
    messages.reserve(drained.Value().size());
    for (const auto& payload : drained.Value()) {
        proto::dispatch::QueuedMessage message;
        if (!message.ParseFromString(payload)) {
            DISPATCH_LOG_WARN("[RedisCache] Skipping malformed queued message for {}", user_id);
            continue;
        }
        messages.push_back(std::move(message));
    }
    return StatusOr<std::vector<proto::dispatch::QueuedMessage>>(std::move(messages));
}

StatusOr<std::size_t> RedisQueueStore::PurgeExpired(std::int64_t) {
    return StatusOr<std::size_t>(static_cast<std::size_t>(0));
}

} // namespace cache
} // namespace dispatch
