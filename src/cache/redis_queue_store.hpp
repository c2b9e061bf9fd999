#pragma once

#include "cache/redis_client.hpp"
#include "core/queue/queue_store.hpp"

#include <memory>
#include <string>

namespace dispatch {
namespace cache {

// 每个用户一个列表 dispatch:queue:<user>, 元素为序列化的 QueuedMessage.
// 单条消息的过期在取出时判断, 列表键本身带 TTL 并在每次入队时续期.
class RedisQueueStore : public dispatch::core::QueueStore {
public:
    RedisQueueStore(std::shared_ptr<RedisClient> redis, int ttl_seconds);

    dispatch::common::Status Append(const std::string& user_id,
                                    const proto::dispatch::QueuedMessage& message) override;
    dispatch::common::StatusOr<std::vector<proto::dispatch::QueuedMessage>> TakeAll(
        const std::string& user_id) override;
    // 由键 TTL 负责清理, 这里不逐条扫描
    dispatch::common::StatusOr<std::size_t> PurgeExpired(std::int64_t now_ms) override;

private:
    static std::string KeyForUser(const std::string& user_id);

    std::shared_ptr<RedisClient> redis_;
    int ttl_seconds_;
};

} // namespace cache
} // namespace dispatch
