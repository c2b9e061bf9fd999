#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include "dispatch.pb.h"

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace dispatch {
namespace core {

// 离线消息存储能力接口
class QueueStore {
public:
    virtual ~QueueStore() = default;

    virtual dispatch::common::Status Append(const std::string& user_id,
                                            const proto::dispatch::QueuedMessage& message) = 0;
    // 取出并清空用户的全部消息
    virtual dispatch::common::StatusOr<std::vector<proto::dispatch::QueuedMessage>> TakeAll(
        const std::string& user_id) = 0;
    // 删除 expires_at_ms <= now_ms 的消息, 返回删除条数
    virtual dispatch::common::StatusOr<std::size_t> PurgeExpired(std::int64_t now_ms) = 0;
};

class InMemoryQueueStore : public QueueStore {
public:
    dispatch::common::Status Append(const std::string& user_id,
                                    const proto::dispatch::QueuedMessage& message) override;
    dispatch::common::StatusOr<std::vector<proto::dispatch::QueuedMessage>> TakeAll(
        const std::string& user_id) override;
    dispatch::common::StatusOr<std::size_t> PurgeExpired(std::int64_t now_ms) override;

    std::size_t Size(const std::string& user_id) const;
private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<proto::dispatch::QueuedMessage>> messages_;
};

}
}
