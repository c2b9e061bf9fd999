#include "core/queue/queue_store.hpp"

#include <algorithm>

namespace dispatch {
namespace core {

using dispatch::common::Status;
using dispatch::common::StatusOr;

Status InMemoryQueueStore::Append(const std::string& user_id, const proto::dispatch::QueuedMessage& message) {
    if (user_id.empty()) {
        return Status::InvalidArgument("User id is required");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    messages_[user_id].push_back(message);
    return Status::OK();
}

StatusOr<std::vector<proto::dispatch::QueuedMessage>> InMemoryQueueStore::TakeAll(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = messages_.find(user_id);
    if (it == messages_.end()) {
        return StatusOr<std::vector<proto::dispatch::QueuedMessage>>(std::vector<proto::dispatch::QueuedMessage>{});
    }
    auto taken = std::move(it->second);
    messages_.erase(it);
    return StatusOr<std::vector<proto::dispatch::QueuedMessage>>(std::move(taken));
}

StatusOr<std::size_t> InMemoryQueueStore::PurgeExpired(std::int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t purged = 0;
    for (auto it = messages_.begin(); it != messages_.end();) {
        auto& list = it->second;
        auto before = list.size();
        list.erase(std::remove_if(list.begin(), list.end(), [now_ms](const proto::dispatch::QueuedMessage& message) {
            return message.expires_at_ms() <= now_ms;
        }), list.end());
        purged += before - list.size();
        if (list.empty()) {
            it = messages_.erase(it);
        } else {
            ++it;
        }
    }
    return StatusOr<std::size_t>(purged);
}

std::size_t InMemoryQueueStore::Size(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = messages_.find(user_id);
    return it == messages_.end() ? 0 : it->second.size();
}

}
}
