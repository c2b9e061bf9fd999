#include "core/presence/presence_store.hpp"

namespace dispatch {
namespace core {

using dispatch::common::Status;
using dispatch::common::StatusOr;

Status InMemoryPresenceStore::SetOnline(const std::string& user_id, const std::string& node_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    nodes_by_user_[user_id].insert(node_id);
    return Status::OK();
}

Status InMemoryPresenceStore::SetOffline(const std::string& user_id, const std::string& node_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_by_user_.find(user_id);
    if (it == nodes_by_user_.end()) {
        return Status::OK();
    }
    it->second.erase(node_id);
    if (it->second.empty()) {
        nodes_by_user_.erase(it);
    }
    return Status::OK();
}

StatusOr<bool> InMemoryPresenceStore::IsOnlineElsewhere(const std::string& user_id, const std::string& node_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_by_user_.find(user_id);
    if (it == nodes_by_user_.end()) {
        return StatusOr<bool>(false);
    }
    for (const auto& node : it->second) {
        if (node != node_id) {
            return StatusOr<bool>(true);
        }
    }
    return StatusOr<bool>(false);
}

Status InMemoryPresenceStore::Publish(const std::string& channel, const std::string& payload) {
    std::vector<MessageHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers = handlers_;
    }
    // 回调在锁外执行, 允许回调中再次访问存储
    for (const auto& handler : handlers) {
        handler(channel, payload);
    }
    return Status::OK();
}

Status InMemoryPresenceStore::Subscribe(MessageHandler handler) {
    if (!handler) {
        return Status::InvalidArgument("Subscribe handler is empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.push_back(std::move(handler));
    return Status::OK();
}

}
}
