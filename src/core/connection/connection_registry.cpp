#include "core/connection/connection_registry.hpp"

#include "common/logger.hpp"

#include <fmt/format.h>

#include <random>
#include <utility>

namespace dispatch {
namespace core {

using dispatch::common::Status;

ConnectionRegistry::ConnectionRegistry(dispatch::common::Scheduler& scheduler,
                                       dispatch::common::RegistryConfig config)
    : scheduler_(scheduler), config_(std::move(config)) {}

ConnectionRegistry::~ConnectionRegistry() {
    Stop();
}

void ConnectionRegistry::Start() {
    if (sweep_timer_) {
        return;
    }
    ScheduleSweep();
}

void ConnectionRegistry::Stop() {
    if (sweep_timer_) {
        scheduler_.Cancel(*sweep_timer_);
        sweep_timer_.reset();
    }
}

void ConnectionRegistry::ScheduleSweep() {
    sweep_timer_ = scheduler_.ScheduleAfter(std::chrono::milliseconds(config_.sweep_interval_ms), [this]() {
        Sweep();
        ScheduleSweep();
    });
}

void ConnectionRegistry::AddListener(ConnectionListener* listener) {
    if (listener) {
        listeners_.push_back(listener);
    }
}

std::string ConnectionRegistry::NewConnectionId() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::string id;
    do {
        id = fmt::format("conn-{:016x}", rng());
    } while (connections_.count(id) > 0);
    return id;
}

Status ConnectionRegistry::Add(Connection connection) {
    if (connection.connection_id.empty()) {
        return Status::InvalidArgument("Connection id is required");
    }
    auto now = scheduler_.Now();
    auto it = connections_.find(connection.connection_id);
    if (it == connections_.end()) {
        if (connection.established_at == Connection::TimePoint{}) {
            connection.established_at = now;
        }
        connection.last_activity = now;
        const bool bound = connection.user_id.has_value();
        auto inserted = connections_.emplace(connection.connection_id, std::move(connection));
        ++total_connections_;
        IndexConnection(inserted.first->second);
        if (bound) {
            for (auto* listener : listeners_) {
                listener->OnConnectionAdded(inserted.first->second);
            }
        }
        return Status::OK();
    }

    Connection& existing = it->second;
    if (existing.user_id && connection.user_id && *existing.user_id != *connection.user_id) {
        return Status::InvalidArgument(fmt::format("Connection {} is already bound to user {}",
                                                   existing.connection_id, *existing.user_id));
    }
    const bool newly_bound = !existing.user_id && connection.user_id;

    UnindexConnection(existing);
    if (connection.user_id) {
        existing.user_id = connection.user_id;
    }
    if (connection.role != Role::kUnknown) {
        existing.role = connection.role;
    }
    if (!connection.reconnect_token.empty()) {
        existing.reconnect_token = std::move(connection.reconnect_token);
    }
    if (connection.channel) {
        existing.channel = std::move(connection.channel);
    }
    existing.last_activity = now;
    existing.ping_sent_at.reset();
    IndexConnection(existing);

    if (newly_bound) {
        for (auto* listener : listeners_) {
            listener->OnConnectionAdded(existing);
        }
    }
    return Status::OK();
}

std::optional<Connection> ConnectionRegistry::Remove(const std::string& connection_id) {
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        return std::nullopt;
    }
    Connection removed = std::move(it->second);
    connections_.erase(it);
    UnindexConnection(removed);
    if (removed.user_id) {
        for (auto* listener : listeners_) {
            listener->OnConnectionRemoved(removed);
        }
    }
    return removed;
}

bool ConnectionRegistry::Touch(const std::string& connection_id) {
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        return false;
    }
    it->second.last_activity = scheduler_.Now();
    it->second.ping_sent_at.reset();
    return true;
}

std::set<std::string> ConnectionRegistry::ConnectionsFor(const std::string& user_id) const {
    auto it = by_user_.find(user_id);
    if (it == by_user_.end()) {
        return {};
    }
    return it->second;
}

std::set<std::string> ConnectionRegistry::ConnectionsForRole(Role role) const {
    auto it = by_role_.find(role);
    if (it == by_role_.end()) {
        return {};
    }
    return it->second;
}

bool ConnectionRegistry::IsOnline(const std::string& user_id) const {
    return by_user_.count(user_id) > 0;
}

std::size_t ConnectionRegistry::OnlineUsersWithRole(Role role) const {
    std::set<std::string> users;
    for (const auto& id : ConnectionsForRole(role)) {
        const auto* connection = Get(id);
        if (connection && connection->user_id) {
            users.insert(*connection->user_id);
        }
    }
    return users.size();
}

const Connection* ConnectionRegistry::Get(const std::string& connection_id) const {
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::shared_ptr<OutboundChannel> ConnectionRegistry::Channel(const std::string& connection_id) const {
    const auto* connection = Get(connection_id);
    return connection ? connection->channel : nullptr;
}

ConnectionMetrics ConnectionRegistry::GetMetrics() const {
    ConnectionMetrics metrics;
    metrics.total_connections = total_connections_;
    metrics.active_connections = connections_.size();
    metrics.online_users = by_user_.size();
    for (const auto& entry : by_role_) {
        metrics.connections_by_role[entry.first] = entry.second.size();
    }
    return metrics;
}

void ConnectionRegistry::Sweep() {
    const auto now = scheduler_.Now();
    const auto inactivity = std::chrono::milliseconds(config_.inactivity_threshold_ms);
    const auto ping_timeout = std::chrono::milliseconds(config_.ping_timeout_ms);

    std::vector<std::string> expired;
    std::size_t pinged = 0;
    for (auto& entry : connections_) {
        Connection& connection = entry.second;
        if (connection.ping_sent_at) {
            if (now - *connection.ping_sent_at >= ping_timeout) {
                expired.push_back(connection.connection_id);
            }
            continue;
        }
        if (now - connection.last_activity < inactivity) {
            continue;
        }
        connection.ping_sent_at = now;
        ++pinged;
        if (connection.channel) {
            proto::dispatch::ServerEvent ping;
            ping.mutable_ping()->set_server_time(dispatch::common::UnixMillis());
            if (!connection.channel->Send(ping)) {
                DISPATCH_LOG_WARN("[Registry] Liveness ping to {} failed", connection.connection_id);
            }
        }
    }

    for (const auto& id : expired) {
        auto channel = Channel(id);
        Remove(id);
        if (channel) {
            channel->Close();
        }
        DISPATCH_LOG_INFO("[Registry] Closed idle connection {}", id);
    }
    if (pinged > 0 || !expired.empty()) {
        DISPATCH_LOG_INFO("[Registry] Sweep pinged={} closed={} active={}", pinged, expired.size(), connections_.size());
    }
}

void ConnectionRegistry::IndexConnection(const Connection& connection) {
    if (connection.user_id) {
        by_user_[*connection.user_id].insert(connection.connection_id);
    }
    by_role_[connection.role].insert(connection.connection_id);
}

void ConnectionRegistry::UnindexConnection(const Connection& connection) {
    if (connection.user_id) {
        auto it = by_user_.find(*connection.user_id);
        if (it != by_user_.end()) {
            it->second.erase(connection.connection_id);
            if (it->second.empty()) {
                by_user_.erase(it);
            }
        }
    }
    auto role_it = by_role_.find(connection.role);
    if (role_it != by_role_.end()) {
        role_it->second.erase(connection.connection_id);
        if (role_it->second.empty()) {
            by_role_.erase(role_it);
        }
    }
}

}
}
