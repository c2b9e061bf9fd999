#include "server/dispatch_context.hpp"

#include "cache/redis_location_cache.hpp"
#include "cache/redis_presence_store.hpp"
#include "cache/redis_queue_store.hpp"
#include "common/logger.hpp"
#include "core/auth/cached_session_repository.hpp"
#include "storage/mysql/connection_pool.hpp"
#include "storage/mysql/dispatch_repository.hpp"
#include "storage/mysql/options.hpp"
#include "storage/mysql/session_repository.hpp"

#include <utility>

namespace dispatch {
namespace server {

namespace {

// 创建Redis客户端, 未启用或连接失败时返回空指针
std::shared_ptr<dispatch::cache::RedisClient> CreateRedisClient(const dispatch::common::RedisConfig& config) {
    if (!config.enabled) {
        return nullptr;
    }
    auto client = std::make_shared<dispatch::cache::RedisClient>(config);
    auto status = client->Connect();
    if (!status.IsOk()) {
        DISPATCH_LOG_WARN("[Context] Redis init failed, fallback to in-process stores: {}", status.Message());
        return nullptr;
    }
    return client;
}

// 创建MySQL连接池, 未启用或首次连接失败时返回空指针
std::shared_ptr<dispatch::storage::ConnectionPool> CreateMysqlPool(const dispatch::common::MysqlConfig& config) {
    if (!config.enabled) {
        DISPATCH_LOG_WARN("[Context] MySQL backend disabled; using in-memory repositories");
        return nullptr;
    }
    auto pool = std::make_shared<dispatch::storage::ConnectionPool>(dispatch::storage::OptionsFromConfig(config));
    auto test_conn = pool->Acquire();
    if (!test_conn.IsOk()) {
        DISPATCH_LOG_ERROR("[Context] Failed to initialize MySQL connection: {}", test_conn.GetStatus().Message());
        return nullptr;
    }
    DISPATCH_LOG_INFO("[Context] MySQL connection pool initialized successfully");
    return pool;
}

} // namespace

Backends CreateInMemoryBackends(const dispatch::common::AppConfig& config) {
    Backends backends;
    backends.repository = std::make_shared<dispatch::core::InMemoryDispatchRepository>();
    backends.sessions = std::make_shared<dispatch::core::InMemorySessionRepository>();
    backends.presence = std::make_shared<dispatch::core::InMemoryPresenceStore>();
    backends.queue = std::make_shared<dispatch::core::InMemoryQueueStore>();
    backends.locations = std::make_shared<dispatch::core::InMemoryLocationCache>(
        config.assignment.location_ttl_seconds);
    return backends;
}

Backends CreateBackends(const dispatch::common::AppConfig& config) {
    Backends backends = CreateInMemoryBackends(config);

    auto pool = CreateMysqlPool(config.storage.mysql);
    if (pool) {
        backends.repository = std::make_shared<dispatch::storage::MySqlDispatchRepository>(pool);
        backends.sessions = std::make_shared<dispatch::storage::MySqlSessionRepository>(pool);
    }

    backends.redis = CreateRedisClient(config.cache.redis);
    if (backends.redis) {
        backends.sessions = std::make_shared<dispatch::core::CachedSessionRepository>(backends.sessions, backends.redis);
        backends.presence = std::make_shared<dispatch::cache::RedisPresenceStore>(
            backends.redis, config.presence.presence_ttl_seconds);
        backends.queue = std::make_shared<dispatch::cache::RedisQueueStore>(
            backends.redis, config.queue.message_ttl_seconds);
        backends.locations = std::make_shared<dispatch::cache::RedisLocationCache>(
            backends.redis, config.assignment.location_ttl_seconds);
    } else {
        DISPATCH_LOG_WARN("[Context] Redis unavailable; presence is local to node {}", config.server.node_id);
    }
    return backends;
}

DispatchContext::DispatchContext(dispatch::common::Scheduler& scheduler,
                                 const dispatch::common::AppConfig& config,
                                 Backends backends)
    : config_(config)
    , backends_(std::move(backends)) {
    const std::string& node_id = config_.server.node_id;
    registry_ = std::make_unique<dispatch::core::ConnectionRegistry>(scheduler, config_.registry);
    broadcaster_ = std::make_unique<dispatch::core::PresenceBroadcaster>(
        scheduler, *registry_, backends_.presence, config_.presence, node_id);
    registry_->AddListener(broadcaster_.get());
    queue_ = std::make_unique<dispatch::core::OfflineMessageQueue>(scheduler, backends_.queue, config_.queue);
    router_ = std::make_unique<dispatch::core::EventRouter>(*registry_, *queue_, backends_.presence, node_id);
    engine_ = std::make_unique<dispatch::core::AssignmentEngine>(
        scheduler, backends_.repository, backends_.locations, *router_, config_.assignment);
    authenticator_ = std::make_unique<dispatch::core::Authenticator>(backends_.sessions, config_.auth);
    gateway_ = std::make_unique<DispatchGateway>(scheduler, *registry_, *broadcaster_, *queue_, *router_,
                                                 *engine_, *authenticator_, backends_.presence, config_);
}

} // namespace server
} // namespace dispatch
