#include "common/config_loader.hpp"

#include "config_path.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace dispatch {
namespace common {

AppConfig ConfigLoader::Load(const std::string& path) {
    auto json = ReadFile(path);
    return FromJson(json);
}

AppConfig ConfigLoader::LoadFromEnvOrDefault() {
    return Load(ResolveConfigPath(0, nullptr));
}

std::string ResolveConfigPath(int argc, char** argv) {
    if (argc > 1 && argv != nullptr) {
        return argv[1];
    }
    if (const char* env = std::getenv("DISPATCH_SERVER_CONFIG")) {
        return env;
    }
    return GetConfigPath("app.example.json");
}

nlohmann::json ConfigLoader::ReadFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    return nlohmann::json::parse(ifs, nullptr, true, true);
}

// 从JSON对象构建配置结构体, 缺省字段保留默认值
AppConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    AppConfig cfg;
    // Server配置
    if (j.contains("server")) {
        const auto& server = j["server"];
        cfg.server.host = server.value("host", cfg.server.host);
        cfg.server.port = server.value("port", cfg.server.port);
        cfg.server.node_id = server.value("node_id", cfg.server.node_id);
    }
    if (cfg.server.node_id.empty()) {
        cfg.server.node_id = cfg.server.host + ":" + std::to_string(cfg.server.port);
    }
    // Logging配置
    if (j.contains("logging")) {
        const auto& logging = j["logging"];
        cfg.logging.level = logging.value("level", cfg.logging.level);
        cfg.logging.pattern = logging.value("pattern", cfg.logging.pattern);
        cfg.logging.console = logging.value("console", cfg.logging.console);
        cfg.logging.file = logging.value("file", cfg.logging.file);
        cfg.logging.max_file_size_mb = logging.value("max_file_size_mb", cfg.logging.max_file_size_mb);
        cfg.logging.max_files = logging.value("max_files", cfg.logging.max_files);
    }
    // Cache配置
    if (j.contains("cache") && j["cache"].contains("redis")) {
        const auto& redis = j["cache"]["redis"];
        cfg.cache.redis.host = redis.value("host", cfg.cache.redis.host);
        cfg.cache.redis.port = redis.value("port", cfg.cache.redis.port);
        cfg.cache.redis.password = redis.value("password", cfg.cache.redis.password);
        cfg.cache.redis.db = redis.value("db", cfg.cache.redis.db);
        cfg.cache.redis.pool_size = redis.value("pool_size", cfg.cache.redis.pool_size);
        cfg.cache.redis.connection_timeout_ms = redis.value("connection_timeout_ms", cfg.cache.redis.connection_timeout_ms);
        cfg.cache.redis.socket_timeout_ms = redis.value("socket_timeout_ms", cfg.cache.redis.socket_timeout_ms);
        cfg.cache.redis.enabled = redis.value("enabled", cfg.cache.redis.enabled);
    }
    // Storage配置
    if (j.contains("storage") && j["storage"].contains("mysql")) {
        const auto& mysql = j["storage"]["mysql"];
        cfg.storage.mysql.host = mysql.value("host", cfg.storage.mysql.host);
        cfg.storage.mysql.port = mysql.value("port", cfg.storage.mysql.port);
        cfg.storage.mysql.user = mysql.value("user", cfg.storage.mysql.user);
        cfg.storage.mysql.password = mysql.value("password", cfg.storage.mysql.password);
        cfg.storage.mysql.database = mysql.value("database", cfg.storage.mysql.database);
        cfg.storage.mysql.pool_size = mysql.value("pool_size", cfg.storage.mysql.pool_size);
        cfg.storage.mysql.connection_timeout_ms = mysql.value("connection_timeout_ms", cfg.storage.mysql.connection_timeout_ms);
        cfg.storage.mysql.read_timeout_ms = mysql.value("read_timeout_ms", cfg.storage.mysql.read_timeout_ms);
        cfg.storage.mysql.write_timeout_ms = mysql.value("write_timeout_ms", cfg.storage.mysql.write_timeout_ms);
        cfg.storage.mysql.enabled = mysql.value("enabled", cfg.storage.mysql.enabled);
    }
    // Auth配置
    if (j.contains("auth")) {
        const auto& auth = j["auth"];
        cfg.auth.reconnect_token_ttl_seconds = auth.value("reconnect_token_ttl_seconds", cfg.auth.reconnect_token_ttl_seconds);
        cfg.auth.allow_dev_tokens = auth.value("allow_dev_tokens", cfg.auth.allow_dev_tokens);
    }
    // Registry配置
    if (j.contains("registry")) {
        const auto& registry = j["registry"];
        cfg.registry.sweep_interval_ms = registry.value("sweep_interval_ms", cfg.registry.sweep_interval_ms);
        cfg.registry.inactivity_threshold_ms = registry.value("inactivity_threshold_ms", cfg.registry.inactivity_threshold_ms);
        cfg.registry.ping_timeout_ms = registry.value("ping_timeout_ms", cfg.registry.ping_timeout_ms);
    }
    // Presence配置
    if (j.contains("presence")) {
        const auto& presence = j["presence"];
        cfg.presence.grace_window_ms = presence.value("grace_window_ms", cfg.presence.grace_window_ms);
        cfg.presence.audience_roles = presence.value("audience_roles", cfg.presence.audience_roles);
        cfg.presence.share_publicly = presence.value("share_publicly", cfg.presence.share_publicly);
        cfg.presence.presence_ttl_seconds = presence.value("presence_ttl_seconds", cfg.presence.presence_ttl_seconds);
    }
    // Queue配置
    if (j.contains("queue")) {
        const auto& queue = j["queue"];
        cfg.queue.message_ttl_seconds = queue.value("message_ttl_seconds", cfg.queue.message_ttl_seconds);
        cfg.queue.sweep_interval_ms = queue.value("sweep_interval_ms", cfg.queue.sweep_interval_ms);
    }
    // Assignment配置
    if (j.contains("assignment")) {
        const auto& assignment = j["assignment"];
        cfg.assignment.max_radius_km = assignment.value("max_radius_km", cfg.assignment.max_radius_km);
        cfg.assignment.max_claim_attempts = assignment.value("max_claim_attempts", cfg.assignment.max_claim_attempts);
        cfg.assignment.transient_retries = assignment.value("transient_retries", cfg.assignment.transient_retries);
        cfg.assignment.retry_backoff_ms = assignment.value("retry_backoff_ms", cfg.assignment.retry_backoff_ms);
        cfg.assignment.default_rating = assignment.value("default_rating", cfg.assignment.default_rating);
        cfg.assignment.next_request_radius_km = assignment.value("next_request_radius_km", cfg.assignment.next_request_radius_km);
        cfg.assignment.pending_scan_limit = assignment.value("pending_scan_limit", cfg.assignment.pending_scan_limit);
        cfg.assignment.assumed_speed_kmh = assignment.value("assumed_speed_kmh", cfg.assignment.assumed_speed_kmh);
        cfg.assignment.location_ttl_seconds = assignment.value("location_ttl_seconds", cfg.assignment.location_ttl_seconds);
    }
    return cfg;
}

}
}
