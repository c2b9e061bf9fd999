#pragma once

#include <string>
#include <vector>

namespace dispatch {
namespace common {

// 服务器配置结构体
struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 50061;
    std::string node_id = ""; // 为空时使用 host:port
};

// 日志配置结构体
struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e][%^%l%$][%t] %v";
    bool console = true;
    std::string file = "";
    int max_file_size_mb = 0; // 大于 0 时按大小滚动
    int max_files = 3;
};

// Redis配置结构体
struct RedisConfig {
    std::string host = "127.0.0.1";
    int port = 6379;
    std::string password = "";
    int db = 0;
    int pool_size = 4;
    int connection_timeout_ms = 500;
    int socket_timeout_ms = 1000;
    bool enabled = false;
};

// 缓存配置结构体
struct CacheConfig {
    RedisConfig redis;
};

// Mysql配置结构体
struct MysqlConfig {
    std::string host = "127.0.0.1";
    int port = 3306;
    std::string user = "dev";
    std::string password = "";
    std::string database = "dispatch";
    int pool_size = 4;
    int connection_timeout_ms = 500;
    int read_timeout_ms = 2000;
    int write_timeout_ms = 2000;
    bool enabled = false;
};

// 存储配置结构体
struct StorageConfig {
    MysqlConfig mysql;
};

// 认证配置结构体
struct AuthConfig {
    int reconnect_token_ttl_seconds = 3600;
    bool allow_dev_tokens = false; // 允许 "<role>:<user_id>" 形式的调试令牌
};

// 连接注册表配置结构体
struct RegistryConfig {
    int sweep_interval_ms = 30000;        // 巡检周期
    int inactivity_threshold_ms = 300000; // 超过该空闲时间发送探活
    int ping_timeout_ms = 60000;         // 探活后仍无活动则强制关闭
};

// 在线状态配置结构体
struct PresenceConfig {
    int grace_window_ms = 5000; // 离线防抖窗口
    std::vector<std::string> audience_roles{"admin"};
    bool share_publicly = false;
    int presence_ttl_seconds = 300;
};

// 离线消息队列配置结构体
struct QueueConfig {
    int message_ttl_seconds = 86400;
    int sweep_interval_ms = 3600000;
};

// 派单配置结构体
struct AssignmentConfig {
    double max_radius_km = 10.0;
    int max_claim_attempts = 3;
    int transient_retries = 2;
    int retry_backoff_ms = 100;
    double default_rating = 3.0;
    double next_request_radius_km = 8.0;
    int pending_scan_limit = 10;
    double assumed_speed_kmh = 25.0;
    int location_ttl_seconds = 300;
};

// 应用配置结构体
struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
    CacheConfig cache;
    StorageConfig storage;
    AuthConfig auth;
    RegistryConfig registry;
    PresenceConfig presence;
    QueueConfig queue;
    AssignmentConfig assignment;
};

}
}
