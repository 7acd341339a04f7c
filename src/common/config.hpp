#pragma once

#include <map>
#include <string>
#include <vector>

namespace quota {
namespace common {

// 服务器配置结构体
struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 50061;
};

// 日志配置结构体
struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e][%^%l%$][%t] %v";
    bool console = true;
    std::string file = "";
};

// Mysql配置结构体
struct MysqlConfig {
    std::string host = "127.0.0.1";
    int port = 3306;
    std::string user = "dev";
    std::string password = "";
    std::string database = "device_quota";
    int pool_size = 8;
    int connection_timeout_ms = 500;
    int read_timeout_ms = 2000;
    int write_timeout_ms = 2000;
    int lock_wait_timeout_s = 2; // innodb_lock_wait_timeout, 限制分组行锁的等待时间
    bool enabled = false;
};

// 存储配置结构体
struct StorageConfig {
    MysqlConfig mysql;
};

// Redis配置结构体
struct RedisConfig {
    std::string host = "127.0.0.1";
    int port = 6379;
    std::string password = "";
    int db = 0;
    int pool_size = 4;
    int connection_timeout_ms = 200;
    int socket_timeout_ms = 200;
    int group_ttl_seconds = 30; // 分组定义(限额)的缓存时间
    bool enabled = false;
};

// 缓存配置结构体
struct CacheConfig {
    RedisConfig redis;
};

// 设备配额配置结构体
struct QuotaConfig {
    int session_timeout_seconds = 86400;   // 心跳 TTL
    int sweep_interval_seconds = 60;       // 过期清扫间隔
    int purge_after_seconds = 604800;      // 失效会话保留时间, 之后物理删除
    int lock_timeout_ms = 200;             // 单个分组临界区的最长等待
    int admit_timeout_ms = 2000;           // 单次准入的总时限 (含重试)
    int max_attempts = 3;
    int backoff_initial_ms = 20;
    int backoff_max_ms = 200;
    bool fail_open = false;                // 基础设施故障时是否放行, 默认拒绝
    std::map<std::string, int> default_limits{
        {"class_login", 1}, {"admin", 3}, {"teacher", 5}, {"student", 2}};
};

// 启动时预置的分组
struct GroupSeed {
    std::string group_id;
    std::string school_id;
    std::string kind;
    int limit = 0; // 0 表示使用 default_limits[kind]
    bool enabled = true;
};

// 应用配置结构体
struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
    StorageConfig storage;
    CacheConfig cache;
    QuotaConfig quota;
    std::vector<GroupSeed> groups;
};

}
}
