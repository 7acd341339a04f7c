#include "common/config_loader.hpp"

#include "config_path.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace quota {
namespace common {

namespace {

// 检测配置文件路径
std::string DetectConfigPath() {
    if (const char* env = std::getenv("DEVICE_QUOTA_CONFIG")) {
        return env;
    }
    return GetConfigPath("app.example.json");
}

void RequirePositive(int value, const char* name) {
    if (value <= 0) {
        throw std::runtime_error(std::string("Config value must be positive: ") + name);
    }
}

} // namespace

AppConfig ConfigLoader::Load(const std::string& path) {
    auto json = ReadFile(path);
    return FromJson(json);
}

AppConfig ConfigLoader::LoadFromString(const std::string& content) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(content, nullptr, true, true);
    } catch (const nlohmann::json::parse_error& ex) {
        throw std::runtime_error(std::string("Failed to parse config: ") + ex.what());
    }
    return FromJson(json);
}

AppConfig ConfigLoader::LoadFromEnvOrDefault() {
    return Load(DetectConfigPath());
}

nlohmann::json ConfigLoader::ReadFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    try {
        return nlohmann::json::parse(ifs, nullptr, true, true);
    } catch (const nlohmann::json::parse_error& ex) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + ex.what());
    }
}

// 从JSON对象构建配置结构体
AppConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    AppConfig cfg;
    // Server配置
    if (j.contains("server")) {
        const auto& server = j["server"];
        cfg.server.host = server.value("host", cfg.server.host);
        cfg.server.port = server.value("port", cfg.server.port);
    }
    // Logging配置
    if (j.contains("logging")) {
        const auto& logging = j["logging"];
        cfg.logging.level = logging.value("level", cfg.logging.level);
        cfg.logging.pattern = logging.value("pattern", cfg.logging.pattern);
        cfg.logging.console = logging.value("console", cfg.logging.console);
        cfg.logging.file = logging.value("file", cfg.logging.file);
    }
    // Storage配置
    if (j.contains("storage") && j["storage"].contains("mysql")) {
        const auto& mysql = j["storage"]["mysql"];
        auto& out = cfg.storage.mysql;
        out.host = mysql.value("host", out.host);
        out.port = mysql.value("port", out.port);
        out.user = mysql.value("user", out.user);
        out.password = mysql.value("password", out.password);
        out.database = mysql.value("database", out.database);
        out.pool_size = mysql.value("pool_size", out.pool_size);
        out.connection_timeout_ms = mysql.value("connection_timeout_ms", out.connection_timeout_ms);
        out.read_timeout_ms = mysql.value("read_timeout_ms", out.read_timeout_ms);
        out.write_timeout_ms = mysql.value("write_timeout_ms", out.write_timeout_ms);
        out.lock_wait_timeout_s = mysql.value("lock_wait_timeout_s", out.lock_wait_timeout_s);
        out.enabled = mysql.value("enabled", out.enabled);
    }
    // Cache配置
    if (j.contains("cache") && j["cache"].contains("redis")) {
        const auto& redis = j["cache"]["redis"];
        auto& out = cfg.cache.redis;
        out.host = redis.value("host", out.host);
        out.port = redis.value("port", out.port);
        out.password = redis.value("password", out.password);
        out.db = redis.value("db", out.db);
        out.pool_size = redis.value("pool_size", out.pool_size);
        out.connection_timeout_ms = redis.value("connection_timeout_ms", out.connection_timeout_ms);
        out.socket_timeout_ms = redis.value("socket_timeout_ms", out.socket_timeout_ms);
        out.group_ttl_seconds = redis.value("group_ttl_seconds", out.group_ttl_seconds);
        out.enabled = redis.value("enabled", out.enabled);
    }
    // Quota配置
    if (j.contains("quota")) {
        const auto& q = j["quota"];
        auto& out = cfg.quota;
        out.session_timeout_seconds = q.value("session_timeout_seconds", out.session_timeout_seconds);
        out.sweep_interval_seconds = q.value("sweep_interval_seconds", out.sweep_interval_seconds);
        out.purge_after_seconds = q.value("purge_after_seconds", out.purge_after_seconds);
        out.lock_timeout_ms = q.value("lock_timeout_ms", out.lock_timeout_ms);
        out.admit_timeout_ms = q.value("admit_timeout_ms", out.admit_timeout_ms);
        out.max_attempts = q.value("max_attempts", out.max_attempts);
        out.backoff_initial_ms = q.value("backoff_initial_ms", out.backoff_initial_ms);
        out.backoff_max_ms = q.value("backoff_max_ms", out.backoff_max_ms);
        out.fail_open = q.value("fail_open", out.fail_open);
        if (q.contains("default_limits")) {
            // 覆盖同名条目, 保留未提及的内置默认值
            for (const auto& item : q["default_limits"].items()) {
                out.default_limits[item.key()] = item.value().get<int>();
            }
        }
    }
    // 预置分组
    if (j.contains("groups")) {
        for (const auto& g : j["groups"]) {
            GroupSeed seed;
            seed.group_id = g.value("group_id", "");
            seed.school_id = g.value("school_id", "");
            seed.kind = g.value("kind", "");
            seed.limit = g.value("limit", 0);
            seed.enabled = g.value("enabled", true);
            cfg.groups.push_back(std::move(seed));
        }
    }
    Validate(cfg);
    return cfg;
}

void ConfigLoader::Validate(const AppConfig& cfg) {
    const auto& q = cfg.quota;
    RequirePositive(q.session_timeout_seconds, "quota.session_timeout_seconds");
    RequirePositive(q.sweep_interval_seconds, "quota.sweep_interval_seconds");
    RequirePositive(q.purge_after_seconds, "quota.purge_after_seconds");
    RequirePositive(q.lock_timeout_ms, "quota.lock_timeout_ms");
    RequirePositive(q.admit_timeout_ms, "quota.admit_timeout_ms");
    RequirePositive(q.max_attempts, "quota.max_attempts");
    RequirePositive(q.backoff_initial_ms, "quota.backoff_initial_ms");
    if (q.backoff_max_ms < q.backoff_initial_ms) {
        throw std::runtime_error("Config value quota.backoff_max_ms must not be below backoff_initial_ms");
    }
    for (const auto& [kind, limit] : q.default_limits) {
        if (limit <= 0) {
            throw std::runtime_error("Config default limit must be positive for kind: " + kind);
        }
    }
    for (const auto& g : cfg.groups) {
        if (g.group_id.empty()) {
            throw std::runtime_error("Config group entry without group_id");
        }
        if (g.limit < 0) {
            throw std::runtime_error("Config group limit must not be negative: " + g.group_id);
        }
    }
    RequirePositive(cfg.storage.mysql.pool_size, "storage.mysql.pool_size");
    RequirePositive(cfg.storage.mysql.lock_wait_timeout_s, "storage.mysql.lock_wait_timeout_s");
}

int DefaultLimitFor(const QuotaConfig& quota, const std::string& kind) {
    auto it = quota.default_limits.find(kind);
    if (it == quota.default_limits.end()) {
        return 1;
    }
    return it->second;
}

}
}
