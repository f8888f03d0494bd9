#include "config/config.h"
#include <yaml-cpp/yaml.h>
#include <stdexcept>
#include <sstream>
#include <cstdlib>
#include <cstring>

namespace token_service {

namespace {

bool ParseBoolEnv(const char* value) {
    return std::strcmp(value, "1") == 0 ||
           std::strcmp(value, "true") == 0 ||
           std::strcmp(value, "TRUE") == 0 ||
           std::strcmp(value, "yes") == 0;
}

}  // namespace

// 配置加载完成后，添加合法性校验
void ValidateConfig(const Config& config) {
    // 校验端口合法性（1-65535）
    if (config.server.grpc_port <= 0 || config.server.grpc_port > 65535) {
        throw std::runtime_error("Invalid gRPC port: " + std::to_string(config.server.grpc_port));
    }

    // 存储后端
    if (config.storage.backend != "memory" && config.storage.backend != "mysql") {
        throw std::runtime_error("Unknown storage backend: " + config.storage.backend);
    }
    if (config.storage.UseMySQL()) {
        if (config.mysql.port <= 0 || config.mysql.port > 65535) {
            throw std::runtime_error("Invalid MySQL port: " + std::to_string(config.mysql.port));
        }
        if (config.mysql.pool_size <= 0) {
            throw std::runtime_error("Invalid MySQL pool size: " + std::to_string(config.mysql.pool_size));
        }
        if (config.mysql.host.empty()) {
            throw std::runtime_error("MySQL host is empty");
        }
        if (config.mysql.database.empty()) {
            throw std::runtime_error("MySQL database is empty");
        }
    }

    // ============ Security ============
    if (config.security.jwt_issuer.empty()) {
        throw std::runtime_error("JWT issuer is empty");
    }
    if (config.security.access_token_ttl_seconds <= 0) {
        throw std::runtime_error("Invalid access token TTL: " +
            std::to_string(config.security.access_token_ttl_seconds));
    }
    if (config.security.refresh_token_ttl_seconds <= 0) {
        throw std::runtime_error("Invalid refresh token TTL: " +
            std::to_string(config.security.refresh_token_ttl_seconds));
    }
    // Refresh Token TTL 应该大于 Access Token TTL
    if (config.security.refresh_token_ttl_seconds <= config.security.access_token_ttl_seconds) {
        throw std::runtime_error("Refresh token TTL should be greater than access token TTL");
    }
    if (config.security.clock_skew_seconds < 0) {
        throw std::runtime_error("Invalid clock skew: " +
            std::to_string(config.security.clock_skew_seconds));
    }
    if (config.security.jwks_max_age_seconds < 0 ||
        config.security.jwks_stale_while_revalidate_seconds < 0) {
        throw std::runtime_error("Invalid JWKS cache settings");
    }
    if (config.security.signing_key_cache_seconds <= 0 ||
        (config.security.jwks_max_age_seconds > 0 &&
         config.security.signing_key_cache_seconds > config.security.jwks_max_age_seconds)) {
        throw std::runtime_error("Invalid signing key cache: " +
            std::to_string(config.security.signing_key_cache_seconds) + " seconds");
    }

    // ============ Lockout：阈值与时长都必须严格递增 ============
    const auto& tiers = config.lockout.tiers;
    if (tiers.empty()) {
        throw std::runtime_error("Lockout tiers are empty");
    }
    for (size_t i = 0; i < tiers.size(); ++i) {
        if (tiers[i].threshold <= 0 || tiers[i].duration_seconds <= 0) {
            throw std::runtime_error("Invalid lockout tier #" + std::to_string(i));
        }
        if (i > 0 && (tiers[i].threshold <= tiers[i - 1].threshold ||
                      tiers[i].duration_seconds <= tiers[i - 1].duration_seconds)) {
            throw std::runtime_error("Lockout tiers must escalate: tier #" + std::to_string(i));
        }
    }
    if (config.lockout.shard_count <= 0) {
        throw std::runtime_error("Invalid lockout shard count: " +
            std::to_string(config.lockout.shard_count));
    }
    if (config.lockout.sweep_interval_seconds <= 0) {
        throw std::runtime_error("Invalid lockout sweep interval: " +
            std::to_string(config.lockout.sweep_interval_seconds));
    }

    // ============ Rate limit ============
    const auto& rate = config.rate_limit;
    if (rate.enabled) {
        for (const auto* rule : {&rate.login, &rate.refresh}) {
            if (rule->max_requests <= 0 || rule->window_seconds <= 0) {
                throw std::runtime_error("Invalid rate limit rule: " +
                    std::to_string(rule->max_requests) + " per " +
                    std::to_string(rule->window_seconds) + " seconds");
            }
        }
        if (rate.shard_count <= 0) {
            throw std::runtime_error("Invalid rate limit shard count: " +
                std::to_string(rate.shard_count));
        }
    }

    // ============ Cleanup ============
    if (config.cleanup.interval_hours <= 0) {
        throw std::runtime_error("Invalid cleanup interval: " +
            std::to_string(config.cleanup.interval_hours));
    }

    if (config.admin.role.empty()) {
        throw std::runtime_error("Admin role is empty");
    }
}

Config Config::LoadFromFile(const std::string& path) {
    Config config;
    try {
        YAML::Node yaml = YAML::LoadFile(path);

        // Server
        if (yaml["server"]) {
            const auto& s = yaml["server"];
            if (s["host"]) config.server.host = s["host"].as<std::string>();
            if (s["grpc_port"]) config.server.grpc_port = s["grpc_port"].as<int>();
        }

        // Storage
        if (yaml["storage"]) {
            const auto& s = yaml["storage"];
            if (s["backend"]) config.storage.backend = s["backend"].as<std::string>();
        }

        // MySQL
        if (yaml["mysql"]) {
            const auto& m = yaml["mysql"];
            if (m["host"]) config.mysql.host = m["host"].as<std::string>();
            if (m["port"]) config.mysql.port = m["port"].as<int>();
            if (m["database"]) config.mysql.database = m["database"].as<std::string>();
            if (m["username"]) config.mysql.username = m["username"].as<std::string>();
            if (m["password"]) config.mysql.password = m["password"].as<std::string>();
            if (m["pool_size"]) config.mysql.pool_size = m["pool_size"].as<int>();
            if (m["connection_timeout_ms"]) config.mysql.connection_timeout_ms = m["connection_timeout_ms"].as<unsigned int>();
            if (m["read_timeout_ms"]) config.mysql.read_timeout_ms = m["read_timeout_ms"].as<unsigned int>();
            if (m["write_timeout_ms"]) config.mysql.write_timeout_ms = m["write_timeout_ms"].as<unsigned int>();
            if (m["max_retries"]) config.mysql.max_retries = m["max_retries"].as<unsigned int>();
            if (m["retry_interval_ms"]) config.mysql.retry_interval_ms = m["retry_interval_ms"].as<unsigned int>();
            if (m["auto_reconnect"]) config.mysql.auto_reconnect = m["auto_reconnect"].as<bool>();
            if (m["charset"]) config.mysql.charset = m["charset"].as<std::string>();
        }

        // ============ Security ============
        if (yaml["security"]) {
            const auto& s = yaml["security"];
            if (s["jwt_issuer"])
                config.security.jwt_issuer = s["jwt_issuer"].as<std::string>();
            if (s["jwt_audience"])
                config.security.jwt_audience = s["jwt_audience"].as<std::string>();
            if (s["access_token_ttl_seconds"])
                config.security.access_token_ttl_seconds = s["access_token_ttl_seconds"].as<int64_t>();
            if (s["refresh_token_ttl_seconds"])
                config.security.refresh_token_ttl_seconds = s["refresh_token_ttl_seconds"].as<int64_t>();
            if (s["enable_jti_denylist"])
                config.security.enable_jti_denylist = s["enable_jti_denylist"].as<bool>();
            if (s["clock_skew_seconds"])
                config.security.clock_skew_seconds = s["clock_skew_seconds"].as<int64_t>();
            if (s["jwks_max_age_seconds"])
                config.security.jwks_max_age_seconds = s["jwks_max_age_seconds"].as<int>();
            if (s["jwks_stale_while_revalidate_seconds"])
                config.security.jwks_stale_while_revalidate_seconds =
                    s["jwks_stale_while_revalidate_seconds"].as<int>();
            if (s["signing_key_cache_seconds"])
                config.security.signing_key_cache_seconds = s["signing_key_cache_seconds"].as<int>();
        }

        // ============ Lockout ============
        if (yaml["lockout"]) {
            const auto& l = yaml["lockout"];
            if (l["tiers"] && l["tiers"].IsSequence()) {
                config.lockout.tiers.clear();
                for (const auto& t : l["tiers"]) {
                    LockoutTier tier;
                    tier.threshold = t["threshold"].as<int>();
                    tier.duration_seconds = t["duration_seconds"].as<int64_t>();
                    config.lockout.tiers.push_back(tier);
                }
            }
            if (l["shard_count"])
                config.lockout.shard_count = l["shard_count"].as<int>();
            if (l["sweep_interval_seconds"])
                config.lockout.sweep_interval_seconds = l["sweep_interval_seconds"].as<int>();
        }

        // ============ Rate limit ============
        if (yaml["rate_limit"]) {
            const auto& r = yaml["rate_limit"];
            auto load_rule = [](const YAML::Node& node, RateLimitRule& rule) {
                if (!node) return;
                if (node["max_requests"]) rule.max_requests = node["max_requests"].as<int>();
                if (node["window_seconds"]) rule.window_seconds = node["window_seconds"].as<int>();
            };
            if (r["enabled"]) config.rate_limit.enabled = r["enabled"].as<bool>();
            if (r["shard_count"]) config.rate_limit.shard_count = r["shard_count"].as<int>();
            load_rule(r["login"], config.rate_limit.login);
            load_rule(r["refresh"], config.rate_limit.refresh);
        }

        // ============ Cleanup ============
        if (yaml["cleanup"]) {
            const auto& c = yaml["cleanup"];
            if (c["interval_hours"]) config.cleanup.interval_hours = c["interval_hours"].as<int>();
            if (c["run_on_start"]) config.cleanup.run_on_start = c["run_on_start"].as<bool>();
        }

        if (yaml["admin"]) {
            const auto& a = yaml["admin"];
            if (a["role"]) config.admin.role = a["role"].as<std::string>();
        }

        // Log
        if (yaml["log"]) {
            const auto& l = yaml["log"];
            if (l["level"]) config.log.level = l["level"].as<std::string>();
            if (l["path"]) config.log.path = l["path"].as<std::string>();
            if (l["filename"]) config.log.filename = l["filename"].as<std::string>();
            if (l["max_size"]) config.log.max_size = l["max_size"].as<size_t>();
            if (l["max_files"]) config.log.max_files = l["max_files"].as<int>();
            if (l["console_output"]) config.log.console_output = l["console_output"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config: " + std::string(e.what()));
    }

    ValidateConfig(config);
    return config;
}

void Config::LoadFromEnv() {
    // Storage / MySQL
    if (const char* env = std::getenv("STORAGE_BACKEND")) storage.backend = env;
    if (const char* env = std::getenv("MYSQL_HOST")) mysql.host = env;
    if (const char* env = std::getenv("MYSQL_PASSWORD")) mysql.password = env;

    // Security
    if (const char* env = std::getenv("JWT_ISSUER")) security.jwt_issuer = env;
    if (const char* env = std::getenv("JWT_AUDIENCE")) security.jwt_audience = env;
    if (const char* env = std::getenv("ACCESS_TOKEN_TTL")) {
        security.access_token_ttl_seconds = std::atoll(env);
    }
    if (const char* env = std::getenv("REFRESH_TOKEN_TTL")) {
        security.refresh_token_ttl_seconds = std::atoll(env);
    }
    if (const char* env = std::getenv("ENABLE_JTI_DENYLIST")) {
        security.enable_jti_denylist = ParseBoolEnv(env);
    }

    // Rate limit
    if (const char* env = std::getenv("RATE_LIMIT_ENABLED")) {
        rate_limit.enabled = ParseBoolEnv(env);
    }

    // Cleanup
    if (const char* env = std::getenv("CLEANUP_INTERVAL_HOURS")) {
        cleanup.interval_hours = std::atoi(env);
    }

    if (const char* env = std::getenv("LOG_LEVEL")) log.level = env;
}

int64_t LockoutConfig::WidestTierSeconds() const {
    int64_t widest = 0;
    for (const auto& t : tiers) {
        if (t.duration_seconds > widest) widest = t.duration_seconds;
    }
    return widest;
}

// ========================== ToString 实现 ==========================

std::string ServerConfig::ToString() const {
    std::ostringstream oss;
    oss << "=== Server Config ===" << std::endl;
    oss << "Host: " << host << std::endl;
    oss << "gRPC Port: " << grpc_port << std::endl;
    return oss.str();
}

std::string StorageConfig::ToString() const {
    std::ostringstream oss;
    oss << "=== Storage Config ===" << std::endl;
    oss << "Backend: " << backend << std::endl;
    return oss.str();
}

std::string MySQLConfig::ToString() const {
    std::ostringstream oss;
    oss << "=== MySQL Config ===" << std::endl;
    oss << "Host: " << host << std::endl;
    oss << "Port: " << port << std::endl;
    oss << "Database: " << database << std::endl;
    oss << "Username: " << username << std::endl;
    oss << "Password: " << (password.empty() ? "(empty)" : "******") << std::endl;
    oss << "Pool Size: " << pool_size << std::endl;
    oss << "Connection Timeout(ms): "
        << (connection_timeout_ms ? std::to_string(*connection_timeout_ms) : "(not set)") << std::endl;
    oss << "Read Timeout(ms): "
        << (read_timeout_ms ? std::to_string(*read_timeout_ms) : "(not set)") << std::endl;
    oss << "Write Timeout(ms): "
        << (write_timeout_ms ? std::to_string(*write_timeout_ms) : "(not set)") << std::endl;
    oss << "Max Retries: " << max_retries << std::endl;
    oss << "Retry Interval(ms): " << retry_interval_ms << std::endl;
    oss << "Charset: " << charset << std::endl;
    return oss.str();
}

std::string SecurityConfig::ToString() const {
    std::ostringstream oss;
    oss << "=== Security Config ===" << std::endl;
    oss << "JWT Issuer: " << jwt_issuer << std::endl;
    oss << "JWT Default Audience: " << jwt_audience << std::endl;
    oss << "Access Token TTL: " << access_token_ttl_seconds << " seconds ("
        << access_token_ttl_seconds / 60 << " minutes)" << std::endl;
    oss << "Refresh Token TTL: " << refresh_token_ttl_seconds << " seconds ("
        << refresh_token_ttl_seconds / 86400 << " days)" << std::endl;
    oss << "JTI Denylist: " << (enable_jti_denylist ? "enabled" : "disabled") << std::endl;
    oss << "Clock Skew: " << clock_skew_seconds << " seconds" << std::endl;
    oss << "JWKS Cache: max-age=" << jwks_max_age_seconds
        << ", stale-while-revalidate=" << jwks_stale_while_revalidate_seconds << std::endl;
    oss << "Signing Key Cache: " << signing_key_cache_seconds << " seconds" << std::endl;
    return oss.str();
}

std::string LockoutConfig::ToString() const {
    std::ostringstream oss;
    oss << "=== Lockout Config ===" << std::endl;
    for (const auto& t : tiers) {
        oss << "Tier: >= " << t.threshold << " failures -> "
            << t.duration_seconds << " seconds" << std::endl;
    }
    oss << "Shards: " << shard_count << std::endl;
    oss << "Sweep Interval: " << sweep_interval_seconds << " seconds" << std::endl;
    return oss.str();
}

std::string RateLimitConfig::ToString() const {
    std::ostringstream oss;
    oss << "=== Rate Limit Config ===" << std::endl;
    oss << "Enabled: " << (enabled ? "true" : "false") << std::endl;
    oss << "Login: " << login.max_requests << " per " << login.window_seconds << " seconds" << std::endl;
    oss << "Refresh: " << refresh.max_requests << " per " << refresh.window_seconds << " seconds" << std::endl;
    oss << "Shards: " << shard_count << std::endl;
    return oss.str();
}

std::string CleanupConfig::ToString() const {
    std::ostringstream oss;
    oss << "=== Cleanup Config ===" << std::endl;
    oss << "Interval: " << interval_hours << " hours" << std::endl;
    oss << "Run On Start: " << (run_on_start ? "true" : "false") << std::endl;
    return oss.str();
}

std::string AdminConfig::ToString() const {
    std::ostringstream oss;
    oss << "=== Admin Config ===" << std::endl;
    oss << "Role: " << role << std::endl;
    return oss.str();
}

std::string LogConfig::ToString() const {
    std::ostringstream oss;
    oss << "=== Log Config ===" << std::endl;
    oss << "Level: " << level << std::endl;
    oss << "Path: " << path << std::endl;
    oss << "Filename: " << filename << std::endl;
    oss << "Max Size: " << max_size << " bytes ("
        << max_size / (1024 * 1024) << " MB)" << std::endl;
    oss << "Max Files: " << max_files << std::endl;
    oss << "Console Output: " << (console_output ? "true" : "false") << std::endl;
    return oss.str();
}

std::string Config::ToString() const {
    std::ostringstream oss;
    oss << server.ToString() << std::endl;
    oss << storage.ToString() << std::endl;
    if (storage.UseMySQL()) {
        oss << mysql.ToString() << std::endl;
    }
    oss << security.ToString() << std::endl;
    oss << lockout.ToString() << std::endl;
    oss << rate_limit.ToString() << std::endl;
    oss << cleanup.ToString() << std::endl;
    oss << admin.ToString() << std::endl;
    oss << log.ToString();
    return oss.str();
}

}  // namespace token_service
