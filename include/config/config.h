// include/config/config.h
#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace token_service {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int grpc_port = 50051;

    std::string ToString() const;
};

// 存储后端：memory（默认，单进程）| mysql
struct StorageConfig {
    std::string backend = "memory";

    bool UseMySQL() const { return backend == "mysql"; }

    std::string ToString() const;
};

struct MySQLConfig {
    //基本连接信息
    std::string host = "localhost";
    int port = 3306;
    std::string database = "token_service";
    std::string username = "root";
    std::string password = "";
    int pool_size = 8;

    //超时配置(ms)：认证在每个受保护请求的关键路径上，超时宁短勿长
    std::optional<unsigned int> connection_timeout_ms = 3000;
    std::optional<unsigned int> read_timeout_ms = 3000;
    std::optional<unsigned int> write_timeout_ms = 3000;

    //重试配置
    unsigned int max_retries = 3;
    unsigned int retry_interval_ms = 1000;

    std::optional<bool> auto_reconnect;
    std::string charset = "utf8mb4";

    int GetPoolSize() const { return pool_size; }

    std::string ToString() const;
};

// ============ Token / 密钥安全配置 ============
struct SecurityConfig {
    std::string jwt_issuer = "https://turkey.example.com";
    std::string jwt_audience = "turkey-api";        // issue 时未指定 audience 的默认值
    int64_t access_token_ttl_seconds = 900;         // 15 分钟
    int64_t refresh_token_ttl_seconds = 7776000;    // 90 天
    bool enable_jti_denylist = false;               // 验签时是否查询 JTI 黑名单
    int64_t clock_skew_seconds = 0;                 // exp / nbf 允许的时钟偏差

    // JWKS 发布缓存
    int jwks_max_age_seconds = 900;
    int jwks_stale_while_revalidate_seconds = 300;

    // 进程内"当前签名密钥"缓存的有效期；其他实例轮换 / 退役后最迟在此时间内生效
    int signing_key_cache_seconds = 60;

    std::string ToString() const;
};

// ============ 登录失败锁定 ============
struct LockoutTier {
    int threshold = 0;            // 失败次数达到该值即进入此档
    int64_t duration_seconds = 0; // 锁定时长
};

struct LockoutConfig {
    std::vector<LockoutTier> tiers = {
        {5, 300},     // 5 次 → 5 分钟
        {10, 900},    // 10 次 → 15 分钟
        {20, 3600},   // 20 次 → 1 小时
    };
    int shard_count = 16;
    int sweep_interval_seconds = 900;

    // 最长一档的锁定时长：超过该时长未活动的记录可被清理
    int64_t WidestTierSeconds() const;

    std::string ToString() const;
};

// ============ 按来源限流（固定窗口） ============
struct RateLimitRule {
    int max_requests = 0;         // 窗口内允许的请求数
    int window_seconds = 0;
};

struct RateLimitConfig {
    bool enabled = true;
    RateLimitRule login{50, 900};     // 每个来源 15 分钟 50 次
    RateLimitRule refresh{200, 900};  // 每个来源 15 分钟 200 次
    int shard_count = 16;

    std::string ToString() const;
};

// ============ 后台清理任务 ============
struct CleanupConfig {
    int interval_hours = 24;
    bool run_on_start = true;

    std::string ToString() const;
};

// ============ 管理接口 ============
struct AdminConfig {
    std::string role = "admin";   // 调用管理 RPC 所需的 Access Token role

    std::string ToString() const;
};

struct LogConfig {
    std::string level = "info";
    std::string path = "./logs";
    std::string filename = "token_service.log";
    size_t max_size = 10 * 1024 * 1024;
    int max_files = 5;
    bool console_output = true;

    std::string ToString() const;
};

struct Config {
    ServerConfig server;
    StorageConfig storage;
    MySQLConfig mysql;
    SecurityConfig security;
    LockoutConfig lockout;
    RateLimitConfig rate_limit;
    CleanupConfig cleanup;
    AdminConfig admin;
    LogConfig log;

    /// @brief 从 YAML 文件加载（缺省字段保留默认值），加载后执行 ValidateConfig
    /// @throws std::runtime_error 文件不可读 / YAML 格式错误 / 校验失败
    static Config LoadFromFile(const std::string& path);

    /// @brief 使用环境变量覆盖部分字段（部署时注入敏感信息）
    void LoadFromEnv();

    std::string ToString() const;
};

/// @throws std::runtime_error 配置不合法
void ValidateConfig(const Config& config);

}  // namespace token_service
