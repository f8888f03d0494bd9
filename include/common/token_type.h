#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include "common/time_utils.h"
#include "entity/user_entity.h"

namespace token_service{

inline constexpr const char* kAccessTokenIdPrefix = "at_";
inline constexpr const char* kRefreshTokenPrefix = "rt_";
inline constexpr const char* kKeyIdPrefix = "key_";
inline constexpr const char* kBearerTokenType = "Bearer";

// ==================== Token 对 ====================
struct TokenPair {
    std::string access_token;
    std::string refresh_token;      // rt_<64 hex>
    int64_t expires_in = 0;         // access token 有效期（秒）
    std::string token_type = kBearerTokenType;
};

// ==================== Access Token Claims ====================
// 签发与校验共用；校验成功后原样返回签发时的 claims
struct AccessTokenClaims {
    std::string iss;
    std::string aud;
    std::string sub;                // 用户 ID
    std::string role;
    int64_t token_version = 0;      // JSON 字段名 "tv"
    std::string jti;
    int64_t iat = 0;
    int64_t nbf = 0;
    int64_t exp = 0;
    std::string email;              // 可选
    std::string app_id;             // 可选
    std::string kid;                // 来自 header，便于排查
};

struct IssuedAccessToken {
    std::string token;
    AccessTokenClaims claims;
};

// ==================== 登录结果 ====================
struct LoginResult {
    UserEntity user;
    TokenPair tokens;
};

// ==================== 锁定状态 ====================
struct LockoutStatus {
    bool locked = false;
    int64_t retry_after_seconds = 0;    // 锁定剩余时间（仅 locked=true 时有意义）
    int failure_count = 0;
};

// ==================== 限流 ====================
enum class RateLimitScope {
    Login,
    Refresh,
};

struct RateLimitStatus {
    bool allowed = true;
    int64_t retry_after_seconds = 0;    // 当前窗口剩余时间（仅 allowed=false 时有意义）
    int remaining = 0;                  // 当前窗口剩余可用次数
};

// ==================== 内省结果 ====================
enum class TokenKindTag {
    Unknown = 0,
    Access = 1,
    Refresh = 2,
};

struct IntrospectionResult {
    bool active = false;
    TokenKindTag kind = TokenKindTag::Unknown;
    std::string user_id;
    std::string app_id;
    int64_t expires_at = 0;                     // Unix 秒
    std::optional<AccessTokenClaims> claims;    // kind=Access 且 active 时
    std::optional<std::string> record_id;       // kind=Refresh 且 active 时
};

}
