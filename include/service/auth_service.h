#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/clock.h"
#include "common/result.h"
#include "common/token_type.h"
#include "config/config.h"
#include "entity/signing_key.h"
#include "entity/user_entity.h"
#include "keys/jwks_service.h"
#include "keys/key_manager.h"
#include "lockout/lockout_tracker.h"
#include "lockout/rate_limiter.h"
#include "refresh/refresh_rotation_service.h"
#include "revocation/revocation_denylist.h"
#include "token/token_issuer.h"
#include "token/token_verifier.h"
#include "user/password_verifier.h"
#include "user/user_store.h"

namespace token_service {

/// @brief 凭证门面：登录 / 刷新 / 登出 / 吊销 / 校验 / 内省 / 密钥管理
class AuthService {
public:
    AuthService(std::shared_ptr<Config> config,
                std::shared_ptr<KeyManager> key_manager,
                std::shared_ptr<JwksService> jwks,
                std::shared_ptr<TokenIssuer> issuer,
                std::shared_ptr<TokenVerifier> verifier,
                std::shared_ptr<RefreshRotationService> refresh,
                std::shared_ptr<RevocationDenylist> denylist,
                std::shared_ptr<LockoutTracker> lockout,
                std::shared_ptr<RateLimiter> rate_limiter,
                std::shared_ptr<UserStore> users,
                std::shared_ptr<PasswordVerifier> passwords,
                std::shared_ptr<Clock> clock);

    virtual ~AuthService() = default;

    // ==================== 签发 / 登录 ====================

    /// @brief audience 为空时使用配置的默认 audience；refresh 记录的 app_id 即最终 aud
    virtual Result<TokenPair> IssueTokenPair(const UserEntity& user, const std::string& audience);

    /**
     * @brief 口令登录
     *
     * 1. 来源超出登录限流 → RateLimited（retry 提示见 CheckRateLimit）
     * 2. 已锁定 → AccountLockedOut（retry 提示见 CheckLockout）
     * 3. 口令错误 → 记录失败，返回 InvalidCredentials（本次触发锁定也不例外，下一次才被拒）
     * 4. 成功 → 清除失败记录并签发 Token 对
     */
    virtual Result<LoginResult> Login(const std::string& email,
                                      const std::string& password,
                                      const std::string& origin,
                                      const std::string& audience);

    virtual LockoutStatus CheckLockout(const std::string& origin, const std::string& email);

    /// @brief 只读查询限流状态，不消耗配额
    virtual RateLimitStatus CheckRateLimit(RateLimitScope scope, const std::string& origin);

    // ==================== Refresh / 登出 ====================

    /// @brief 单次使用轮换；任何校验失败都归并为 RefreshTokenInvalidOrUsed
    /// 存储不可达时返回 ServiceUnavailable，来源超出刷新限流时返回 RateLimited
    virtual Result<TokenPair> RotateRefresh(const std::string& raw_refresh,
                                            const std::string& audience,
                                            const std::string& origin);

    /// @brief 幂等：未知或已吊销的 token 也返回成功；存储不可达时返回 ServiceUnavailable
    virtual Result<void> Logout(const std::string& raw_refresh);

    /// @brief token_version + 1 并吊销该用户全部 refresh token
    /// @return 新的 token_version
    virtual Result<int64_t> GlobalLogout(const std::string& user_id);

    // ==================== Access Token 吊销 / 校验 ====================

    virtual Result<void> RevokeAccessToken(const std::string& jti,
                                           const std::string& user_id,
                                           const std::string& app_id,
                                           TimePoint expires_at,
                                           const std::string& reason);

    /// @brief 先验签，再把 jti 加入黑名单直到 exp
    virtual Result<AccessTokenClaims> RevokeAccessTokenByValue(const std::string& token,
                                                               const std::string& reason);

    virtual Result<bool> IsAccessTokenRevoked(const std::string& jti);

    virtual Result<AccessTokenClaims> VerifyAccessToken(const std::string& token,
                                                        const std::optional<std::string>& audience);

    virtual Result<IntrospectionResult> Introspect(const std::string& raw_token);

    // ==================== 密钥 ====================

    virtual Result<JwksDocument> GetPublicKeySet();

    /// @brief activate=false 时只生成不落库（预览 / 演练）
    virtual Result<SigningKeyInfo> GenerateKey(bool activate);

    virtual Result<void> RetireKey(const std::string& kid);

    virtual Result<SigningKeyInfo> RotateKeys(bool graceful);

    virtual Result<std::vector<SigningKeyInfo>> ListKeys();

private:
    Result<TokenPair> BuildPair(const IssuedAccessToken& access, const std::string& refresh_secret) const;

    std::shared_ptr<Config> config_;
    std::shared_ptr<KeyManager> key_manager_;
    std::shared_ptr<JwksService> jwks_;
    std::shared_ptr<TokenIssuer> issuer_;
    std::shared_ptr<TokenVerifier> verifier_;
    std::shared_ptr<RefreshRotationService> refresh_;
    std::shared_ptr<RevocationDenylist> denylist_;
    std::shared_ptr<LockoutTracker> lockout_;
    std::shared_ptr<RateLimiter> rate_limiter_;
    std::shared_ptr<UserStore> users_;
    std::shared_ptr<PasswordVerifier> passwords_;
    std::shared_ptr<Clock> clock_;
};

}  // namespace token_service
