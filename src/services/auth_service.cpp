#include "service/auth_service.h"

#include "common/logger.h"
#include "common/validator.h"
#include "token/token_kind.h"

namespace token_service {

AuthService::AuthService(std::shared_ptr<Config> config,
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
                         std::shared_ptr<Clock> clock)
    : config_(std::move(config)),
      key_manager_(std::move(key_manager)),
      jwks_(std::move(jwks)),
      issuer_(std::move(issuer)),
      verifier_(std::move(verifier)),
      refresh_(std::move(refresh)),
      denylist_(std::move(denylist)),
      lockout_(std::move(lockout)),
      rate_limiter_(std::move(rate_limiter)),
      users_(std::move(users)),
      passwords_(std::move(passwords)),
      clock_(std::move(clock))
    {}

Result<TokenPair> AuthService::BuildPair(const IssuedAccessToken& access,
                                         const std::string& refresh_secret) const {
    TokenPair pair;
    pair.access_token = access.token;
    pair.refresh_token = refresh_secret;
    pair.expires_in = access.claims.exp - access.claims.iat;
    pair.token_type = kBearerTokenType;
    return Result<TokenPair>::Ok(std::move(pair));
}

// ==================== 签发 / 登录 ====================

Result<TokenPair> AuthService::IssueTokenPair(const UserEntity& user, const std::string& audience) {
    auto access = issuer_->Issue(user, audience);
    if (access.IsErr()) {
        return Result<TokenPair>::FailFrom(access);
    }

    std::string secret;
    try {
        secret = RefreshRotationService::GenerateSecret();
    } catch (const std::exception& e) {
        LOG_ERROR("Generate refresh secret failed: {}", e.what());
        return Result<TokenPair>::Fail(ErrorCode::Internal);
    }

    auto record_id = refresh_->Issue(secret, user.id, access.Value().claims.aud);
    if (record_id.IsErr()) {
        return Result<TokenPair>::FailFrom(record_id);
    }

    LOG_INFO("Token pair issued, user_id={}, aud={}, jti={}",
             user.id, access.Value().claims.aud, access.Value().claims.jti);
    return BuildPair(access.Value(), secret);
}

LockoutStatus AuthService::CheckLockout(const std::string& origin, const std::string& email) {
    return lockout_->IsLockedOut(origin, email);
}

RateLimitStatus AuthService::CheckRateLimit(RateLimitScope scope, const std::string& origin) {
    return rate_limiter_->Check(scope, origin);
}

Result<LoginResult> AuthService::Login(const std::string& email,
                                       const std::string& password,
                                       const std::string& origin,
                                       const std::string& audience) {
    // 1.按来源限流
    auto rate = rate_limiter_->Acquire(RateLimitScope::Login, origin);
    if (!rate.allowed) {
        return Result<LoginResult>::Fail(
            ErrorCode::RateLimited,
            "登录请求过于频繁，请 " + std::to_string(rate.retry_after_seconds) + " 秒后重试");
    }

    // 2.参数校验
    std::string err;
    if (!IsValidEmail(email, err) || !IsValidPassword(password, err)) {
        return Result<LoginResult>::Fail(ErrorCode::InvalidArgument, err);
    }

    // 3.锁定检查（防暴力破解）
    auto status = lockout_->IsLockedOut(origin, email);
    if (status.locked) {
        LOG_WARN("Login rejected, {} locked for {}s", LockoutTracker::MakeKey(origin, email),
                 status.retry_after_seconds);
        return Result<LoginResult>::Fail(
            ErrorCode::AccountLockedOut,
            "登录失败次数过多，请 " + std::to_string(status.retry_after_seconds) + " 秒后重试");
    }

    // 4.校验口令（用户不存在也返回 InvalidCredentials，避免泄露账号是否存在）
    auto verified = passwords_->Verify(email, password);
    if (verified.IsErr()) {
        if (verified.code == ErrorCode::InvalidCredentials) {
            auto after = lockout_->RecordFailure(origin, email);
            LOG_INFO("Login failed for {}, failure_count={}", email, after.failure_count);
        }
        return Result<LoginResult>::FailFrom(verified);
    }

    // 5.清除失败记录并签发
    lockout_->RecordSuccess(origin, email);

    UserEntity user = std::move(verified).Value();
    auto tokens = IssueTokenPair(user, audience);
    if (tokens.IsErr()) {
        return Result<LoginResult>::FailFrom(tokens);
    }

    LoginResult result;
    result.user = std::move(user);
    result.user.password_hash.clear();
    result.tokens = std::move(tokens).Value();
    LOG_INFO("User logged in, user_id={}, origin={}", result.user.id, origin);
    return Result<LoginResult>::Ok(std::move(result));
}

// ==================== Refresh / 登出 ====================

Result<TokenPair> AuthService::RotateRefresh(const std::string& raw_refresh,
                                             const std::string& audience,
                                             const std::string& origin) {
    auto rate = rate_limiter_->Acquire(RateLimitScope::Refresh, origin);
    if (!rate.allowed) {
        return Result<TokenPair>::Fail(
            ErrorCode::RateLimited,
            "刷新请求过于频繁，请 " + std::to_string(rate.retry_after_seconds) + " 秒后重试");
    }

    // 1.校验旧 token（存储故障原样上抛，客户端不应丢弃仍然有效的 token）
    auto validated = refresh_->Validate(raw_refresh);
    if (validated.IsErr()) {
        return Result<TokenPair>::FailFrom(validated);
    }
    const auto& record = validated.Value();
    if (!record) {
        return Result<TokenPair>::Fail(ErrorCode::RefreshTokenInvalidOrUsed);
    }

    // 2.加载用户（拿到最新的 role / token_version）
    auto user = users_->GetById(record->user_id);
    if (user.IsErr()) {
        if (user.code == ErrorCode::UserNotFound) {
            return Result<TokenPair>::Fail(ErrorCode::RefreshTokenInvalidOrUsed);
        }
        return Result<TokenPair>::FailFrom(user);
    }

    // 3.先签 access token；轮换失败时直接丢弃
    std::string aud = audience.empty() ? record->app_id : audience;
    auto access = issuer_->Issue(user.Value(), aud);
    if (access.IsErr()) {
        return Result<TokenPair>::FailFrom(access);
    }

    std::string secret;
    try {
        secret = RefreshRotationService::GenerateSecret();
    } catch (const std::exception& e) {
        LOG_ERROR("Generate refresh secret failed: {}", e.what());
        return Result<TokenPair>::Fail(ErrorCode::Internal);
    }

    // 4.原子轮换
    auto rotated = refresh_->Rotate(record->id, secret, user.Value().id, access.Value().claims.aud);
    if (rotated.IsErr()) {
        return Result<TokenPair>::FailFrom(rotated);
    }

    LOG_INFO("Refresh rotated, user_id={}, {} -> {}", user.Value().id, record->id, rotated.Value());
    return BuildPair(access.Value(), secret);
}

Result<void> AuthService::Logout(const std::string& raw_refresh) {
    auto validated = refresh_->Validate(raw_refresh);
    if (validated.IsErr()) {
        LOG_ERROR("Logout cannot reach refresh store: {}", validated.message);
        return Result<void>::FailFrom(validated);
    }
    const auto& record = validated.Value();
    if (!record) {
        LOG_DEBUG("Logout with unknown or used refresh token, ignored");
        return Result<void>::Ok();
    }

    auto revoked = refresh_->Revoke(record->id);
    if (revoked.IsErr()) {
        return Result<void>::FailFrom(revoked);
    }
    LOG_INFO("User logged out, user_id={}, record_id={}", record->user_id, record->id);
    return Result<void>::Ok();
}

Result<int64_t> AuthService::GlobalLogout(const std::string& user_id) {
    auto version = users_->BumpTokenVersion(user_id);
    if (version.IsErr()) {
        return version;
    }

    auto revoked = refresh_->RevokeAllForUser(user_id);
    if (revoked.IsErr()) {
        LOG_ERROR("Revoke refresh tokens for {} failed after version bump: {}", user_id, revoked.message);
        return Result<int64_t>::FailFrom(revoked);
    }

    LOG_INFO("Global logout, user_id={}, token_version={}, refresh_revoked={}",
             user_id, version.Value(), revoked.Value());
    return version;
}

// ==================== Access Token 吊销 / 校验 ====================

Result<void> AuthService::RevokeAccessToken(const std::string& jti,
                                            const std::string& user_id,
                                            const std::string& app_id,
                                            TimePoint expires_at,
                                            const std::string& reason) {
    std::string err;
    if (!IsValidJti(jti, err)) {
        return Result<void>::Fail(ErrorCode::InvalidArgument, err);
    }

    RevokedAccessTokenEntry entry;
    entry.jti = jti;
    entry.user_id = user_id;
    entry.app_id = app_id;
    entry.reason = reason.empty() ? kDefaultRevocationReason : reason;
    entry.expires_at = expires_at;
    entry.created_at = clock_->Now();
    return denylist_->Revoke(entry);
}

Result<AccessTokenClaims> AuthService::RevokeAccessTokenByValue(const std::string& token,
                                                                const std::string& reason) {
    auto claims = verifier_->VerifySignature(token);
    if (claims.IsErr()) {
        return claims;
    }

    const auto& c = claims.Value();
    auto revoked = RevokeAccessToken(c.jti, c.sub, c.app_id.empty() ? c.aud : c.app_id,
                                     FromUnixSeconds(c.exp), reason);
    if (revoked.IsErr()) {
        return Result<AccessTokenClaims>::FailFrom(revoked);
    }
    return claims;
}

Result<bool> AuthService::IsAccessTokenRevoked(const std::string& jti) {
    return denylist_->IsRevoked(jti);
}

Result<AccessTokenClaims> AuthService::VerifyAccessToken(const std::string& token,
                                                         const std::optional<std::string>& audience) {
    return verifier_->Verify(token, audience);
}

Result<IntrospectionResult> AuthService::Introspect(const std::string& raw_token) {
    using R = Result<IntrospectionResult>;

    TokenKind kind = ClassifyToken(raw_token);
    IntrospectionResult result;
    result.kind = TagOf(kind);

    if (const auto* access = std::get_if<AccessTokenRef>(&kind)) {
        auto claims = verifier_->Verify(access->raw);
        if (claims.IsErr()) {
            if (claims.code == ErrorCode::ServiceUnavailable) {
                return R::FailFrom(claims);
            }
            return R::Ok(std::move(result));
        }
        result.active = true;
        result.user_id = claims.Value().sub;
        result.app_id = claims.Value().app_id.empty() ? claims.Value().aud : claims.Value().app_id;
        result.expires_at = claims.Value().exp;
        result.claims = std::move(claims).Value();
    } else if (const auto* refresh = std::get_if<RefreshTokenRef>(&kind)) {
        auto validated = refresh_->Validate(refresh->raw);
        if (validated.IsErr()) {
            return R::FailFrom(validated);
        }
        const auto& record = validated.Value();
        if (!record) {
            return R::Ok(std::move(result));
        }
        result.active = true;
        result.user_id = record->user_id;
        result.app_id = record->app_id;
        result.expires_at = ToUnixSeconds(record->expires_at);
        result.record_id = record->id;
    }
    return R::Ok(std::move(result));
}

// ==================== 密钥 ====================

Result<JwksDocument> AuthService::GetPublicKeySet() {
    return jwks_->GetKeySet();
}

Result<SigningKeyInfo> AuthService::GenerateKey(bool activate) {
    auto key = key_manager_->GenerateKeyPair();
    if (key.IsErr()) {
        return Result<SigningKeyInfo>::FailFrom(key);
    }

    if (!activate) {
        SigningKeyInfo info = ToKeyInfo(key.Value());
        info.is_active = false;
        return Result<SigningKeyInfo>::Ok(std::move(info));
    }

    auto persisted = key_manager_->ActivateAndPersist(key.Value());
    if (persisted.IsErr()) {
        return Result<SigningKeyInfo>::FailFrom(persisted);
    }
    return Result<SigningKeyInfo>::Ok(ToKeyInfo(key.Value()));
}

Result<void> AuthService::RetireKey(const std::string& kid) {
    return key_manager_->Retire(kid);
}

Result<SigningKeyInfo> AuthService::RotateKeys(bool graceful) {
    auto key = key_manager_->Rotate(graceful);
    if (key.IsErr()) {
        return Result<SigningKeyInfo>::FailFrom(key);
    }
    return Result<SigningKeyInfo>::Ok(ToKeyInfo(key.Value()));
}

Result<std::vector<SigningKeyInfo>> AuthService::ListKeys() {
    return key_manager_->ListKeys();
}

}  // namespace token_service
