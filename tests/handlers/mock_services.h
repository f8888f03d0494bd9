// tests/handlers/mock_services.h

#pragma once

#include <gmock/gmock.h>
#include "service/auth_service.h"
#include "auth/authenticator.h"

namespace token_service {
namespace test {

// ============================================================================
// Mock AuthService
// ============================================================================

class MockAuthService : public AuthService {
public:
    MockAuthService()
        : AuthService(nullptr, nullptr, nullptr, nullptr, nullptr, nullptr,
                      nullptr, nullptr, nullptr, nullptr, nullptr, nullptr) {}

    MOCK_METHOD(Result<TokenPair>, IssueTokenPair,
                (const UserEntity& user, const std::string& audience), (override));

    MOCK_METHOD(Result<LoginResult>, Login,
                (const std::string& email,
                 const std::string& password,
                 const std::string& origin,
                 const std::string& audience), (override));

    MOCK_METHOD(LockoutStatus, CheckLockout,
                (const std::string& origin, const std::string& email), (override));

    MOCK_METHOD(RateLimitStatus, CheckRateLimit,
                (RateLimitScope scope, const std::string& origin), (override));

    MOCK_METHOD(Result<TokenPair>, RotateRefresh,
                (const std::string& raw_refresh,
                 const std::string& audience,
                 const std::string& origin), (override));

    MOCK_METHOD(Result<void>, Logout,
                (const std::string& raw_refresh), (override));

    MOCK_METHOD(Result<int64_t>, GlobalLogout,
                (const std::string& user_id), (override));

    MOCK_METHOD(Result<void>, RevokeAccessToken,
                (const std::string& jti,
                 const std::string& user_id,
                 const std::string& app_id,
                 TimePoint expires_at,
                 const std::string& reason), (override));

    MOCK_METHOD(Result<AccessTokenClaims>, RevokeAccessTokenByValue,
                (const std::string& token, const std::string& reason), (override));

    MOCK_METHOD(Result<bool>, IsAccessTokenRevoked,
                (const std::string& jti), (override));

    MOCK_METHOD(Result<AccessTokenClaims>, VerifyAccessToken,
                (const std::string& token, const std::optional<std::string>& audience), (override));

    MOCK_METHOD(Result<IntrospectionResult>, Introspect,
                (const std::string& raw_token), (override));

    MOCK_METHOD(Result<JwksDocument>, GetPublicKeySet, (), (override));

    MOCK_METHOD(Result<SigningKeyInfo>, GenerateKey, (bool activate), (override));

    MOCK_METHOD(Result<void>, RetireKey, (const std::string& kid), (override));

    MOCK_METHOD(Result<SigningKeyInfo>, RotateKeys, (bool graceful), (override));

    MOCK_METHOD(Result<std::vector<SigningKeyInfo>>, ListKeys, (), (override));
};

// ============================================================================
// Mock Authenticator
// ============================================================================

class MockAuthenticator : public Authenticator {
public:
    MOCK_METHOD(Result<AuthContext>, Authenticate,
                (::grpc::ServerContext* context), (override));
};

// ============================================================================
// 测试数据
// ============================================================================

inline AuthContext MakeAuthContext(const std::string& user_id, const std::string& role) {
    AuthContext ctx;
    ctx.user_id = user_id;
    ctx.role = role;
    ctx.jti = "at_" + user_id;
    return ctx;
}

inline SigningKeyInfo MakeKeyInfo(const std::string& kid, bool active) {
    SigningKeyInfo info;
    info.kid = kid;
    info.algorithm = kSigningAlgorithm;
    info.created_at = FromUnixSeconds(1700000000);
    info.is_active = active;
    if (!active) {
        info.retired_at = FromUnixSeconds(1700003600);
    }
    return info;
}

}  // namespace test
}  // namespace token_service
