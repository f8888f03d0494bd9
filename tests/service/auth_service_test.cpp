// tests/service/auth_service_test.cpp
#include "service_test_fixture.h"

#include <nlohmann/json.hpp>

namespace token_service {
namespace test {

class AuthServiceTest : public ServiceTestFixture {};

// ============================================================================
// Login
// ============================================================================

TEST_F(AuthServiceTest, LoginSuccess) {
    auto result = auth_service_->Login("alice@example.com", kPassword, kOrigin, "");

    ASSERT_TRUE(result.IsOk()) << result.message;
    const auto& login = result.Value();
    EXPECT_EQ(login.user.id, "u-alice");
    EXPECT_EQ(login.user.email, "alice@example.com");
    EXPECT_TRUE(login.user.password_hash.empty());

    EXPECT_FALSE(login.tokens.access_token.empty());
    EXPECT_EQ(login.tokens.token_type, "Bearer");
    EXPECT_EQ(login.tokens.expires_in, 900);
    EXPECT_TRUE(login.tokens.refresh_token.rfind("rt_", 0) == 0);

    auto claims = auth_service_->VerifyAccessToken(login.tokens.access_token, std::nullopt);
    ASSERT_TRUE(claims.IsOk()) << claims.message;
    EXPECT_EQ(claims.Value().sub, "u-alice");
    EXPECT_EQ(claims.Value().aud, "api");
}

TEST_F(AuthServiceTest, LoginWithAudience) {
    auto tokens = LoginAlice("mobile");

    auto claims = auth_service_->VerifyAccessToken(tokens.access_token, std::string("mobile"));
    ASSERT_TRUE(claims.IsOk());

    // refresh 记录保存签发时的 audience
    auto introspected = auth_service_->Introspect(tokens.refresh_token);
    ASSERT_TRUE(introspected.IsOk());
    EXPECT_EQ(introspected.Value().app_id, "mobile");
}

TEST_F(AuthServiceTest, LoginWrongPassword) {
    auto result = auth_service_->Login("alice@example.com", "wrong", kOrigin, "");

    EXPECT_EQ(result.code, ErrorCode::InvalidCredentials);
    EXPECT_EQ(auth_service_->CheckLockout(kOrigin, "alice@example.com").failure_count, 1);
}

TEST_F(AuthServiceTest, LoginUnknownUserLooksLikeWrongPassword) {
    auto unknown = auth_service_->Login("nobody@example.com", kPassword, kOrigin, "");
    auto wrong = auth_service_->Login("alice@example.com", "wrong", kOrigin, "");

    EXPECT_EQ(unknown.code, ErrorCode::InvalidCredentials);
    EXPECT_EQ(unknown.message, wrong.message);
}

TEST_F(AuthServiceTest, LoginInvalidArgumentsNotCounted) {
    EXPECT_EQ(auth_service_->Login("not-an-email", kPassword, kOrigin, "").code, ErrorCode::InvalidArgument);
    EXPECT_EQ(auth_service_->Login("alice@example.com", "", kOrigin, "").code, ErrorCode::InvalidArgument);

    EXPECT_EQ(auth_service_->CheckLockout(kOrigin, "not-an-email").failure_count, 0);
    EXPECT_EQ(auth_service_->CheckLockout(kOrigin, "alice@example.com").failure_count, 0);
}

TEST_F(AuthServiceTest, LockoutAfterRepeatedFailures) {
    // 第 5 次失败本身仍返回 InvalidCredentials
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(auth_service_->Login("alice@example.com", "wrong", kOrigin, "").code,
                  ErrorCode::InvalidCredentials);
    }

    // 之后即使口令正确也被拒
    auto locked = auth_service_->Login("alice@example.com", kPassword, kOrigin, "");
    EXPECT_EQ(locked.code, ErrorCode::AccountLockedOut);

    auto status = auth_service_->CheckLockout(kOrigin, "alice@example.com");
    EXPECT_TRUE(status.locked);
    EXPECT_EQ(status.retry_after_seconds, 300);

    // 其他来源不受影响
    EXPECT_TRUE(auth_service_->Login("alice@example.com", kPassword, "198.51.100.1", "").IsOk());

    // 锁定到期后可登录，成功后清零
    clock_->Advance(std::chrono::seconds(300));
    EXPECT_TRUE(auth_service_->Login("alice@example.com", kPassword, kOrigin, "").IsOk());
    EXPECT_EQ(auth_service_->CheckLockout(kOrigin, "alice@example.com").failure_count, 0);
}

TEST_F(AuthServiceTest, LockedAttemptDoesNotIncreaseCount) {
    for (int i = 0; i < 5; ++i) {
        auth_service_->Login("alice@example.com", "wrong", kOrigin, "");
    }
    auth_service_->Login("alice@example.com", "wrong", kOrigin, "");

    EXPECT_EQ(auth_service_->CheckLockout(kOrigin, "alice@example.com").failure_count, 5);
}

// ============================================================================
// Refresh
// ============================================================================

TEST_F(AuthServiceTest, RotateRefreshIssuesNewPair) {
    auto first = LoginAlice();
    clock_->Advance(std::chrono::seconds(5));

    auto second = auth_service_->RotateRefresh(first.refresh_token, "", kOrigin);
    ASSERT_TRUE(second.IsOk()) << second.message;
    EXPECT_NE(second.Value().refresh_token, first.refresh_token);
    EXPECT_NE(second.Value().access_token, first.access_token);

    // 沿用记录上的 audience
    auto claims = auth_service_->VerifyAccessToken(second.Value().access_token, std::string("api"));
    EXPECT_TRUE(claims.IsOk());
}

TEST_F(AuthServiceTest, RefreshTokenIsSingleUse) {
    auto first = LoginAlice();
    auto second = auth_service_->RotateRefresh(first.refresh_token, "", kOrigin);
    ASSERT_TRUE(second.IsOk());

    auto replay = auth_service_->RotateRefresh(first.refresh_token, "", kOrigin);
    EXPECT_EQ(replay.code, ErrorCode::RefreshTokenInvalidOrUsed);

    // 重放不影响后继
    EXPECT_TRUE(auth_service_->RotateRefresh(second.Value().refresh_token, "", kOrigin).IsOk());
}

TEST_F(AuthServiceTest, RefreshFailuresAreIndistinguishable) {
    EXPECT_EQ(auth_service_->RotateRefresh("", "", kOrigin).code, ErrorCode::RefreshTokenInvalidOrUsed);
    EXPECT_EQ(auth_service_->RotateRefresh("rt_" + std::string(64, '0'), "", kOrigin).code,
              ErrorCode::RefreshTokenInvalidOrUsed);

    auto tokens = LoginAlice();
    clock_->Advance(std::chrono::seconds(config_->security.refresh_token_ttl_seconds));
    EXPECT_EQ(auth_service_->RotateRefresh(tokens.refresh_token, "", kOrigin).code,
              ErrorCode::RefreshTokenInvalidOrUsed);
}

TEST_F(AuthServiceTest, RefreshPicksUpNewTokenVersion) {
    auto tokens = LoginAlice();
    ASSERT_TRUE(users_->BumpTokenVersion(alice_.id).IsOk());

    // 旧 refresh 未被吊销（直接改版本号，不经 GlobalLogout）
    auto rotated = auth_service_->RotateRefresh(tokens.refresh_token, "", kOrigin);
    ASSERT_TRUE(rotated.IsOk());

    auto claims = auth_service_->VerifyAccessToken(rotated.Value().access_token, std::nullopt);
    ASSERT_TRUE(claims.IsOk());
    EXPECT_EQ(claims.Value().token_version, 1);
}

// ============================================================================
// Logout
// ============================================================================

TEST_F(AuthServiceTest, LogoutRevokesRefresh) {
    auto tokens = LoginAlice();

    EXPECT_TRUE(auth_service_->Logout(tokens.refresh_token).IsOk());
    EXPECT_EQ(auth_service_->RotateRefresh(tokens.refresh_token, "", kOrigin).code,
              ErrorCode::RefreshTokenInvalidOrUsed);

    // 幂等
    EXPECT_TRUE(auth_service_->Logout(tokens.refresh_token).IsOk());
    EXPECT_TRUE(auth_service_->Logout("garbage").IsOk());
}

TEST_F(AuthServiceTest, GlobalLogoutInvalidatesEverything) {
    auto a = LoginAlice();
    auto b = LoginAlice("mobile");
    ASSERT_TRUE(auth_service_->VerifyAccessToken(a.access_token, std::nullopt).IsOk());

    auto version = auth_service_->GlobalLogout(alice_.id);
    ASSERT_TRUE(version.IsOk());
    EXPECT_EQ(version.Value(), 1);

    EXPECT_EQ(auth_service_->VerifyAccessToken(a.access_token, std::nullopt).code,
              ErrorCode::TokenVersionStale);
    EXPECT_EQ(auth_service_->VerifyAccessToken(b.access_token, std::nullopt).code,
              ErrorCode::TokenVersionStale);
    EXPECT_EQ(auth_service_->RotateRefresh(a.refresh_token, "", kOrigin).code, ErrorCode::RefreshTokenInvalidOrUsed);
    EXPECT_EQ(auth_service_->RotateRefresh(b.refresh_token, "", kOrigin).code, ErrorCode::RefreshTokenInvalidOrUsed);

    // 重新登录拿到 tv=1 的 Token
    auto fresh = LoginAlice();
    auto claims = auth_service_->VerifyAccessToken(fresh.access_token, std::nullopt);
    ASSERT_TRUE(claims.IsOk());
    EXPECT_EQ(claims.Value().token_version, 1);
}

TEST_F(AuthServiceTest, GlobalLogoutUnknownUser) {
    EXPECT_EQ(auth_service_->GlobalLogout("ghost").code, ErrorCode::UserNotFound);
}

// ============================================================================
// Access Token 吊销
// ============================================================================

TEST_F(AuthServiceTest, RevokeAccessTokenByJti) {
    auto tokens = LoginAlice();
    auto claims = auth_service_->VerifyAccessToken(tokens.access_token, std::nullopt);
    ASSERT_TRUE(claims.IsOk());

    auto revoked = auth_service_->RevokeAccessToken(
        claims.Value().jti, alice_.id, "api", FromUnixSeconds(claims.Value().exp), "");
    ASSERT_TRUE(revoked.IsOk());

    EXPECT_TRUE(auth_service_->IsAccessTokenRevoked(claims.Value().jti).Value());
    EXPECT_EQ(auth_service_->VerifyAccessToken(tokens.access_token, std::nullopt).code,
              ErrorCode::TokenRevoked);
}

TEST_F(AuthServiceTest, RevokeAccessTokenRejectsEmptyJti) {
    auto revoked = auth_service_->RevokeAccessToken("", alice_.id, "api", clock_->Now(), "");
    EXPECT_EQ(revoked.code, ErrorCode::InvalidArgument);
}

TEST_F(AuthServiceTest, RevokeAccessTokenByValue) {
    auto tokens = LoginAlice();

    auto revoked = auth_service_->RevokeAccessTokenByValue(tokens.access_token, "stolen laptop");
    ASSERT_TRUE(revoked.IsOk()) << revoked.message;
    const auto& claims = revoked.Value();

    auto entry = denylist_->Get(claims.jti);
    ASSERT_TRUE(entry.IsOk());
    ASSERT_TRUE(entry.Value().has_value());
    EXPECT_EQ(entry.Value()->user_id, alice_.id);
    EXPECT_EQ(entry.Value()->app_id, "app-main");
    EXPECT_EQ(entry.Value()->reason, "stolen laptop");
    EXPECT_EQ(ToUnixSeconds(entry.Value()->expires_at), claims.exp);

    EXPECT_EQ(auth_service_->VerifyAccessToken(tokens.access_token, std::nullopt).code,
              ErrorCode::TokenRevoked);
}

TEST_F(AuthServiceTest, RevokeByValueRequiresValidSignature) {
    EXPECT_EQ(auth_service_->RevokeAccessTokenByValue("not.a.jwt", "").code, ErrorCode::TokenMalformed);
    EXPECT_EQ(denylist_->Count().Value(), 0);
}

// 黑名单条目随 Token 一起过期
TEST_F(AuthServiceTest, RevocationEntryExpiresWithToken) {
    auto tokens = LoginAlice();
    auto revoked = auth_service_->RevokeAccessTokenByValue(tokens.access_token, "");
    ASSERT_TRUE(revoked.IsOk());

    clock_->Advance(std::chrono::seconds(900));
    EXPECT_FALSE(auth_service_->IsAccessTokenRevoked(revoked.Value().jti).Value());
}

// ============================================================================
// Introspect
// ============================================================================

TEST_F(AuthServiceTest, IntrospectAccessToken) {
    auto tokens = LoginAlice();

    auto result = auth_service_->Introspect(tokens.access_token);
    ASSERT_TRUE(result.IsOk());
    const auto& r = result.Value();
    EXPECT_TRUE(r.active);
    EXPECT_EQ(r.kind, TokenKindTag::Access);
    EXPECT_EQ(r.user_id, alice_.id);
    EXPECT_EQ(r.app_id, "app-main");
    ASSERT_TRUE(r.claims.has_value());
    EXPECT_EQ(r.expires_at, r.claims->exp);
    EXPECT_FALSE(r.record_id.has_value());
}

TEST_F(AuthServiceTest, IntrospectRefreshToken) {
    auto tokens = LoginAlice();

    auto result = auth_service_->Introspect(tokens.refresh_token);
    ASSERT_TRUE(result.IsOk());
    const auto& r = result.Value();
    EXPECT_TRUE(r.active);
    EXPECT_EQ(r.kind, TokenKindTag::Refresh);
    EXPECT_EQ(r.user_id, alice_.id);
    EXPECT_EQ(r.app_id, "api");
    EXPECT_TRUE(r.record_id.has_value());
    EXPECT_FALSE(r.claims.has_value());
    EXPECT_EQ(r.expires_at, ToUnixSeconds(clock_->Now()) + 86400);
}

TEST_F(AuthServiceTest, IntrospectInactive) {
    auto tokens = LoginAlice();
    ASSERT_TRUE(auth_service_->Logout(tokens.refresh_token).IsOk());

    auto used = auth_service_->Introspect(tokens.refresh_token);
    ASSERT_TRUE(used.IsOk());
    EXPECT_FALSE(used.Value().active);
    EXPECT_EQ(used.Value().kind, TokenKindTag::Refresh);

    clock_->Advance(std::chrono::seconds(900));
    auto expired = auth_service_->Introspect(tokens.access_token);
    ASSERT_TRUE(expired.IsOk());
    EXPECT_FALSE(expired.Value().active);
    EXPECT_EQ(expired.Value().kind, TokenKindTag::Access);
    EXPECT_TRUE(expired.Value().user_id.empty());

    auto unknown = auth_service_->Introspect("opaque-value");
    ASSERT_TRUE(unknown.IsOk());
    EXPECT_FALSE(unknown.Value().active);
    EXPECT_EQ(unknown.Value().kind, TokenKindTag::Unknown);
}

// ============================================================================
// 密钥管理
// ============================================================================

TEST_F(AuthServiceTest, GetPublicKeySetBootstraps) {
    auto doc = auth_service_->GetPublicKeySet();
    ASSERT_TRUE(doc.IsOk());
    EXPECT_EQ(doc.Value().keys.size(), 1u);
    EXPECT_EQ(nlohmann::json::parse(doc.Value().json)["keys"].size(), 1u);
}

TEST_F(AuthServiceTest, GenerateKeyPreviewIsNotPersisted) {
    LoginAlice();

    auto preview = auth_service_->GenerateKey(false);
    ASSERT_TRUE(preview.IsOk());
    EXPECT_FALSE(preview.Value().is_active);

    auto keys = auth_service_->ListKeys();
    ASSERT_TRUE(keys.IsOk());
    EXPECT_EQ(keys.Value().size(), 1u);
}

TEST_F(AuthServiceTest, GenerateKeyActivatePublishes) {
    LoginAlice();
    clock_->Advance(std::chrono::seconds(1));

    auto generated = auth_service_->GenerateKey(true);
    ASSERT_TRUE(generated.IsOk());
    EXPECT_TRUE(generated.Value().is_active);

    auto doc = auth_service_->GetPublicKeySet();
    ASSERT_TRUE(doc.IsOk());
    EXPECT_EQ(doc.Value().keys.size(), 2u);
}

TEST_F(AuthServiceTest, RotateKeysKeepsOldTokensValid) {
    auto before = LoginAlice();
    clock_->Advance(std::chrono::seconds(1));

    auto rotated = auth_service_->RotateKeys(false);
    ASSERT_TRUE(rotated.IsOk());
    EXPECT_TRUE(rotated.Value().is_active);

    auto after = LoginAlice();
    auto old_claims = auth_service_->VerifyAccessToken(before.access_token, std::nullopt);
    auto new_claims = auth_service_->VerifyAccessToken(after.access_token, std::nullopt);
    ASSERT_TRUE(old_claims.IsOk());
    ASSERT_TRUE(new_claims.IsOk());
    EXPECT_EQ(new_claims.Value().kid, rotated.Value().kid);
    EXPECT_NE(old_claims.Value().kid, rotated.Value().kid);

    auto doc = auth_service_->GetPublicKeySet();
    ASSERT_TRUE(doc.IsOk());
    EXPECT_EQ(doc.Value().keys.size(), 1u);
}

TEST_F(AuthServiceTest, RetireKeyErrors) {
    LoginAlice();
    auto keys = auth_service_->ListKeys();
    ASSERT_TRUE(keys.IsOk());
    ASSERT_EQ(keys.Value().size(), 1u);

    EXPECT_EQ(auth_service_->RetireKey(keys.Value()[0].kid).code, ErrorCode::LastActiveKey);
    EXPECT_EQ(auth_service_->RetireKey("key_ffffffffffffffffffffffffffffffff").code, ErrorCode::KeyNotFound);
}

// ============================================================================
// 速率限制
// ============================================================================

class RateLimitedAuthServiceTest : public ServiceTestFixture {
protected:
    void SetUp() override {
        CreateConfig();
        config_->rate_limit.login = {3, 60};
        config_->rate_limit.refresh = {2, 60};
        CreateStores();
        CreateServices();
        CreateTestUsers();
    }
};

TEST_F(RateLimitedAuthServiceTest, LoginLimitedPerOrigin) {
    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(auth_service_->Login(alice_.email, kPassword, kOrigin, "").IsOk());
    }

    auto limited = auth_service_->Login(alice_.email, kPassword, kOrigin, "");
    EXPECT_EQ(limited.code, ErrorCode::RateLimited);
    auto status = auth_service_->CheckRateLimit(RateLimitScope::Login, kOrigin);
    EXPECT_FALSE(status.allowed);
    EXPECT_EQ(status.retry_after_seconds, 60);

    // 被限流的请求不计入锁定失败次数
    EXPECT_EQ(auth_service_->CheckLockout(kOrigin, alice_.email).failure_count, 0);

    EXPECT_TRUE(auth_service_->Login(alice_.email, kPassword, "198.51.100.4", "").IsOk());

    clock_->Advance(std::chrono::seconds(60));
    EXPECT_TRUE(auth_service_->Login(alice_.email, kPassword, kOrigin, "").IsOk());
}

TEST_F(RateLimitedAuthServiceTest, RefreshLimitedPerOrigin) {
    auto tokens = LoginAlice();

    auto first = auth_service_->RotateRefresh(tokens.refresh_token, "", kOrigin);
    ASSERT_TRUE(first.IsOk());
    auto second = auth_service_->RotateRefresh(first.Value().refresh_token, "", kOrigin);
    ASSERT_TRUE(second.IsOk());

    auto limited = auth_service_->RotateRefresh(second.Value().refresh_token, "", kOrigin);
    EXPECT_EQ(limited.code, ErrorCode::RateLimited);

    // 限流发生在消费之前，令牌仍可使用
    auto elsewhere = auth_service_->RotateRefresh(second.Value().refresh_token, "", "198.51.100.4");
    EXPECT_TRUE(elsewhere.IsOk());
}

// ============================================================================
// 存储不可达
// ============================================================================

// 可切换为故障状态的刷新令牌存储
class FlakyRefreshTokenStore : public InMemoryRefreshTokenStore {
public:
    Result<RefreshTokenRecord> FindByHash(const std::string& token_hash) override {
        if (down) {
            return Result<RefreshTokenRecord>::Fail(ErrorCode::ServiceUnavailable, "refresh store down");
        }
        return InMemoryRefreshTokenStore::FindByHash(token_hash);
    }

    bool down = false;
};

class StoreOutageAuthServiceTest : public ServiceTestFixture {
protected:
    void SetUp() override {
        CreateConfig();
        CreateStores();
        flaky_store_ = std::make_shared<FlakyRefreshTokenStore>();
        refresh_store_ = flaky_store_;
        CreateServices();
        CreateTestUsers();
    }

    std::shared_ptr<FlakyRefreshTokenStore> flaky_store_;
};

TEST_F(StoreOutageAuthServiceTest, LogoutReportsOutage) {
    auto tokens = LoginAlice();

    flaky_store_->down = true;
    EXPECT_EQ(auth_service_->Logout(tokens.refresh_token).code, ErrorCode::ServiceUnavailable);

    // 故障期间的登出未生效，恢复后令牌仍然有效
    flaky_store_->down = false;
    EXPECT_TRUE(auth_service_->RotateRefresh(tokens.refresh_token, "", kOrigin).IsOk());
}

TEST_F(StoreOutageAuthServiceTest, RotateRefreshReportsOutage) {
    auto tokens = LoginAlice();

    flaky_store_->down = true;
    EXPECT_EQ(auth_service_->RotateRefresh(tokens.refresh_token, "", kOrigin).code,
              ErrorCode::ServiceUnavailable);
}

TEST_F(StoreOutageAuthServiceTest, IntrospectReportsOutage) {
    auto tokens = LoginAlice();

    flaky_store_->down = true;
    EXPECT_EQ(auth_service_->Introspect(tokens.refresh_token).code, ErrorCode::ServiceUnavailable);
}

}  // namespace test
}  // namespace token_service
