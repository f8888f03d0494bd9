// tests/token/token_verifier_test.cpp
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <nlohmann/json.hpp>

#include "token/token_issuer.h"
#include "token/token_verifier.h"
#include "keys/key_store.h"
#include "common/crypto_utils.h"
#include "common/utils.h"

namespace token_service {
namespace test {

using ::testing::_;
using ::testing::Return;

class MockUserStore : public UserStore {
public:
    MOCK_METHOD(Result<UserEntity>, GetById, (const std::string& id), (override));
    MOCK_METHOD(Result<UserEntity>, FindByEmail, (const std::string& email), (override));
    MOCK_METHOD(Result<int64_t>, GetTokenVersion, (const std::string& id), (override));
    MOCK_METHOD(Result<int64_t>, BumpTokenVersion, (const std::string& id), (override));
};

class TokenVerifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>();
        key_store_ = std::make_shared<InMemoryKeyStore>();
        key_manager_ = std::make_shared<KeyManager>(key_store_, clock_);
        users_ = std::make_shared<InMemoryUserStore>();
        denylist_ = std::make_shared<InMemoryRevocationDenylist>(clock_);

        config_.jwt_issuer = "https://auth.test";
        config_.jwt_audience = "api";
        config_.access_token_ttl_seconds = 900;
        config_.enable_jti_denylist = true;

        user_.id = "u-1";
        user_.email = "alice@example.com";
        user_.role = "user";
        user_.token_version = 3;
        user_.app_id = "app-main";
        users_->Put(user_);

        Rebuild();
    }

    void Rebuild() {
        issuer_ = std::make_shared<TokenIssuer>(key_manager_, config_, clock_);
        verifier_ = std::make_shared<TokenVerifier>(key_manager_, users_, denylist_, config_, clock_);
    }

    std::string IssueToken(const std::string& audience = "") {
        auto issued = issuer_->Issue(user_, audience);
        EXPECT_TRUE(issued.IsOk()) << issued.message;
        return issued.IsOk() ? issued.Value().token : std::string();
    }

    // 用当前签名密钥对任意 header / payload 签名
    std::string SignRaw(const nlohmann::json& header, const nlohmann::json& payload) {
        auto signer = key_manager_->GetSigner();
        EXPECT_TRUE(signer.IsOk());
        std::string input = Base64UrlEncode(header.dump()) + "." + Base64UrlEncode(payload.dump());
        auto sig = signer.Value().second->Sign(input);
        EXPECT_TRUE(sig.IsOk());
        return input + "." + Base64UrlEncode(sig.Value());
    }

    nlohmann::json ValidHeader() {
        return {{"alg", "ES256"}, {"typ", "JWT"}, {"kid", key_manager_->GetSigningKey().Value()->kid}};
    }

    nlohmann::json ValidPayload() {
        int64_t now = ToUnixSeconds(clock_->Now());
        return {
            {"iss", config_.jwt_issuer}, {"aud", "api"}, {"sub", user_.id}, {"role", "user"},
            {"tv", user_.token_version}, {"jti", "at_0123456789abcdef0123456789abcdef"},
            {"iat", now}, {"nbf", now}, {"exp", now + 900},
        };
    }

    SecurityConfig config_;
    UserEntity user_;
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<InMemoryKeyStore> key_store_;
    std::shared_ptr<KeyManager> key_manager_;
    std::shared_ptr<InMemoryUserStore> users_;
    std::shared_ptr<InMemoryRevocationDenylist> denylist_;
    std::shared_ptr<TokenIssuer> issuer_;
    std::shared_ptr<TokenVerifier> verifier_;
};

// ============================================================================
// 签发
// ============================================================================

TEST_F(TokenVerifierTest, IssuedClaimsRoundTrip) {
    auto issued = issuer_->Issue(user_, "");
    ASSERT_TRUE(issued.IsOk());
    const auto& c = issued.Value().claims;

    EXPECT_EQ(c.iss, "https://auth.test");
    EXPECT_EQ(c.aud, "api");
    EXPECT_EQ(c.sub, "u-1");
    EXPECT_EQ(c.token_version, 3);
    EXPECT_EQ(c.nbf, c.iat);
    EXPECT_EQ(c.exp, c.iat + 900);
    EXPECT_TRUE(StartsWith(c.jti, "at_"));
    EXPECT_EQ(c.jti.size(), 3u + 32u);

    auto verified = verifier_->Verify(issued.Value().token);
    ASSERT_TRUE(verified.IsOk()) << verified.message;
    EXPECT_EQ(verified.Value().jti, c.jti);
    EXPECT_EQ(verified.Value().email, "alice@example.com");
    EXPECT_EQ(verified.Value().app_id, "app-main");
    EXPECT_EQ(verified.Value().kid, key_manager_->GetSigningKey().Value()->kid);
}

TEST_F(TokenVerifierTest, HeaderCarriesAlgAndKid) {
    std::string token = IssueToken();
    auto parts = SplitView(token, '.');
    ASSERT_EQ(parts.size(), 3u);

    auto header = nlohmann::json::parse(*Base64UrlDecode(parts[0]));
    EXPECT_EQ(header["alg"], "ES256");
    EXPECT_EQ(header["typ"], "JWT");
    EXPECT_EQ(header["kid"], key_manager_->GetSigningKey().Value()->kid);

    // r||s 原始签名 64 字节
    EXPECT_EQ(Base64UrlDecode(parts[2])->size(), 64u);
}

TEST_F(TokenVerifierTest, ExplicitAudience) {
    std::string token = IssueToken("mobile");

    EXPECT_TRUE(verifier_->Verify(token, std::string("mobile")).IsOk());
    EXPECT_EQ(verifier_->Verify(token, std::string("api")).code, ErrorCode::AudienceMismatch);
    // 未指定期望 audience 时不检查
    EXPECT_TRUE(verifier_->Verify(token).IsOk());
    EXPECT_TRUE(verifier_->Verify(token, std::string("")).IsOk());
}

// ============================================================================
// 结构错误
// ============================================================================

TEST_F(TokenVerifierTest, EmptyTokenIsMissing) {
    EXPECT_EQ(verifier_->Verify("").code, ErrorCode::TokenMissing);
}

TEST_F(TokenVerifierTest, MalformedStructures) {
    EXPECT_EQ(verifier_->Verify("not-a-jwt").code, ErrorCode::TokenMalformed);
    EXPECT_EQ(verifier_->Verify("a.b").code, ErrorCode::TokenMalformed);
    EXPECT_EQ(verifier_->Verify("a..c").code, ErrorCode::TokenMalformed);
    EXPECT_EQ(verifier_->Verify("!!!.???.***").code, ErrorCode::TokenMalformed);
    // 合法 base64url 但不是 JSON
    std::string junk = Base64UrlEncode("hello");
    EXPECT_EQ(verifier_->Verify(junk + "." + junk + "." + junk).code, ErrorCode::TokenMalformed);
}

TEST_F(TokenVerifierTest, MissingRequiredClaimIsMalformed) {
    for (const char* claim : {"tv", "nbf", "role", "iat", "exp"}) {
        auto payload = ValidPayload();
        payload.erase(claim);
        EXPECT_EQ(verifier_->Verify(SignRaw(ValidHeader(), payload)).code, ErrorCode::TokenMalformed)
            << "missing " << claim;
    }
}

// email / app_id 可缺省
TEST_F(TokenVerifierTest, OptionalClaimsMayBeAbsent) {
    auto claims = verifier_->Verify(SignRaw(ValidHeader(), ValidPayload()));
    ASSERT_TRUE(claims.IsOk()) << claims.message;
    EXPECT_TRUE(claims.Value().email.empty());
    EXPECT_TRUE(claims.Value().app_id.empty());
}

TEST_F(TokenVerifierTest, WrongAlgorithmIsMalformed) {
    auto header = ValidHeader();
    header["alg"] = "HS256";
    EXPECT_EQ(verifier_->Verify(SignRaw(header, ValidPayload())).code, ErrorCode::TokenMalformed);
}

// ============================================================================
// 签名
// ============================================================================

TEST_F(TokenVerifierTest, TamperedPayloadFailsSignature) {
    std::string token = IssueToken();
    auto parts = SplitView(token, '.');

    auto payload = nlohmann::json::parse(*Base64UrlDecode(parts[1]));
    payload["role"] = "admin";
    std::string forged = std::string(parts[0]) + "." + Base64UrlEncode(payload.dump()) + "." +
                         std::string(parts[2]);

    EXPECT_EQ(verifier_->Verify(forged).code, ErrorCode::SignatureInvalid);
}

TEST_F(TokenVerifierTest, UnknownKidFailsSignature) {
    // 另一个存储中的密钥：kid 在本存储中不存在
    auto foreign_store = std::make_shared<InMemoryKeyStore>();
    auto foreign_keys = std::make_shared<KeyManager>(foreign_store, clock_);
    TokenIssuer foreign_issuer(foreign_keys, config_, clock_);
    auto issued = foreign_issuer.Issue(user_);
    ASSERT_TRUE(issued.IsOk());

    EXPECT_EQ(verifier_->Verify(issued.Value().token).code, ErrorCode::SignatureInvalid);
}

// ============================================================================
// 时效 / issuer
// ============================================================================

TEST_F(TokenVerifierTest, IssuerMismatch) {
    auto payload = ValidPayload();
    payload["iss"] = "https://evil.test";
    EXPECT_EQ(verifier_->Verify(SignRaw(ValidHeader(), payload)).code, ErrorCode::IssuerMismatch);
}

TEST_F(TokenVerifierTest, ExpiresAtExactBoundary) {
    std::string token = IssueToken();

    clock_->Advance(std::chrono::seconds(899));
    EXPECT_TRUE(verifier_->Verify(token).IsOk());

    clock_->Advance(std::chrono::seconds(1));
    EXPECT_EQ(verifier_->Verify(token).code, ErrorCode::TokenExpired);
}

TEST_F(TokenVerifierTest, ClockSkewExtendsExpiry) {
    config_.clock_skew_seconds = 30;
    Rebuild();
    std::string token = IssueToken();

    clock_->Advance(std::chrono::seconds(920));
    EXPECT_TRUE(verifier_->Verify(token).IsOk());

    clock_->Advance(std::chrono::seconds(10));
    EXPECT_EQ(verifier_->Verify(token).code, ErrorCode::TokenExpired);
}

TEST_F(TokenVerifierTest, NotYetValid) {
    auto payload = ValidPayload();
    payload["nbf"] = payload["iat"].get<int64_t>() + 60;
    EXPECT_EQ(verifier_->Verify(SignRaw(ValidHeader(), payload)).code, ErrorCode::TokenNotYetValid);
}

// ============================================================================
// tokenVersion
// ============================================================================

TEST_F(TokenVerifierTest, BumpedTokenVersionInvalidatesToken) {
    std::string token = IssueToken();
    ASSERT_TRUE(verifier_->Verify(token).IsOk());

    auto bumped = users_->BumpTokenVersion(user_.id);
    ASSERT_TRUE(bumped.IsOk());
    EXPECT_EQ(bumped.Value(), 4);

    EXPECT_EQ(verifier_->Verify(token).code, ErrorCode::TokenVersionStale);

    // 新签发的 Token 携带 tv=4
    user_.token_version = 4;
    std::string fresh = IssueToken();
    auto verified = verifier_->Verify(fresh);
    ASSERT_TRUE(verified.IsOk());
    EXPECT_EQ(verified.Value().token_version, 4);
}

TEST_F(TokenVerifierTest, DeletedUserIsStale) {
    auto payload = ValidPayload();
    payload["sub"] = "ghost";
    EXPECT_EQ(verifier_->Verify(SignRaw(ValidHeader(), payload)).code, ErrorCode::TokenVersionStale);
}

TEST_F(TokenVerifierTest, UserStoreUnavailable) {
    auto users = std::make_shared<MockUserStore>();
    EXPECT_CALL(*users, GetTokenVersion(_))
        .WillOnce(Return(Result<int64_t>::Fail(ErrorCode::ServiceUnavailable)));
    TokenVerifier verifier(key_manager_, users, denylist_, config_, clock_);

    EXPECT_EQ(verifier.Verify(IssueToken()).code, ErrorCode::ServiceUnavailable);
}

// ============================================================================
// 密钥轮换 / 黑名单
// ============================================================================

TEST_F(TokenVerifierTest, PreRotationTokenStillVerifies) {
    std::string old_token = IssueToken();

    clock_->Advance(std::chrono::seconds(10));
    ASSERT_TRUE(key_manager_->Rotate(false).IsOk());

    std::string new_token = IssueToken();
    EXPECT_TRUE(verifier_->Verify(old_token).IsOk());
    EXPECT_TRUE(verifier_->Verify(new_token).IsOk());
    EXPECT_NE(verifier_->Verify(old_token).Value().kid, verifier_->Verify(new_token).Value().kid);
}

TEST_F(TokenVerifierTest, RevokedJtiRejected) {
    auto issued = issuer_->Issue(user_);
    ASSERT_TRUE(issued.IsOk());

    RevokedAccessTokenEntry entry;
    entry.jti = issued.Value().claims.jti;
    entry.user_id = user_.id;
    entry.expires_at = FromUnixSeconds(issued.Value().claims.exp);
    ASSERT_TRUE(denylist_->Revoke(entry).IsOk());

    EXPECT_EQ(verifier_->Verify(issued.Value().token).code, ErrorCode::TokenRevoked);
    // 签名校验不看黑名单
    EXPECT_TRUE(verifier_->VerifySignature(issued.Value().token).IsOk());
}

TEST_F(TokenVerifierTest, DenylistIgnoredWhenDisabled) {
    config_.enable_jti_denylist = false;
    Rebuild();
    auto issued = issuer_->Issue(user_);
    ASSERT_TRUE(issued.IsOk());

    RevokedAccessTokenEntry entry;
    entry.jti = issued.Value().claims.jti;
    entry.expires_at = FromUnixSeconds(issued.Value().claims.exp);
    ASSERT_TRUE(denylist_->Revoke(entry).IsOk());

    EXPECT_TRUE(verifier_->Verify(issued.Value().token).IsOk());
}

// 过期 Token 先报 Expired，不再查用户版本
TEST_F(TokenVerifierTest, CheckOrderExpiredBeforeVersion) {
    std::string token = IssueToken();
    ASSERT_TRUE(users_->BumpTokenVersion(user_.id).IsOk());
    clock_->Advance(std::chrono::seconds(3600));

    EXPECT_EQ(verifier_->Verify(token).code, ErrorCode::TokenExpired);
}

}  // namespace test
}  // namespace token_service
