// tests/auth/jwt_authenticator_test.cpp
#include <grpcpp/test/server_context_test_spouse.h>

#include "auth/jwt_authenticator.h"
#include "service/service_test_fixture.h"

namespace token_service {
namespace test {

class JwtAuthenticatorTest : public ServiceTestFixture {
protected:
    void SetUp() override {
        ServiceTestFixture::SetUp();
        authenticator_ = std::make_shared<JwtAuthenticator>(verifier_);
        context_ = std::make_unique<grpc::ServerContext>();
        spouse_ = std::make_unique<grpc::testing::ServerContextTestSpouse>(context_.get());
    }

    Result<AuthContext> AuthenticateWith(const std::string& header) {
        spouse_->AddClientMetadata("authorization", header);
        return authenticator_->Authenticate(context_.get());
    }

    std::shared_ptr<JwtAuthenticator> authenticator_;
    std::unique_ptr<grpc::ServerContext> context_;
    std::unique_ptr<grpc::testing::ServerContextTestSpouse> spouse_;
};

TEST_F(JwtAuthenticatorTest, ValidBearerToken) {
    auto tokens = LoginAlice();

    auto auth = AuthenticateWith("Bearer " + tokens.access_token);

    ASSERT_TRUE(auth.IsOk()) << auth.message;
    EXPECT_EQ(auth.Value().user_id, "u-alice");
    EXPECT_EQ(auth.Value().role, "user");
    EXPECT_EQ(auth.Value().email, "alice@example.com");
    EXPECT_EQ(auth.Value().app_id, "app-main");
    EXPECT_FALSE(auth.Value().jti.empty());
}

TEST_F(JwtAuthenticatorTest, SchemeIsCaseInsensitive) {
    auto tokens = LoginAlice();

    EXPECT_TRUE(AuthenticateWith("bearer " + tokens.access_token).IsOk());
}

TEST_F(JwtAuthenticatorTest, MissingHeader) {
    auto auth = authenticator_->Authenticate(context_.get());
    EXPECT_EQ(auth.code, ErrorCode::TokenMissing);
}

TEST_F(JwtAuthenticatorTest, WrongScheme) {
    auto tokens = LoginAlice();
    EXPECT_EQ(AuthenticateWith("Basic " + tokens.access_token).code, ErrorCode::TokenMissing);
}

TEST_F(JwtAuthenticatorTest, EmptyToken) {
    EXPECT_EQ(AuthenticateWith("Bearer ").code, ErrorCode::TokenMissing);
}

TEST_F(JwtAuthenticatorTest, VerificationErrorsPropagate) {
    EXPECT_EQ(AuthenticateWith("Bearer not.a.token").code, ErrorCode::TokenMalformed);
}

TEST_F(JwtAuthenticatorTest, StaleTokenAfterGlobalLogout) {
    auto tokens = LoginAlice();
    ASSERT_TRUE(auth_service_->GlobalLogout(alice_.id).IsOk());

    EXPECT_EQ(AuthenticateWith("Bearer " + tokens.access_token).code, ErrorCode::TokenVersionStale);
}

}  // namespace test
}  // namespace token_service
