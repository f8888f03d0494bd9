// tests/server/grpc_server_test.cpp

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>
#include <grpcpp/grpcpp.h>

#include "server/grpc_server.h"
#include "pb_token/token.grpc.pb.h"

namespace token_service {
namespace test {

class GrpcServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 创建测试配置：内存存储，不依赖外部服务
        config_ = std::make_shared<Config>();
        config_->server.host = "127.0.0.1";
        config_->server.grpc_port = GetAvailablePort();
        config_->storage.backend = "memory";

        config_->security.jwt_issuer = "https://auth.test";
        config_->security.access_token_ttl_seconds = 300;
        config_->security.refresh_token_ttl_seconds = 3600;

        config_->cleanup.run_on_start = false;

        config_->log.path = (std::filesystem::temp_directory_path() / "grpc_server_test_logs").string();
        config_->log.console_output = false;
        config_->log.level = "warn";

        clock_ = std::make_shared<ManualClock>();
    }

    void TearDown() override {
        server_.reset();
    }

    static int GetAvailablePort() {
        static int port = 50400;
        return port++;
    }

    std::unique_ptr<pb_token::TokenService::Stub> CreateStub() {
        auto channel = grpc::CreateChannel(server_->GetAddress(), grpc::InsecureChannelCredentials());
        return pb_token::TokenService::NewStub(channel);
    }

    std::shared_ptr<Config> config_;
    std::shared_ptr<ManualClock> clock_;
    std::unique_ptr<GrpcServer> server_;
};

// ============================================================================
// 构造函数测试
// ============================================================================

TEST_F(GrpcServerTest, Constructor_ValidConfig_Succeeds) {
    EXPECT_NO_THROW({
        server_ = std::make_unique<GrpcServer>(config_, clock_);
    });
    EXPECT_FALSE(server_->IsRunning());
}

TEST_F(GrpcServerTest, Constructor_NullConfig_Throws) {
    EXPECT_THROW(std::make_unique<GrpcServer>(nullptr), std::invalid_argument);
}

TEST_F(GrpcServerTest, Constructor_NullClock_Throws) {
    EXPECT_THROW(std::make_unique<GrpcServer>(config_, nullptr), std::invalid_argument);
}

TEST_F(GrpcServerTest, GetAddress_ReturnsCorrectFormat) {
    config_->server.grpc_port = 50999;
    server_ = std::make_unique<GrpcServer>(config_, clock_);
    EXPECT_EQ(server_->GetAddress(), "127.0.0.1:50999");
}

TEST_F(GrpcServerTest, Accessors_BeforeInit_ReturnNull) {
    server_ = std::make_unique<GrpcServer>(config_, clock_);
    EXPECT_EQ(server_->GetAuthService(), nullptr);
    EXPECT_EQ(server_->GetKeyManager(), nullptr);
    EXPECT_EQ(server_->GetUserStore(), nullptr);
    EXPECT_EQ(server_->GetConfig(), config_);
}

TEST_F(GrpcServerTest, Start_BeforeInitialize_Fails) {
    server_ = std::make_unique<GrpcServer>(config_, clock_);
    EXPECT_FALSE(server_->Start());
    EXPECT_FALSE(server_->IsRunning());
}

TEST_F(GrpcServerTest, ShutdownWithoutStart_Succeeds) {
    server_ = std::make_unique<GrpcServer>(config_, clock_);
    EXPECT_NO_THROW(server_->Shutdown());
    EXPECT_FALSE(server_->IsRunning());
}

// ============================================================================
// 内存后端装配测试
// ============================================================================

TEST_F(GrpcServerTest, Initialize_MemoryBackend_BootstrapsSigningKey) {
    server_ = std::make_unique<GrpcServer>(config_, clock_);
    ASSERT_TRUE(server_->Initialize());

    ASSERT_NE(server_->GetAuthService(), nullptr);
    ASSERT_NE(server_->GetKeyManager(), nullptr);

    auto keys = server_->GetKeyManager()->ListKeys();
    ASSERT_TRUE(keys.IsOk());
    ASSERT_EQ(keys.Value().size(), 1u);
    EXPECT_TRUE(keys.Value()[0].is_active);

    auto jwks = server_->GetAuthService()->GetPublicKeySet();
    ASSERT_TRUE(jwks.IsOk());
    EXPECT_EQ(jwks.Value().keys.size(), 1u);
}

// 内存后端不预置任何用户
TEST_F(GrpcServerTest, Initialize_MemoryBackend_EmptyUserStore) {
    server_ = std::make_unique<GrpcServer>(config_, clock_);
    ASSERT_TRUE(server_->Initialize());

    auto login = server_->GetAuthService()->Login("alice@example.com", "whatever", "127.0.0.1", "");
    EXPECT_EQ(login.code, ErrorCode::InvalidCredentials);
}

// ============================================================================
// 生命周期测试
// ============================================================================

TEST_F(GrpcServerTest, StartAndShutdown_InvokesCallback) {
    server_ = std::make_unique<GrpcServer>(config_, clock_);
    ASSERT_TRUE(server_->Initialize());

    std::atomic<bool> called{false};
    server_->SetShutdownCallback([&called]() { called.store(true); });

    ASSERT_TRUE(server_->Start());
    EXPECT_TRUE(server_->IsRunning());

    // 重复 Start 无副作用
    EXPECT_TRUE(server_->Start());

    server_->Shutdown(std::chrono::milliseconds(500));
    server_->Wait();

    EXPECT_FALSE(server_->IsRunning());
    EXPECT_TRUE(called.load());
}

TEST_F(GrpcServerTest, ServesRpcsOverTheWire) {
    server_ = std::make_unique<GrpcServer>(config_, clock_);
    ASSERT_TRUE(server_->Initialize());
    ASSERT_TRUE(server_->Start());

    auto stub = CreateStub();

    {
        grpc::ClientContext context;
        context.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(5));
        pb_token::GetJwksRequest request;
        pb_token::GetJwksResponse response;

        auto status = stub->GetJwks(&context, request, &response);

        ASSERT_TRUE(status.ok()) << status.error_message();
        EXPECT_EQ(response.result().code(), pb_common::ErrorCode::OK);
        EXPECT_NE(response.jwks_json().find("\"keys\""), std::string::npos);
        EXPECT_NE(response.cache_control().find("max-age="), std::string::npos);
    }

    {
        // 未带 Bearer Token 的管理调用
        grpc::ClientContext context;
        context.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(5));
        pb_token::ListKeysRequest request;
        pb_token::ListKeysResponse response;

        auto status = stub->ListKeys(&context, request, &response);

        ASSERT_TRUE(status.ok()) << status.error_message();
        EXPECT_EQ(response.result().code(), pb_common::ErrorCode::TOKEN_MISSING);
    }

    server_->Shutdown(std::chrono::milliseconds(500));
    server_->Wait();
}

TEST_F(GrpcServerTest, DestructorStopsRunningServer) {
    server_ = std::make_unique<GrpcServer>(config_, clock_);
    ASSERT_TRUE(server_->Initialize());
    ASSERT_TRUE(server_->Start());

    EXPECT_NO_THROW(server_.reset());
}

}  // namespace test
}  // namespace token_service
