#pragma once

#include <memory>
#include "pb_token/token.grpc.pb.h"
#include "auth/authenticator.h"
#include "config/config.h"
#include "service/auth_service.h"

namespace token_service {

class TokenHandler final : public ::pb_token::TokenService::Service {
public:
    TokenHandler(std::shared_ptr<AuthService> auth_service,
                 std::shared_ptr<Authenticator> authenticator,
                 const AdminConfig& admin_config);

    // 登录 / 刷新 / 登出
    ::grpc::Status Login(::grpc::ServerContext* context,
                         const ::pb_token::LoginRequest* request,
                         ::pb_token::LoginResponse* response) override;

    ::grpc::Status Refresh(::grpc::ServerContext* context,
                           const ::pb_token::RefreshRequest* request,
                           ::pb_token::RefreshResponse* response) override;

    ::grpc::Status Logout(::grpc::ServerContext* context,
                          const ::pb_token::LogoutRequest* request,
                          ::pb_token::LogoutResponse* response) override;

    ::grpc::Status LogoutAll(::grpc::ServerContext* context,
                             const ::pb_token::LogoutAllRequest* request,
                             ::pb_token::LogoutAllResponse* response) override;

    // 资源服务调用
    ::grpc::Status VerifyAccessToken(::grpc::ServerContext* context,
                                     const ::pb_token::VerifyAccessTokenRequest* request,
                                     ::pb_token::VerifyAccessTokenResponse* response) override;

    ::grpc::Status GetJwks(::grpc::ServerContext* context,
                           const ::pb_token::GetJwksRequest* request,
                           ::pb_token::GetJwksResponse* response) override;

    // 管理接口
    ::grpc::Status RevokeAccessToken(::grpc::ServerContext* context,
                                     const ::pb_token::RevokeAccessTokenRequest* request,
                                     ::pb_token::RevokeAccessTokenResponse* response) override;

    ::grpc::Status IsAccessTokenRevoked(::grpc::ServerContext* context,
                                        const ::pb_token::IsAccessTokenRevokedRequest* request,
                                        ::pb_token::IsAccessTokenRevokedResponse* response) override;

    ::grpc::Status Introspect(::grpc::ServerContext* context,
                              const ::pb_token::IntrospectRequest* request,
                              ::pb_token::IntrospectResponse* response) override;

    ::grpc::Status GenerateKey(::grpc::ServerContext* context,
                               const ::pb_token::GenerateKeyRequest* request,
                               ::pb_token::GenerateKeyResponse* response) override;

    ::grpc::Status RetireKey(::grpc::ServerContext* context,
                             const ::pb_token::RetireKeyRequest* request,
                             ::pb_token::RetireKeyResponse* response) override;

    ::grpc::Status RotateKeys(::grpc::ServerContext* context,
                              const ::pb_token::RotateKeysRequest* request,
                              ::pb_token::RotateKeysResponse* response) override;

    ::grpc::Status ListKeys(::grpc::ServerContext* context,
                            const ::pb_token::ListKeysRequest* request,
                            ::pb_token::ListKeysResponse* response) override;

private:
    /// @brief 认证 + 要求 role == admin.role
    Result<AuthContext> RequireAdmin(::grpc::ServerContext* context);

    std::shared_ptr<AuthService> auth_service_;
    std::shared_ptr<Authenticator> authenticator_;
    AdminConfig admin_config_;
};

}  // namespace token_service
