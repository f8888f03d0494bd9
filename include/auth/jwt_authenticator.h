#pragma once

#include "auth/authenticator.h"
#include "common/utils.h"
#include "token/token_verifier.h"
#include <memory>

namespace token_service {

class JwtAuthenticator : public Authenticator {
public:
    explicit JwtAuthenticator(std::shared_ptr<TokenVerifier> verifier)
        : verifier_(std::move(verifier)) {}

    // ============================================================================
    // gRPC 请求认证函数
    // ============================================================================

    /// @brief 从 gRPC 上下文中验证 Access Token 并提取调用方信息
    /// @details
    ///   ┌────────────────────────────────────────────────────────────────┐
    ///   │  认证流程                                                      │
    ///   ├────────────────────────────────────────────────────────────────┤
    ///   │  1. 提取 metadata 中的 "authorization"                         │
    ///   │       │                                                        │
    ///   │       ▼                                                        │
    ///   │  2. 验证格式："Bearer " + token（scheme 大小写不敏感）         │
    ///   │       │                                                        │
    ///   │       ▼                                                        │
    ///   │  3. TokenVerifier::Verify（签名 / iss / 有效期 / tv / 黑名单） │
    ///   │       │                                                        │
    ///   │       ▼                                                        │
    ///   │  4. 返回 AuthContext（user_id, role, email, app_id, jti）      │
    ///   └────────────────────────────────────────────────────────────────┘
    ///
    ///   管理接口不限定 audience，只看 role。
    ///
    Result<AuthContext> Authenticate(::grpc::ServerContext* context) override {
        const auto& metadata = context->client_metadata();
        auto it = metadata.find("authorization");

        if (it == metadata.end()) {
            return Result<AuthContext>::Fail(ErrorCode::TokenMissing, "缺少认证信息");
        }

        std::string auth_header(it->second.data(), it->second.size());

        const std::string prefix = "bearer ";
        if (auth_header.size() < prefix.size() ||
            ToLower(auth_header.substr(0, prefix.size())) != prefix) {
            return Result<AuthContext>::Fail(ErrorCode::TokenMissing, "认证格式错误");
        }

        std::string token = auth_header.substr(prefix.length());
        if (token.empty()) {
            return Result<AuthContext>::Fail(ErrorCode::TokenMissing, "Token 不能为空");
        }

        auto verify_result = verifier_->Verify(token);
        if (!verify_result.IsOk()) {
            return Result<AuthContext>::FailFrom(verify_result);
        }

        const auto& claims = verify_result.Value();
        AuthContext auth_ctx;
        auth_ctx.user_id = claims.sub;
        auth_ctx.role = claims.role;
        auth_ctx.email = claims.email;
        auth_ctx.app_id = claims.app_id;
        auth_ctx.jti = claims.jti;

        return Result<AuthContext>::Ok(auth_ctx);
    }

private:
    std::shared_ptr<TokenVerifier> verifier_;
};

}  // namespace token_service
