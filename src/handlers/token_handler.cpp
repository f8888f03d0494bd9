#include "handlers/token_handler.h"
#include "common/logger.h"
#include "common/validator.h"
#include "common/proto_converter.h"
#include "common/error_codes.h"

namespace token_service {

namespace {

// 请求未带 origin 时取对端地址（如 "ipv4:10.0.0.1:53422"）
inline std::string ResolveOrigin(::grpc::ServerContext* context, const std::string& requested) {
    if (!requested.empty()) {
        return requested;
    }
    std::string peer = context ? context->peer() : "";
    return peer.empty() ? "unknown" : peer;
}

}  // namespace

// ============================================================================
// 构造函数
// ============================================================================

TokenHandler::TokenHandler(std::shared_ptr<AuthService> auth_service,
                           std::shared_ptr<Authenticator> authenticator,
                           const AdminConfig& admin_config)
    : auth_service_(std::move(auth_service)),
      authenticator_(std::move(authenticator)),
      admin_config_(admin_config) {
}

Result<AuthContext> TokenHandler::RequireAdmin(::grpc::ServerContext* context) {
    auto auth_ctx = authenticator_->Authenticate(context);
    if (!auth_ctx.IsOk()) {
        return auth_ctx;
    }
    if (auth_ctx.Value().role != admin_config_.role) {
        LOG_WARN("Admin RPC denied, user_id={}, role={}", auth_ctx.Value().user_id, auth_ctx.Value().role);
        return Result<AuthContext>::Fail(ErrorCode::PermissionDenied, "需要管理员权限");
    }
    return auth_ctx;
}

// ============================================================================
// 登录
// ============================================================================

::grpc::Status TokenHandler::Login(
    ::grpc::ServerContext* context,
    const ::pb_token::LoginRequest* request,
    ::pb_token::LoginResponse* response) {

    LOG_INFO("Login: email={}", request->email());

    // 1. 参数校验
    std::string error;
    if (!IsValidEmail(request->email(), error)) {
        SetResultError(response->mutable_result(), ErrorCode::InvalidArgument, error);
        return ::grpc::Status::OK;
    }
    if (!IsValidPassword(request->password(), error)) {
        SetResultError(response->mutable_result(), ErrorCode::InvalidArgument, error);
        return ::grpc::Status::OK;
    }

    std::string origin = ResolveOrigin(context, request->origin());

    // 2. 调用业务逻辑
    auto result = auth_service_->Login(request->email(), request->password(), origin, request->audience());

    // 3. 设置响应
    SetResultError(response->mutable_result(), result.code, result.message);

    if (result.IsOk()) {
        ToProtoUserInfo(result.Value().user, response->mutable_user());
        ToProtoTokenPair(result.Value().tokens, response->mutable_tokens());
    } else if (result.code == ErrorCode::AccountLockedOut) {
        auto status = auth_service_->CheckLockout(origin, request->email());
        response->set_retry_after_seconds(status.retry_after_seconds);
    } else if (result.code == ErrorCode::RateLimited) {
        auto status = auth_service_->CheckRateLimit(RateLimitScope::Login, origin);
        response->set_retry_after_seconds(status.retry_after_seconds);
    }

    return ::grpc::Status::OK;
}

// ============================================================================
// 刷新 Token
// ============================================================================

::grpc::Status TokenHandler::Refresh(
    ::grpc::ServerContext* context,
    const ::pb_token::RefreshRequest* request,
    ::pb_token::RefreshResponse* response) {

    LOG_DEBUG("Refresh requested");

    // 1. 参数校验（格式错误与已使用不做区分，交给业务层统一处理）
    if (request->refresh_token().empty()) {
        SetResultError(response->mutable_result(), ErrorCode::InvalidArgument, "refresh_token 不能为空");
        return ::grpc::Status::OK;
    }

    std::string origin = ResolveOrigin(context, request->origin());

    // 2. 调用业务逻辑
    auto result = auth_service_->RotateRefresh(request->refresh_token(), request->audience(), origin);

    // 3. 设置响应
    SetResultError(response->mutable_result(), result.code, result.message);

    if (result.IsOk()) {
        ToProtoTokenPair(result.Value(), response->mutable_tokens());
    } else if (result.code == ErrorCode::RateLimited) {
        auto status = auth_service_->CheckRateLimit(RateLimitScope::Refresh, origin);
        response->set_retry_after_seconds(status.retry_after_seconds);
    }

    return ::grpc::Status::OK;
}

// ============================================================================
// 登出
// ============================================================================

::grpc::Status TokenHandler::Logout(
    ::grpc::ServerContext* context,
    const ::pb_token::LogoutRequest* request,
    ::pb_token::LogoutResponse* response) {

    LOG_DEBUG("Logout requested");

    if (request->refresh_token().empty()) {
        SetResultError(response->mutable_result(), ErrorCode::InvalidArgument, "refresh_token 不能为空");
        return ::grpc::Status::OK;
    }

    auto result = auth_service_->Logout(request->refresh_token());
    SetResultError(response->mutable_result(), result.code, result.message);

    return ::grpc::Status::OK;
}

// ============================================================================
// 全局登出（所有设备）
// ============================================================================

::grpc::Status TokenHandler::LogoutAll(
    ::grpc::ServerContext* context,
    const ::pb_token::LogoutAllRequest* request,
    ::pb_token::LogoutAllResponse* response) {

    LOG_INFO("LogoutAll: user_id={}", request->user_id());

    // 1. 认证：本人或管理员
    auto auth_ctx = authenticator_->Authenticate(context);
    if (!auth_ctx.IsOk()) {
        SetResultError(response->mutable_result(), auth_ctx.code, auth_ctx.message);
        return ::grpc::Status::OK;
    }

    std::string user_id = request->user_id().empty() ? auth_ctx.Value().user_id : request->user_id();

    std::string error;
    if (!IsValidUserId(user_id, error)) {
        SetResultError(response->mutable_result(), ErrorCode::InvalidArgument, error);
        return ::grpc::Status::OK;
    }
    if (user_id != auth_ctx.Value().user_id && auth_ctx.Value().role != admin_config_.role) {
        SetResultError(response->mutable_result(), ErrorCode::PermissionDenied, "只能登出自己的账号");
        return ::grpc::Status::OK;
    }

    // 2. 调用业务逻辑
    auto result = auth_service_->GlobalLogout(user_id);

    // 3. 设置响应
    SetResultError(response->mutable_result(), result.code, result.message);

    if (result.IsOk()) {
        response->set_token_version(result.Value());
    }

    return ::grpc::Status::OK;
}

// ============================================================================
// 校验 Access Token
// ============================================================================

::grpc::Status TokenHandler::VerifyAccessToken(
    ::grpc::ServerContext* context,
    const ::pb_token::VerifyAccessTokenRequest* request,
    ::pb_token::VerifyAccessTokenResponse* response) {

    LOG_DEBUG("VerifyAccessToken requested");

    if (request->access_token().empty()) {
        SetResultError(response->mutable_result(), ErrorCode::TokenMissing);
        return ::grpc::Status::OK;
    }

    std::optional<std::string> audience;
    if (!request->audience().empty()) {
        audience = request->audience();
    }

    auto result = auth_service_->VerifyAccessToken(request->access_token(), audience);
    SetResultError(response->mutable_result(), result.code, result.message);

    if (result.IsOk()) {
        ToProtoClaims(result.Value(), response->mutable_claims());
    }

    return ::grpc::Status::OK;
}

// ============================================================================
// 公钥集合
// ============================================================================

::grpc::Status TokenHandler::GetJwks(
    ::grpc::ServerContext* context,
    const ::pb_token::GetJwksRequest* request,
    ::pb_token::GetJwksResponse* response) {

    LOG_DEBUG("GetJwks requested");

    auto result = auth_service_->GetPublicKeySet();
    SetResultError(response->mutable_result(), result.code, result.message);

    if (result.IsOk()) {
        response->set_jwks_json(result.Value().json);
        response->set_cache_control(result.Value().cache_control);
    }

    return ::grpc::Status::OK;
}

// ============================================================================
// 管理接口：吊销 Access Token
// ============================================================================

::grpc::Status TokenHandler::RevokeAccessToken(
    ::grpc::ServerContext* context,
    const ::pb_token::RevokeAccessTokenRequest* request,
    ::pb_token::RevokeAccessTokenResponse* response) {

    LOG_INFO("RevokeAccessToken: jti={}", request->jti());

    // 1. 认证 + 权限
    auto auth_ctx = RequireAdmin(context);
    if (!auth_ctx.IsOk()) {
        SetResultError(response->mutable_result(), auth_ctx.code, auth_ctx.message);
        return ::grpc::Status::OK;
    }

    // 2. 按 Token 原文吊销
    if (!request->access_token().empty()) {
        auto result = auth_service_->RevokeAccessTokenByValue(request->access_token(), request->reason());
        SetResultError(response->mutable_result(), result.code, result.message);
        if (result.IsOk()) {
            response->set_jti(result.Value().jti);
        }
        return ::grpc::Status::OK;
    }

    // 3. 按 jti 吊销
    std::string error;
    if (!IsValidJti(request->jti(), error)) {
        SetResultError(response->mutable_result(), ErrorCode::InvalidArgument, error);
        return ::grpc::Status::OK;
    }
    if (request->expires_at() <= 0) {
        SetResultError(response->mutable_result(), ErrorCode::InvalidArgument, "expires_at 必须为正数");
        return ::grpc::Status::OK;
    }

    auto result = auth_service_->RevokeAccessToken(request->jti(),
                                                   request->user_id(),
                                                   request->app_id(),
                                                   FromUnixSeconds(request->expires_at()),
                                                   request->reason());
    SetResultError(response->mutable_result(), result.code, result.message);
    if (result.IsOk()) {
        response->set_jti(request->jti());
    }

    return ::grpc::Status::OK;
}

// ============================================================================
// 管理接口：查询吊销状态
// ============================================================================

::grpc::Status TokenHandler::IsAccessTokenRevoked(
    ::grpc::ServerContext* context,
    const ::pb_token::IsAccessTokenRevokedRequest* request,
    ::pb_token::IsAccessTokenRevokedResponse* response) {

    LOG_DEBUG("IsAccessTokenRevoked: jti={}", request->jti());

    auto auth_ctx = RequireAdmin(context);
    if (!auth_ctx.IsOk()) {
        SetResultError(response->mutable_result(), auth_ctx.code, auth_ctx.message);
        return ::grpc::Status::OK;
    }

    std::string error;
    if (!IsValidJti(request->jti(), error)) {
        SetResultError(response->mutable_result(), ErrorCode::InvalidArgument, error);
        return ::grpc::Status::OK;
    }

    auto result = auth_service_->IsAccessTokenRevoked(request->jti());
    SetResultError(response->mutable_result(), result.code, result.message);

    if (result.IsOk()) {
        response->set_revoked(result.Value());
    }

    return ::grpc::Status::OK;
}

// ============================================================================
// 管理接口：内省
// ============================================================================

::grpc::Status TokenHandler::Introspect(
    ::grpc::ServerContext* context,
    const ::pb_token::IntrospectRequest* request,
    ::pb_token::IntrospectResponse* response) {

    LOG_DEBUG("Introspect requested");

    auto auth_ctx = RequireAdmin(context);
    if (!auth_ctx.IsOk()) {
        SetResultError(response->mutable_result(), auth_ctx.code, auth_ctx.message);
        return ::grpc::Status::OK;
    }

    if (request->token().empty()) {
        SetResultError(response->mutable_result(), ErrorCode::InvalidArgument, "token 不能为空");
        return ::grpc::Status::OK;
    }

    auto result = auth_service_->Introspect(request->token());
    SetResultError(response->mutable_result(), result.code, result.message);

    if (result.IsOk()) {
        SetIntrospectResponse(result.Value(), response);
    }

    return ::grpc::Status::OK;
}

// ============================================================================
// 管理接口：签名密钥
// ============================================================================

::grpc::Status TokenHandler::GenerateKey(
    ::grpc::ServerContext* context,
    const ::pb_token::GenerateKeyRequest* request,
    ::pb_token::GenerateKeyResponse* response) {

    LOG_INFO("GenerateKey: activate={}", request->activate());

    auto auth_ctx = RequireAdmin(context);
    if (!auth_ctx.IsOk()) {
        SetResultError(response->mutable_result(), auth_ctx.code, auth_ctx.message);
        return ::grpc::Status::OK;
    }

    auto result = auth_service_->GenerateKey(request->activate());
    SetResultError(response->mutable_result(), result.code, result.message);

    if (result.IsOk()) {
        ToProtoKeyInfo(result.Value(), response->mutable_key());
    }

    return ::grpc::Status::OK;
}

::grpc::Status TokenHandler::RetireKey(
    ::grpc::ServerContext* context,
    const ::pb_token::RetireKeyRequest* request,
    ::pb_token::RetireKeyResponse* response) {

    LOG_INFO("RetireKey: kid={}", request->kid());

    auto auth_ctx = RequireAdmin(context);
    if (!auth_ctx.IsOk()) {
        SetResultError(response->mutable_result(), auth_ctx.code, auth_ctx.message);
        return ::grpc::Status::OK;
    }

    std::string error;
    if (!IsValidKid(request->kid(), error)) {
        SetResultError(response->mutable_result(), ErrorCode::InvalidArgument, error);
        return ::grpc::Status::OK;
    }

    auto result = auth_service_->RetireKey(request->kid());
    SetResultError(response->mutable_result(), result.code, result.message);

    return ::grpc::Status::OK;
}

::grpc::Status TokenHandler::RotateKeys(
    ::grpc::ServerContext* context,
    const ::pb_token::RotateKeysRequest* request,
    ::pb_token::RotateKeysResponse* response) {

    LOG_INFO("RotateKeys: graceful={}", request->graceful());

    auto auth_ctx = RequireAdmin(context);
    if (!auth_ctx.IsOk()) {
        SetResultError(response->mutable_result(), auth_ctx.code, auth_ctx.message);
        return ::grpc::Status::OK;
    }

    auto result = auth_service_->RotateKeys(request->graceful());
    SetResultError(response->mutable_result(), result.code, result.message);

    if (result.IsOk()) {
        ToProtoKeyInfo(result.Value(), response->mutable_key());
    }

    return ::grpc::Status::OK;
}

::grpc::Status TokenHandler::ListKeys(
    ::grpc::ServerContext* context,
    const ::pb_token::ListKeysRequest* request,
    ::pb_token::ListKeysResponse* response) {

    LOG_DEBUG("ListKeys requested");

    auto auth_ctx = RequireAdmin(context);
    if (!auth_ctx.IsOk()) {
        SetResultError(response->mutable_result(), auth_ctx.code, auth_ctx.message);
        return ::grpc::Status::OK;
    }

    auto result = auth_service_->ListKeys();
    SetResultError(response->mutable_result(), result.code, result.message);

    if (result.IsOk()) {
        for (const auto& key : result.Value()) {
            ToProtoKeyInfo(key, response->add_keys());
        }
    }

    return ::grpc::Status::OK;
}

}  // namespace token_service
