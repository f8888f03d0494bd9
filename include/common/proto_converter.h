#pragma once

#include <string>
#include <vector>
#include <grpcpp/grpcpp.h>
#include "pb_common/result.pb.h"
#include "pb_token/token.grpc.pb.h"
#include "common/error_codes.h"
#include "common/time_utils.h"
#include "common/token_type.h"
#include "entity/signing_key.h"
#include "entity/user_entity.h"

namespace token_service {

// ============================================================================
// ErrorCode 转换函数
// ============================================================================

// 业务层 ErrorCode → Proto ErrorCode
inline pb_common::ErrorCode ToProtoErrorCode(ErrorCode code) {
    // 数值相同，直接转换
    return static_cast<pb_common::ErrorCode>(static_cast<int>(code));
}

// Proto ErrorCode → 业务层 ErrorCode
inline ErrorCode FromProtoErrorCode(pb_common::ErrorCode code) {
    return static_cast<ErrorCode>(static_cast<int>(code));
}

// ============================================================================
// 便捷函数：直接设置 Result
// ============================================================================

// 设置成功结果
inline void SetResultOk(pb_common::Result* result, const std::string& msg = "成功") {
    result->set_code(pb_common::ErrorCode::OK);
    result->set_msg(msg);
}

// 设置错误结果
inline void SetResultError(pb_common::Result* result, ErrorCode code) {
    result->set_code(ToProtoErrorCode(code));
    result->set_msg(GetErrorMessage(code));
}

// 设置错误结果（自定义消息）
inline void SetResultError(pb_common::Result* result, ErrorCode code, const std::string& msg) {
    result->set_code(ToProtoErrorCode(code));
    result->set_msg(msg);
}

// ============================================================================
// TokenPair / UserInfo 转换
// ============================================================================

inline void ToProtoTokenPair(const TokenPair& src, pb_token::TokenPair* dst) {
    dst->set_access_token(src.access_token);
    dst->set_refresh_token(src.refresh_token);
    dst->set_expires_in(src.expires_in);
    dst->set_token_type(src.token_type);
}

/// @brief 不输出 password_hash / token_version
inline void ToProtoUserInfo(const UserEntity& src, pb_token::UserInfo* dst) {
    dst->set_id(src.id);
    dst->set_email(src.email);
    dst->set_role(src.role);
    dst->set_app_id(src.app_id);
}

// ============================================================================
// Claims 转换
// ============================================================================

inline void ToProtoClaims(const AccessTokenClaims& src, pb_token::AccessTokenClaims* dst) {
    dst->set_iss(src.iss);
    dst->set_aud(src.aud);
    dst->set_sub(src.sub);
    dst->set_role(src.role);
    dst->set_token_version(src.token_version);
    dst->set_jti(src.jti);
    dst->set_iat(src.iat);
    dst->set_nbf(src.nbf);
    dst->set_exp(src.exp);
    dst->set_email(src.email);
    dst->set_app_id(src.app_id);
    dst->set_kid(src.kid);
}

// ============================================================================
// 签名密钥转换
// ============================================================================

inline void ToProtoKeyInfo(const SigningKeyInfo& src, pb_token::SigningKeyInfo* dst) {
    dst->set_kid(src.kid);
    dst->set_algorithm(src.algorithm);
    ToProtoTimestamp(src.created_at, dst->mutable_created_at());
    if (src.retired_at) {
        ToProtoTimestamp(*src.retired_at, dst->mutable_retired_at());
    }
    dst->set_is_active(src.is_active);
}

// ============================================================================
// 内省结果转换
// ============================================================================

inline pb_token::TokenKind ToProtoTokenKind(TokenKindTag kind) {
    switch (kind) {
        case TokenKindTag::Access:  return pb_token::TokenKind::TOKEN_KIND_ACCESS;
        case TokenKindTag::Refresh: return pb_token::TokenKind::TOKEN_KIND_REFRESH;
        default:                    return pb_token::TokenKind::TOKEN_KIND_UNKNOWN;
    }
}

inline void SetIntrospectResponse(const IntrospectionResult& src, pb_token::IntrospectResponse* response) {
    response->set_active(src.active);
    response->set_kind(ToProtoTokenKind(src.kind));
    response->set_user_id(src.user_id);
    response->set_app_id(src.app_id);
    response->set_expires_at(src.expires_at);
    if (src.claims) {
        ToProtoClaims(*src.claims, response->mutable_claims());
    }
    if (src.record_id) {
        response->set_record_id(*src.record_id);
    }
}

} // namespace token_service
