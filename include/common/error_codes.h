#pragma once


#include <string>
#include <grpcpp/grpcpp.h>

namespace token_service{
enum class ErrorCode{
    // ========== 成功 ==========
    Ok = 0,

    // ==================== 通用错误（100~999） ====================
    // 系统错误（1xx）
    Unknown             = 100,  // 未知错误
    Internal            = 101,  // 内部服务器异常
    NotImplemented      = 102,  // 功能未实现
    ServiceUnavailable  = 103,  // 服务不可用（存储不可达等）
    Timeout             = 104,  // 请求超时

    // 参数错误（2xx）
    InvalidArgument     = 200,  // 参数无效

    // 限流 / 锁定（3xx）：均携带重试时间提示
    RateLimited         = 300,  // 请求过于频繁
    AccountLockedOut    = 301,  // 失败次数过多，暂时锁定

    // ==================== 凭证 / Token 错误（1000~1999） ====================
    // 登录相关（100x）
    InvalidCredentials  = 1000, // 账号或密码错误（故意不区分）

    // Access Token 校验（101x）
    TokenMissing        = 1010, // Token 缺失
    TokenMalformed      = 1011, // Token 格式错误
    TokenExpired        = 1012, // Token 已过期
    TokenNotYetValid    = 1013, // Token 尚未生效（nbf）
    SignatureInvalid    = 1014, // 签名无效 / kid 未知
    AudienceMismatch    = 1015, // aud 不匹配
    IssuerMismatch      = 1016, // iss 不匹配
    TokenVersionStale   = 1017, // tokenVersion 已过期（全局登出 / 改密）
    TokenRevoked        = 1018, // jti 已被吊销

    // Refresh Token（102x）
    RefreshTokenInvalidOrUsed = 1020, // 无效 / 已使用 / 已过期，不做区分

    // 用户 / 权限（103x）
    UserNotFound        = 1030, // 用户不存在
    PermissionDenied    = 1031, // 无权限（管理接口）

    // ==================== 签名密钥错误（4000~4999） ====================
    KeyNotFound         = 4000, // kid 不存在
    NoActiveSigningKey  = 4001, // 没有可用的签名密钥（启动不变量被破坏）
    LastActiveKey       = 4002, // 拒绝退役最后一把活跃密钥
    KeyGenerationFailed = 4003, // 密钥生成失败
};

// ============================================================================
// 错误码工具函数
// ============================================================================

// 获取错误码对应的消息
inline std::string GetErrorMessage(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:                  return "成功";

        // 通用错误
        case ErrorCode::Unknown:             return "未知错误";
        case ErrorCode::Internal:            return "服务器内部错误";
        case ErrorCode::NotImplemented:      return "功能暂未实现";
        case ErrorCode::ServiceUnavailable:  return "服务暂不可用";
        case ErrorCode::Timeout:             return "请求超时";
        case ErrorCode::InvalidArgument:     return "参数无效";
        case ErrorCode::RateLimited:         return "请求过于频繁，请稍后再试";
        case ErrorCode::AccountLockedOut:    return "尝试次数过多，请稍后再试";

        // 凭证 / Token
        case ErrorCode::InvalidCredentials:  return "账号或密码错误";
        case ErrorCode::TokenMissing:        return "缺少认证信息";
        case ErrorCode::TokenMalformed:      return "Token 格式错误";
        case ErrorCode::TokenExpired:        return "Token 已过期";
        case ErrorCode::TokenNotYetValid:    return "Token 尚未生效";
        case ErrorCode::SignatureInvalid:    return "Token 签名无效";
        case ErrorCode::AudienceMismatch:    return "Token 受众不匹配";
        case ErrorCode::IssuerMismatch:      return "Token 签发者不匹配";
        case ErrorCode::TokenVersionStale:   return "登录已失效，请重新登录";
        case ErrorCode::TokenRevoked:        return "Token 已被吊销";
        case ErrorCode::RefreshTokenInvalidOrUsed: return "Refresh Token 无效或已使用";
        case ErrorCode::UserNotFound:        return "用户不存在";
        case ErrorCode::PermissionDenied:    return "无权限执行此操作";

        // 密钥
        case ErrorCode::KeyNotFound:         return "签名密钥不存在";
        case ErrorCode::NoActiveSigningKey:  return "没有可用的签名密钥";
        case ErrorCode::LastActiveKey:       return "不能退役最后一把活跃密钥";
        case ErrorCode::KeyGenerationFailed: return "签名密钥生成失败";

        default:                             return "未知错误";
    }
}

// 错误码 → gRPC 状态码映射
inline constexpr grpc::StatusCode ToGrpcStatus(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:
            return grpc::StatusCode::OK;

        // 参数错误 → INVALID_ARGUMENT
        case ErrorCode::InvalidArgument:
            return grpc::StatusCode::INVALID_ARGUMENT;

        // 认证错误 → UNAUTHENTICATED
        case ErrorCode::InvalidCredentials:
        case ErrorCode::TokenMissing:
        case ErrorCode::TokenMalformed:
        case ErrorCode::TokenExpired:
        case ErrorCode::TokenNotYetValid:
        case ErrorCode::SignatureInvalid:
        case ErrorCode::AudienceMismatch:
        case ErrorCode::IssuerMismatch:
        case ErrorCode::TokenVersionStale:
        case ErrorCode::TokenRevoked:
        case ErrorCode::RefreshTokenInvalidOrUsed:
            return grpc::StatusCode::UNAUTHENTICATED;

        // 未找到 → NOT_FOUND
        case ErrorCode::UserNotFound:
        case ErrorCode::KeyNotFound:
            return grpc::StatusCode::NOT_FOUND;

        case ErrorCode::PermissionDenied:
            return grpc::StatusCode::PERMISSION_DENIED;

        case ErrorCode::LastActiveKey:
            return grpc::StatusCode::FAILED_PRECONDITION;

        // 限流 / 锁定 → RESOURCE_EXHAUSTED
        case ErrorCode::RateLimited:
        case ErrorCode::AccountLockedOut:
            return grpc::StatusCode::RESOURCE_EXHAUSTED;

        case ErrorCode::NotImplemented:
            return grpc::StatusCode::UNIMPLEMENTED;

        // 服务不可用 → UNAVAILABLE
        case ErrorCode::ServiceUnavailable:
        case ErrorCode::Timeout:
            return grpc::StatusCode::UNAVAILABLE;

        // NoActiveSigningKey / KeyGenerationFailed 等 → INTERNAL
        default:
            return grpc::StatusCode::INTERNAL;
    }
}

// 错误码 → HTTP 状态码映射（如果需要 REST 网关）
inline constexpr int ToHttpStatus(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:                  return 200;

        case ErrorCode::InvalidArgument:     return 400;  // Bad Request

        case ErrorCode::InvalidCredentials:
        case ErrorCode::TokenMissing:
        case ErrorCode::TokenMalformed:
        case ErrorCode::TokenExpired:
        case ErrorCode::TokenNotYetValid:
        case ErrorCode::SignatureInvalid:
        case ErrorCode::AudienceMismatch:
        case ErrorCode::IssuerMismatch:
        case ErrorCode::TokenVersionStale:
        case ErrorCode::TokenRevoked:
        case ErrorCode::RefreshTokenInvalidOrUsed: return 401;  // Unauthorized

        case ErrorCode::PermissionDenied:    return 403;  // Forbidden

        case ErrorCode::UserNotFound:
        case ErrorCode::KeyNotFound:         return 404;  // Not Found

        case ErrorCode::LastActiveKey:       return 409;  // Conflict

        case ErrorCode::RateLimited:
        case ErrorCode::AccountLockedOut:    return 429;  // Too Many Requests

        case ErrorCode::NotImplemented:      return 501;  // Not Implemented
        case ErrorCode::ServiceUnavailable:  return 503;  // Service Unavailable

        default:                             return 500;  // Internal Server Error
    }
}

}
