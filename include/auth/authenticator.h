#pragma once

#include <grpcpp/grpcpp.h>
#include "common/result.h"

namespace token_service {

// 认证上下文（从 Access Token 解析出的调用方信息）
struct AuthContext {
    std::string user_id;    // sub
    std::string role;
    std::string email;      // 可选
    std::string app_id;     // 可选
    std::string jti;
};

// 认证器接口（可 mock）
class Authenticator {
public:
    virtual ~Authenticator() = default;

    // ============================================================================
    // gRPC 请求认证函数
    // ============================================================================

    /// @brief 从 gRPC 上下文中验证 Token 并提取调用方信息
    /// @details
    ///   gRPC Metadata 说明：
    ///   - gRPC 的 metadata 等同于 HTTP/2 的 headers
    ///   - 客户端设置：metadata.insert({"authorization", "Bearer xxx"})
    ///   - 服务端读取：context->client_metadata()
    ///   - key 全部小写（gRPC 规范）
    ///
    virtual Result<AuthContext> Authenticate(::grpc::ServerContext* context) = 0;
};

}  // namespace token_service
