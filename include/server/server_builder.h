#pragma once

#include <memory>
#include <string>
#include <functional>
#include <optional>
#include "server/grpc_server.h"
#include "config/config.h"

namespace token_service {

/**
 * @brief 服务器构建器（Builder 模式）
 *
 * ============================================================================
 * 配置优先级（从低到高）
 * ============================================================================
 *
 *   1. 编译期默认值（config.h）
 *   2. 配置文件（config.yaml）
 *   3. 环境变量覆盖（LoadFromEnvironment）
 *   4. Builder 方法覆盖（WithPort、WithStorageBackend 等）
 *
 * 所有覆盖应用完毕后再执行一次 ValidateConfig，
 * 环境变量注入的非法值（如 ACCESS_TOKEN_TTL=0）在 Build 时即失败。
 *
 * @example
 * @code
 *   auto server = ServerBuilder()
 *       .WithConfigFile("configs/config.yaml")
 *       .LoadFromEnvironment()
 *       .WithStorageBackend("mysql")
 *       .OnShutdown([]() { LOG_INFO("token service shutting down"); })
 *       .Build();
 *
 *   if (!server->Initialize()) {
 *       return 1;
 *   }
 *   server->Run();
 * @endcode
 */
class ServerBuilder {
public:
    ServerBuilder() = default;

    /// @throws std::runtime_error 配置文件不存在或解析失败
    ServerBuilder& WithConfigFile(const std::string& path);

    ServerBuilder& WithConfig(std::shared_ptr<Config> config);

    /// @brief 支持的变量见 Config::LoadFromEnv
    ServerBuilder& LoadFromEnvironment();

    ServerBuilder& WithPort(int port);

    ServerBuilder& WithHost(const std::string& host);

    /// @param backend "memory" | "mysql"
    ServerBuilder& WithStorageBackend(const std::string& backend);

    /// @brief 注入时间源（测试用 ManualClock）
    ServerBuilder& WithClock(std::shared_ptr<Clock> clock);

    ServerBuilder& OnShutdown(GrpcServer::ShutdownCallback callback);

    /// @throws std::runtime_error 未设置配置，或覆盖后的配置不合法
    std::unique_ptr<GrpcServer> Build();

private:
    std::shared_ptr<Config> config_;
    std::shared_ptr<Clock> clock_;

    std::optional<int> port_override_;
    std::optional<std::string> host_override_;
    std::optional<std::string> backend_override_;

    GrpcServer::ShutdownCallback shutdown_callback_;

    bool load_env_ = false;
};

} // namespace token_service
