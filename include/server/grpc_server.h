#pragma once

#include <memory>
#include <string>
#include <atomic>
#include <thread>
#include <functional>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>

#include "auth/authenticator.h"
#include "auth/maintenance_task.h"
#include "common/clock.h"
#include "config/config.h"
#include "db/mysql_connection.h"
#include "handlers/token_handler.h"
#include "keys/jwks_service.h"
#include "keys/key_manager.h"
#include "keys/key_store.h"
#include "lockout/lockout_tracker.h"
#include "lockout/rate_limiter.h"
#include "pool/connection_pool.h"
#include "refresh/refresh_rotation_service.h"
#include "refresh/refresh_token_store.h"
#include "revocation/revocation_denylist.h"
#include "service/auth_service.h"
#include "token/token_issuer.h"
#include "token/token_verifier.h"
#include "user/password_verifier.h"
#include "user/user_store.h"

namespace token_service {

/**
 * @brief gRPC 服务器封装类
 *
 * 提供统一的服务器生命周期管理：
 * - 按 storage.backend 装配存储（memory / mysql）
 * - 启动 gRPC 服务与健康检查
 * - 启动后台清理任务
 * - 优雅关闭
 *
 * @example
 * @code
 *   auto config = Config::LoadFromFile("config.yaml");
 *   GrpcServer server(std::make_shared<Config>(config));
 *
 *   if (!server.Initialize()) {
 *       return 1;
 *   }
 *
 *   server.Run();  // 阻塞直到收到关闭信号
 * @endcode
 */
class GrpcServer {
public:
    using MySQLPool = TemplateConnectionPool<MySQLConnection>;

    // 关闭回调类型
    using ShutdownCallback = std::function<void()>;

    explicit GrpcServer(std::shared_ptr<Config> config,
                        std::shared_ptr<Clock> clock = std::make_shared<SystemClock>());

    ~GrpcServer();

    // 禁止拷贝和移动
    GrpcServer(const GrpcServer&) = delete;
    GrpcServer& operator=(const GrpcServer&) = delete;
    GrpcServer(GrpcServer&&) = delete;
    GrpcServer& operator=(GrpcServer&&) = delete;

    /**
     * @brief 初始化所有组件
     * @return 初始化成功返回 true
     *
     * 初始化顺序：
     * 1. 基础设施（mysql 后端时创建连接池）
     * 2. 存储层（KeyStore / RefreshTokenStore / Denylist / UserStore）
     * 3. Service 层（引导签名密钥、启动清理任务）
     * 4. Handler 层
     */
    bool Initialize();

    /**
     * @brief 启动服务器（阻塞）
     *
     * 调用后会阻塞直到：
     * - 收到 SIGINT/SIGTERM 信号
     * - 调用 Shutdown() 方法
     */
    void Run();

    /**
     * @brief 异步启动服务器（非阻塞）
     * @return 启动成功返回 true
     */
    bool Start();

    /**
     * @brief 请求关闭服务器
     * @param deadline 关闭超时时间，默认 5 秒
     */
    void Shutdown(std::chrono::milliseconds deadline = std::chrono::milliseconds(5000));

    void Wait();

    bool IsRunning() const { return running_.load(); }

    std::string GetAddress() const;

    void SetShutdownCallback(ShutdownCallback callback) {
        shutdown_callback_ = std::move(callback);
    }

    // ==================== 组件访问器（用于测试或扩展）====================

    std::shared_ptr<AuthService> GetAuthService() const { return auth_service_; }
    std::shared_ptr<KeyManager> GetKeyManager() const { return key_manager_; }
    std::shared_ptr<UserStore> GetUserStore() const { return user_store_; }
    std::shared_ptr<Config> GetConfig() const { return config_; }

private:
    bool InitInfrastructure();
    bool InitStores();
    bool InitServices();
    bool InitHandlers();

    void ShutdownMonitor();

private:
    // 配置
    std::shared_ptr<Config> config_;
    std::shared_ptr<Clock> clock_;

    // gRPC 服务器
    std::unique_ptr<grpc::Server> server_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<int64_t> shutdown_deadline_ms_{5000};

    // 基础设施
    std::shared_ptr<MySQLPool> mysql_pool_;

    // 存储层
    std::shared_ptr<KeyStore> key_store_;
    std::shared_ptr<RefreshTokenStore> refresh_store_;
    std::shared_ptr<RevocationDenylist> denylist_;
    std::shared_ptr<UserStore> user_store_;

    // Service 层
    std::shared_ptr<KeyManager> key_manager_;
    std::shared_ptr<JwksService> jwks_service_;
    std::shared_ptr<TokenIssuer> token_issuer_;
    std::shared_ptr<TokenVerifier> token_verifier_;
    std::shared_ptr<RefreshRotationService> refresh_service_;
    std::shared_ptr<LockoutTracker> lockout_tracker_;
    std::shared_ptr<RateLimiter> rate_limiter_;
    std::shared_ptr<PasswordVerifier> password_verifier_;
    std::shared_ptr<AuthService> auth_service_;

    // Handler 层
    std::shared_ptr<Authenticator> authenticator_;
    std::unique_ptr<TokenHandler> token_handler_;

    // 后台任务
    std::shared_ptr<MaintenanceTask> maintenance_task_;

    // 回调
    ShutdownCallback shutdown_callback_;

    // 监控线程
    std::thread shutdown_monitor_thread_;
};

} // namespace token_service
