#include "server/grpc_server.h"
#include "common/logger.h"
#include "auth/jwt_authenticator.h"
#include "keys/mysql_key_store.h"
#include "refresh/mysql_refresh_token_store.h"
#include "revocation/mysql_revocation_denylist.h"
#include "user/mysql_user_store.h"

namespace token_service {

// ============================================================================
// 构造与析构
// ============================================================================

GrpcServer::GrpcServer(std::shared_ptr<Config> config, std::shared_ptr<Clock> clock)
    : config_(std::move(config))
    , clock_(std::move(clock)) {
    if (!config_) {
        throw std::invalid_argument("Config cannot be null");
    }
    if (!clock_) {
        throw std::invalid_argument("Clock cannot be null");
    }
}

GrpcServer::~GrpcServer() {
    Shutdown();
    if (shutdown_monitor_thread_.joinable()) {
        shutdown_monitor_thread_.join();
    }
    if (maintenance_task_) {
        maintenance_task_->Stop();
    }
}

// ============================================================================
// 初始化
// ============================================================================

bool GrpcServer::Initialize() {
    if (!Logger::IsInitialized()) {
        Logger::Init(
            config_->log.path,
            config_->log.filename,
            config_->log.level,
            config_->log.max_size,
            config_->log.max_files,
            config_->log.console_output
        );
        LOG_INFO("Logger initialized by GrpcServer (fallback)");
    }

    LOG_INFO("Initializing gRPC server...");

    try {
        if (!InitInfrastructure()) {
            LOG_ERROR("Failed to initialize infrastructure");
            return false;
        }

        if (!InitStores()) {
            LOG_ERROR("Failed to initialize stores");
            return false;
        }

        if (!InitServices()) {
            LOG_ERROR("Failed to initialize services");
            return false;
        }

        if (!InitHandlers()) {
            LOG_ERROR("Failed to initialize handlers");
            return false;
        }

        LOG_INFO("gRPC server initialized successfully");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Initialization failed: {}", e.what());
        return false;
    }
}

bool GrpcServer::InitInfrastructure() {
    LOG_INFO("Initializing infrastructure, storage backend={}", config_->storage.backend);

    if (!config_->storage.UseMySQL()) {
        LOG_WARN("Using in-memory storage: state is lost on restart and not shared across processes");
        return true;
    }

    // MySQL 连接池（数据库不可达时构造抛异常，由 Initialize 捕获）
    LOG_INFO("Creating MySQL connection pool: {}:{}",
             config_->mysql.host, config_->mysql.port);

    mysql_pool_ = std::make_shared<MySQLPool>(
        config_,
        [](const MySQLConfig& cfg) {
            return std::make_unique<MySQLConnection>(cfg);
        }
    );

    LOG_INFO("Infrastructure initialized");
    return true;
}

bool GrpcServer::InitStores() {
    LOG_INFO("Initializing stores...");

    if (mysql_pool_) {
        key_store_ = std::make_shared<MySQLKeyStore>(mysql_pool_);
        refresh_store_ = std::make_shared<MySQLRefreshTokenStore>(mysql_pool_);
        denylist_ = std::make_shared<MySQLRevocationDenylist>(mysql_pool_, clock_);
        user_store_ = std::make_shared<MySQLUserStore>(mysql_pool_);
    } else {
        key_store_ = std::make_shared<InMemoryKeyStore>();
        refresh_store_ = std::make_shared<InMemoryRefreshTokenStore>();
        denylist_ = std::make_shared<InMemoryRevocationDenylist>(clock_);
        user_store_ = std::make_shared<InMemoryUserStore>();
    }

    LOG_INFO("Stores initialized");
    return true;
}

bool GrpcServer::InitServices() {
    LOG_INFO("Initializing services...");

    const auto& security = config_->security;

    // 密钥
    key_manager_ = std::make_shared<KeyManager>(
        key_store_, clock_, std::chrono::seconds(security.signing_key_cache_seconds));
    jwks_service_ = std::make_shared<JwksService>(key_manager_, security, clock_);

    // 启动时引导签名密钥：存储不可用则拒绝启动
    auto signing = key_manager_->GetSigningKey();
    if (signing.IsErr()) {
        LOG_ERROR("Signing key bootstrap failed: {}", signing.message);
        return false;
    }
    LOG_INFO("Current signing key: {}", signing.Value()->kid);

    // Token
    token_issuer_ = std::make_shared<TokenIssuer>(key_manager_, security, clock_);
    token_verifier_ = std::make_shared<TokenVerifier>(key_manager_, user_store_, denylist_, security, clock_);
    refresh_service_ = std::make_shared<RefreshRotationService>(refresh_store_, security, clock_);

    // 登录
    lockout_tracker_ = std::make_shared<LockoutTracker>(config_->lockout, clock_);
    rate_limiter_ = std::make_shared<RateLimiter>(config_->rate_limit, clock_);
    password_verifier_ = std::make_shared<StoredHashPasswordVerifier>(user_store_);

    auth_service_ = std::make_shared<AuthService>(
        config_,
        key_manager_,
        jwks_service_,
        token_issuer_,
        token_verifier_,
        refresh_service_,
        denylist_,
        lockout_tracker_,
        rate_limiter_,
        user_store_,
        password_verifier_,
        clock_
    );

    // 后台清理任务
    maintenance_task_ = std::make_shared<MaintenanceTask>(
        refresh_service_, denylist_, lockout_tracker_, rate_limiter_,
        config_->cleanup, config_->lockout, clock_);
    maintenance_task_->Start();

    LOG_INFO("Services initialized");
    return true;
}

bool GrpcServer::InitHandlers() {
    LOG_INFO("Initializing handlers...");

    authenticator_ = std::make_shared<JwtAuthenticator>(token_verifier_);
    token_handler_ = std::make_unique<TokenHandler>(auth_service_, authenticator_, config_->admin);

    LOG_INFO("Handlers initialized");
    return true;
}

// ============================================================================
// 运行
// ============================================================================

void GrpcServer::Run() {
    if (!Start()) {
        LOG_ERROR("Failed to start server");
        return;
    }
    Wait();
}

bool GrpcServer::Start() {
    if (running_.load()) {
        LOG_WARN("Server is already running");
        return true;
    }
    if (!token_handler_) {
        LOG_ERROR("Server not initialized");
        return false;
    }

    std::string address = GetAddress();

    // 启用健康检查（需在 BuildAndStart 之前）
    grpc::EnableDefaultHealthCheckService(true);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(address, grpc::InsecureServerCredentials());
    builder.RegisterService(token_handler_.get());

    // 构建并启动服务器
    server_ = builder.BuildAndStart();

    if (!server_) {
        LOG_ERROR("Failed to start gRPC server on {}", address);
        return false;
    }

    running_.store(true);
    shutdown_requested_.store(false);

    // 启动关闭监控线程
    shutdown_monitor_thread_ = std::thread([this]() {
        ShutdownMonitor();
    });

    LOG_INFO("========================================");
    LOG_INFO("Token service started on {}", address);
    LOG_INFO("========================================");

    return true;
}

void GrpcServer::Wait() {
    if (server_) {
        server_->Wait();
    }

    if (shutdown_monitor_thread_.joinable()) {
        shutdown_monitor_thread_.join();
    }

    running_.store(false);
    LOG_INFO("Server stopped");
}

void GrpcServer::Shutdown(std::chrono::milliseconds deadline) {
    if (!running_.load()) {
        return;
    }
    // 可能在信号处理函数中调用：这里只置位，实际关闭由监控线程执行
    shutdown_deadline_ms_.store(deadline.count());
    shutdown_requested_.store(true);
}

std::string GrpcServer::GetAddress() const {
    return config_->server.host + ":" + std::to_string(config_->server.grpc_port);
}

void GrpcServer::ShutdownMonitor() {
    while (!shutdown_requested_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    LOG_INFO("Shutting down server...");

    // 停止后台清理任务
    if (maintenance_task_) {
        maintenance_task_->Stop();
    }

    // 关闭 gRPC 服务器
    if (server_) {
        auto deadline = std::chrono::system_clock::now() +
                        std::chrono::milliseconds(shutdown_deadline_ms_.load());
        server_->Shutdown(deadline);
    }

    // 触发回调
    if (shutdown_callback_) {
        shutdown_callback_();
    }
}

} // namespace token_service
