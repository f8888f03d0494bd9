#pragma once

#include <memory>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <type_traits>
#include "common/logger.h"
#include "config/config.h"

namespace token_service {

class MySQLConnection;

// ==================== 编译期类型推导 ====================

/// 连接类型 → 子配置类型
template<typename>
struct ConnectionConfig;

template<>
struct ConnectionConfig<MySQLConnection> {
    using type = token_service::MySQLConfig;
};

template<typename T>
using Config_t = typename ConnectionConfig<T>::type;

template<typename>
inline constexpr bool always_false_v = false;

// ==================== 连接池模板类 ====================

/**
 * @brief 固定大小连接池
 *
 * - 构造时预创建 pool_size 个连接（快速失败：数据库不可达则构造抛异常）
 * - Acquire 带超时等待（默认 5 秒），避免认证请求无限阻塞
 * - 取出 / 归还时检测连接有效性，失效则重建
 *
 * @code
 *   auto conn = pool->CreateConnection();   // ConnectionGuard，离开作用域自动归还
 *   conn->Execute("DELETE FROM revoked_access_tokens WHERE expires_at <= ?", {now});
 * @endcode
 */
template<typename T>
class TemplateConnectionPool {
public:
    using ConnectionPtr = std::unique_ptr<T>;
    using Config = Config_t<T>;
    using ConfigPtr = std::shared_ptr<const Config>;
    using CreateFunc = std::function<ConnectionPtr(const Config&)>;

    TemplateConnectionPool(std::shared_ptr<token_service::Config> global_config,
                           CreateFunc func,
                           std::chrono::milliseconds acquire_timeout = std::chrono::seconds(5))
        : createConnFunc_(std::move(func))
        , acquire_timeout_(acquire_timeout)
    {
        if (!global_config) {
            throw std::invalid_argument("TemplateConnectionPool: global_config is nullptr");
        }
        if (!createConnFunc_) {
            throw std::invalid_argument("TemplateConnectionPool: createConnFunc is empty");
        }

        ExtractSubConfig(global_config);
        InitPool();
    }

    /**
     * @brief 连接的 RAII 守卫：构造时借出，析构时归还
     * @throws std::runtime_error 等待超时仍未取到连接
     */
    class ConnectionGuard {
    public:
        explicit ConnectionGuard(TemplateConnectionPool& pool)
            : pool_(pool)
        {
            conn_ = pool_.Acquire();
            if (!conn_) {
                throw std::runtime_error("Failed to acquire connection in ConnectionGuard");
            }
        }

        ConnectionGuard(const ConnectionGuard&) = delete;
        ConnectionGuard& operator=(const ConnectionGuard&) = delete;
        ConnectionGuard& operator=(ConnectionGuard&&) = delete;

        ConnectionGuard(ConnectionGuard&& other) noexcept
            : pool_(other.pool_)
            , conn_(std::move(other.conn_))
        {}

        T* get() const noexcept { return conn_.get(); }

        T* operator->() {
            if (!conn_) throw std::runtime_error("Connection is null in ConnectionGuard");
            return conn_.get();
        }

        T& operator*() {
            if (!conn_) throw std::runtime_error("Connection is null in ConnectionGuard");
            return *conn_;
        }

        ~ConnectionGuard() {
            if (conn_) {
                pool_.Release(std::move(conn_));
            }
        }

    private:
        TemplateConnectionPool& pool_;
        ConnectionPtr conn_;
    };

    ConnectionGuard CreateConnection() {
        return ConnectionGuard(*this);
    }

    size_t Available() {
        std::lock_guard<std::mutex> lk(mutex_);
        return pool_.size();
    }

private:
    void ExtractSubConfig(const std::shared_ptr<token_service::Config>& global_config) {
        if constexpr (std::is_same_v<T, MySQLConnection>) {
            config_ = std::make_shared<const Config>(global_config->mysql);
        } else {
            static_assert(always_false_v<T>, "Unsupported connection type, no matching sub-config");
        }
    }

    void InitPool() {
        int pool_size = config_->GetPoolSize();
        for (int i = 0; i < pool_size; ++i) {
            auto conn = createConnFunc_(*config_);
            if (!conn) {
                throw std::runtime_error("Failed to create connection during pool initialization");
            }
            pool_.push_back(std::move(conn));
        }
    }

    ConnectionPtr Acquire() {
        std::unique_lock<std::mutex> lk(mutex_);

        bool ret = cond_.wait_for(lk, acquire_timeout_, [this]() {
            return !pool_.empty();
        });
        if (!ret) {
            LOG_ERROR("Acquire connection timeout after {} ms", acquire_timeout_.count());
            return nullptr;
        }

        auto conn = std::move(pool_.front());
        pool_.pop_front();
        lk.unlock();

        // 长时间空闲的连接可能已被服务端断开
        if (!conn->Valid()) {
            LOG_WARN("Acquired invalid connection, attempting rebuild");
            try {
                conn = createConnFunc_(*config_);
            } catch (const std::exception& e) {
                LOG_ERROR("Failed to rebuild invalid connection: {}", e.what());
                ReturnSlot(nullptr);
                return nullptr;
            }
        }
        return conn;
    }

    // 析构路径调用，不能抛异常
    void Release(ConnectionPtr conn) noexcept {
        if (!conn || !conn->Valid()) {
            try {
                conn = createConnFunc_(*config_);
            } catch (const std::exception& e) {
                LOG_ERROR("Failed to rebuild connection during release: {}", e.what());
                conn = nullptr;
            }
        }
        ReturnSlot(std::move(conn));
    }

    // 重建失败时连接数会减少；下次 Acquire 超时会在日志中体现
    void ReturnSlot(ConnectionPtr conn) noexcept {
        if (!conn) return;
        std::lock_guard<std::mutex> lk(mutex_);
        pool_.push_back(std::move(conn));
        cond_.notify_one();
    }

private:
    std::deque<ConnectionPtr> pool_;
    ConfigPtr config_;
    std::mutex mutex_;
    std::condition_variable cond_;
    CreateFunc createConnFunc_;
    std::chrono::milliseconds acquire_timeout_;
};

} // namespace token_service
