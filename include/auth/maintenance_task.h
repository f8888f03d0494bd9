#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

#include "common/clock.h"
#include "config/config.h"
#include "lockout/lockout_tracker.h"
#include "lockout/rate_limiter.h"
#include "refresh/refresh_rotation_service.h"
#include "revocation/revocation_denylist.h"

namespace token_service {

// 单次清理的统计；某项失败时对应 ok 为 false，计数为 0
struct MaintenanceReport {
    int64_t refresh_removed = 0;
    int64_t denylist_removed = 0;
    size_t lockout_removed = 0;
    size_t rate_limit_removed = 0;
    bool refresh_ok = true;
    bool denylist_ok = true;
    int64_t elapsed_ms = 0;
};

/**
 * @brief 后台周期清理任务（单线程）
 *
 * - 每 cleanup.interval_hours：过期 refresh token + 过期黑名单条目 + 锁定记录 + 限流窗口
 * - 每 lockout.sweep_interval_seconds：只清理锁定记录与限流窗口（纯内存）
 * - run_on_start 时启动后立即执行一次
 *
 * 任一项失败只记日志，其余照常执行，下一周期重试；异常不会逃出线程。
 */
class MaintenanceTask {
public:
    MaintenanceTask(std::shared_ptr<RefreshRotationService> refresh,
                    std::shared_ptr<RevocationDenylist> denylist,
                    std::shared_ptr<LockoutTracker> lockout,
                    std::shared_ptr<RateLimiter> rate_limiter,
                    const CleanupConfig& cleanup,
                    const LockoutConfig& lockout_config,
                    std::shared_ptr<Clock> clock);
    ~MaintenanceTask();

    // 禁止拷贝和移动
    MaintenanceTask(const MaintenanceTask&) = delete;
    MaintenanceTask& operator=(const MaintenanceTask&) = delete;
    MaintenanceTask(MaintenanceTask&&) = delete;
    MaintenanceTask& operator=(MaintenanceTask&&) = delete;

    void Start();
    void Stop();

    bool IsRunning() const { return running_.load(); }

    MaintenanceReport RunOnce();

    size_t SweepLockout();

    size_t SweepRateLimits();

private:
    void Loop();

    std::shared_ptr<RefreshRotationService> refresh_;
    std::shared_ptr<RevocationDenylist> denylist_;
    std::shared_ptr<LockoutTracker> lockout_;
    std::shared_ptr<RateLimiter> rate_limiter_;
    CleanupConfig cleanup_;
    int64_t lockout_sweep_seconds_;
    std::shared_ptr<Clock> clock_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex mutex_;  // 保护 Start/Stop 的并发调用
};

}  // namespace token_service
