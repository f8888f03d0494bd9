#include "auth/maintenance_task.h"
#include "common/logger.h"

#include <chrono>

namespace token_service {

MaintenanceTask::MaintenanceTask(std::shared_ptr<RefreshRotationService> refresh,
                                 std::shared_ptr<RevocationDenylist> denylist,
                                 std::shared_ptr<LockoutTracker> lockout,
                                 std::shared_ptr<RateLimiter> rate_limiter,
                                 const CleanupConfig& cleanup,
                                 const LockoutConfig& lockout_config,
                                 std::shared_ptr<Clock> clock)
    : refresh_(std::move(refresh))
    , denylist_(std::move(denylist))
    , lockout_(std::move(lockout))
    , rate_limiter_(std::move(rate_limiter))
    , cleanup_(cleanup)
    , lockout_sweep_seconds_(lockout_config.sweep_interval_seconds)
    , clock_(std::move(clock))
{}

MaintenanceTask::~MaintenanceTask() {
    Stop();  // 确保析构时停止线程
}

void MaintenanceTask::Start() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (running_.load()) {
        LOG_INFO("MaintenanceTask already running, ignoring Start()");
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }

    running_.store(true);
    thread_ = std::thread([this] { Loop(); });
}

void MaintenanceTask::Stop() {
    std::lock_guard<std::mutex> lock(mutex_);

    running_.store(false);
    if (thread_.joinable()) {
        thread_.join();
    }
}

void MaintenanceTask::Loop() {
    LOG_INFO("MaintenanceTask started, interval = {} hours, lockout sweep = {}s",
             cleanup_.interval_hours, lockout_sweep_seconds_);

    const int64_t full_interval = static_cast<int64_t>(cleanup_.interval_hours) * 3600;
    int64_t since_full = 0;
    int64_t since_lockout = 0;

    if (cleanup_.run_on_start) {
        RunOnce();
    }

    // 分段睡眠以便快速响应停止请求
    while (running_.load()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        if (!running_.load()) break;
        ++since_full;
        ++since_lockout;

        if (since_full >= full_interval) {
            RunOnce();
            since_full = 0;
            since_lockout = 0;
        } else if (lockout_sweep_seconds_ > 0 && since_lockout >= lockout_sweep_seconds_) {
            SweepLockout();
            SweepRateLimits();
            since_lockout = 0;
        }
    }

    LOG_INFO("MaintenanceTask stopped");
}

size_t MaintenanceTask::SweepLockout() {
    try {
        size_t removed = lockout_->Sweep();
        if (removed > 0) {
            LOG_DEBUG("Lockout sweep: removed {} stale records, {} remaining", removed, lockout_->Size());
        }
        return removed;
    } catch (const std::exception& e) {
        LOG_ERROR("Lockout sweep exception: {}", e.what());
        return 0;
    }
}

size_t MaintenanceTask::SweepRateLimits() {
    if (!rate_limiter_) {
        return 0;
    }
    try {
        size_t removed = rate_limiter_->Sweep();
        if (removed > 0) {
            LOG_DEBUG("Rate limit sweep: removed {} expired windows, {} remaining",
                      removed, rate_limiter_->Size());
        }
        return removed;
    } catch (const std::exception& e) {
        LOG_ERROR("Rate limit sweep exception: {}", e.what());
        return 0;
    }
}

MaintenanceReport MaintenanceTask::RunOnce() {
    auto started = std::chrono::steady_clock::now();
    MaintenanceReport report;

    // 过期 refresh token
    try {
        auto removed = refresh_->SweepExpired(clock_->Now());
        if (removed.IsOk()) {
            report.refresh_removed = removed.Value();
        } else {
            report.refresh_ok = false;
            LOG_ERROR("Refresh token sweep failed: {}", removed.message);
        }
    } catch (const std::exception& e) {
        report.refresh_ok = false;
        LOG_ERROR("Refresh token sweep exception: {}", e.what());
    }

    // 过期黑名单条目
    try {
        auto removed = denylist_->SweepExpired();
        if (removed.IsOk()) {
            report.denylist_removed = removed.Value();
        } else {
            report.denylist_ok = false;
            LOG_ERROR("Denylist sweep failed: {}", removed.message);
        }
    } catch (const std::exception& e) {
        report.denylist_ok = false;
        LOG_ERROR("Denylist sweep exception: {}", e.what());
    }

    report.lockout_removed = SweepLockout();
    report.rate_limit_removed = SweepRateLimits();

    report.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    LOG_INFO("Maintenance done: refresh_removed={}, denylist_removed={}, lockout_removed={}, "
             "rate_limit_removed={}, elapsed={}ms",
             report.refresh_removed, report.denylist_removed, report.lockout_removed,
             report.rate_limit_removed, report.elapsed_ms);
    return report;
}

}  // namespace token_service
