#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/clock.h"
#include "common/token_type.h"
#include "config/config.h"

namespace token_service {

/**
 * @brief 按来源的固定窗口限流
 *
 * key = scope + ":" + origin，每个 key 一个窗口：窗口起点为该窗口内第一次请求的时间，
 * 计数达到 max_requests 后拒绝，直到 window_start + window_seconds。
 *
 *   Login    默认每来源 15 分钟 50 次
 *   Refresh  默认每来源 15 分钟 200 次
 *
 * 与 LockoutTracker 相同的分片加锁方式；过期窗口由 Sweep 统一清理。
 */
class RateLimiter {
public:
    RateLimiter(const RateLimitConfig& config, std::shared_ptr<Clock> clock);

    /// @brief 消耗一次配额；被拒绝的请求不计数
    RateLimitStatus Acquire(RateLimitScope scope, const std::string& origin);

    /// @brief 只读查询，不消耗配额
    RateLimitStatus Check(RateLimitScope scope, const std::string& origin) const;

    /// @return 清除的过期窗口数
    size_t Sweep();

    size_t Size() const;

private:
    struct Window {
        TimePoint started_at{};
        int count = 0;
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, Window> windows;
    };

    static std::string MakeKey(RateLimitScope scope, const std::string& origin);
    const RateLimitRule& RuleFor(RateLimitScope scope) const;
    Shard& ShardFor(const std::string& key) const;

    RateLimitConfig config_;
    std::shared_ptr<Clock> clock_;
    std::vector<std::unique_ptr<Shard>> shards_;
};

}  // namespace token_service
