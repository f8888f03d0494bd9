#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/clock.h"
#include "common/token_type.h"
#include "config/config.h"

namespace token_service {

// 单个 key 的失败记录（只在内存中）
struct FailedAttemptRecord {
    int count = 0;
    TimePoint last_attempt_at{};
    std::optional<TimePoint> locked_until;
};

/**
 * @brief 分级登录失败锁定
 *
 * key = origin，或 origin + ":" + lowercase(identity)。
 * 按 std::hash(key) % shard_count 分片，每个分片一把锁，同一 key 的并发失败不会丢计数。
 *
 * 默认档位：
 *   count  5 ~  9 → 锁 5 分钟
 *   count 10 ~ 19 → 锁 15 分钟
 *   count >= 20   → 锁 1 小时
 *
 * 不为每条记录建定时器，过期记录由 Sweep 统一清理（MaintenanceTask 定期调用）。
 */
class LockoutTracker {
public:
    LockoutTracker(const LockoutConfig& config, std::shared_ptr<Clock> clock);

    static std::string MakeKey(const std::string& origin, const std::string& identity);

    LockoutStatus RecordFailure(const std::string& origin, const std::string& identity = "");

    void RecordSuccess(const std::string& origin, const std::string& identity = "");

    /// @brief 锁已到期时顺带清除 locked_until（保留 count）
    LockoutStatus IsLockedOut(const std::string& origin, const std::string& identity = "");

    /// @return 清除的记录数
    size_t Sweep();

    size_t Size() const;

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, FailedAttemptRecord> records;
    };

    Shard& ShardFor(const std::string& key) const;
    const LockoutTier* TierFor(int count) const;

    LockoutConfig config_;
    std::shared_ptr<Clock> clock_;
    std::vector<std::unique_ptr<Shard>> shards_;
};

}  // namespace token_service
