#include "lockout/lockout_tracker.h"
#include "common/logger.h"
#include "common/utils.h"

#include <algorithm>
#include <functional>

namespace token_service {

namespace {

int64_t SecondsUntil(TimePoint until, TimePoint now) {
    auto remaining = std::chrono::ceil<std::chrono::seconds>(until - now);
    return std::max<int64_t>(remaining.count(), 0);
}

}  // namespace

LockoutTracker::LockoutTracker(const LockoutConfig& config, std::shared_ptr<Clock> clock)
    : config_(config)
    , clock_(std::move(clock))
{
    std::sort(config_.tiers.begin(), config_.tiers.end(),
              [](const LockoutTier& a, const LockoutTier& b) { return a.threshold < b.threshold; });

    int shard_count = std::max(1, config_.shard_count);
    shards_.reserve(shard_count);
    for (int i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

std::string LockoutTracker::MakeKey(const std::string& origin, const std::string& identity) {
    if (identity.empty()) {
        return origin;
    }
    return origin + ":" + ToLower(identity);
}

LockoutTracker::Shard& LockoutTracker::ShardFor(const std::string& key) const {
    return *shards_[std::hash<std::string>{}(key) % shards_.size()];
}

// 阈值 <= count 的最高档
const LockoutTier* LockoutTracker::TierFor(int count) const {
    const LockoutTier* applied = nullptr;
    for (const auto& tier : config_.tiers) {
        if (tier.threshold <= count) {
            applied = &tier;
        }
    }
    return applied;
}

LockoutStatus LockoutTracker::RecordFailure(const std::string& origin, const std::string& identity) {
    std::string key = MakeKey(origin, identity);
    auto& shard = ShardFor(key);
    TimePoint now = clock_->Now();

    std::lock_guard<std::mutex> lock(shard.mutex);
    auto& record = shard.records[key];
    record.count += 1;
    record.last_attempt_at = now;

    LockoutStatus status;
    status.failure_count = record.count;

    if (const LockoutTier* tier = TierFor(record.count)) {
        record.locked_until = now + std::chrono::seconds(tier->duration_seconds);
        status.locked = true;
        status.retry_after_seconds = tier->duration_seconds;
        LOG_WARN("Lockout engaged for {}: {} failures, locked {}s", key, record.count, tier->duration_seconds);
    }
    return status;
}

void LockoutTracker::RecordSuccess(const std::string& origin, const std::string& identity) {
    std::string key = MakeKey(origin, identity);
    auto& shard = ShardFor(key);

    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.records.erase(key);
}

LockoutStatus LockoutTracker::IsLockedOut(const std::string& origin, const std::string& identity) {
    std::string key = MakeKey(origin, identity);
    auto& shard = ShardFor(key);
    TimePoint now = clock_->Now();

    std::lock_guard<std::mutex> lock(shard.mutex);
    LockoutStatus status;
    auto it = shard.records.find(key);
    if (it == shard.records.end()) {
        return status;
    }

    auto& record = it->second;
    status.failure_count = record.count;
    if (record.locked_until) {
        if (*record.locked_until > now) {
            status.locked = true;
            status.retry_after_seconds = SecondsUntil(*record.locked_until, now);
        } else {
            record.locked_until.reset();
        }
    }
    return status;
}

size_t LockoutTracker::Sweep() {
    TimePoint now = clock_->Now();
    auto horizon = std::chrono::seconds(config_.WidestTierSeconds());
    size_t removed = 0;

    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (auto it = shard->records.begin(); it != shard->records.end();) {
            const auto& record = it->second;
            bool still_locked = record.locked_until && *record.locked_until > now;
            if (!still_locked && now - record.last_attempt_at > horizon) {
                it = shard->records.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    return removed;
}

size_t LockoutTracker::Size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        total += shard->records.size();
    }
    return total;
}

}  // namespace token_service
