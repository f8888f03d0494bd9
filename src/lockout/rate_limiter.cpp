#include "lockout/rate_limiter.h"
#include "common/logger.h"

#include <algorithm>
#include <functional>

namespace token_service {

namespace {

const char* ScopeName(RateLimitScope scope) {
    switch (scope) {
        case RateLimitScope::Login:   return "login";
        case RateLimitScope::Refresh: return "refresh";
    }
    return "unknown";
}

int64_t SecondsUntil(TimePoint until, TimePoint now) {
    auto remaining = std::chrono::ceil<std::chrono::seconds>(until - now);
    return std::max<int64_t>(remaining.count(), 0);
}

}  // namespace

RateLimiter::RateLimiter(const RateLimitConfig& config, std::shared_ptr<Clock> clock)
    : config_(config)
    , clock_(std::move(clock))
{
    int shard_count = std::max(1, config_.shard_count);
    shards_.reserve(shard_count);
    for (int i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

std::string RateLimiter::MakeKey(RateLimitScope scope, const std::string& origin) {
    return std::string(ScopeName(scope)) + ":" + origin;
}

const RateLimitRule& RateLimiter::RuleFor(RateLimitScope scope) const {
    return scope == RateLimitScope::Login ? config_.login : config_.refresh;
}

RateLimiter::Shard& RateLimiter::ShardFor(const std::string& key) const {
    return *shards_[std::hash<std::string>{}(key) % shards_.size()];
}

RateLimitStatus RateLimiter::Acquire(RateLimitScope scope, const std::string& origin) {
    RateLimitStatus status;
    if (!config_.enabled) {
        return status;
    }

    const auto& rule = RuleFor(scope);
    auto window_length = std::chrono::seconds(rule.window_seconds);
    std::string key = MakeKey(scope, origin);
    auto& shard = ShardFor(key);
    TimePoint now = clock_->Now();

    std::lock_guard<std::mutex> lock(shard.mutex);
    auto& window = shard.windows[key];
    if (window.count == 0 || now >= window.started_at + window_length) {
        window.started_at = now;
        window.count = 0;
    }

    if (window.count >= rule.max_requests) {
        status.allowed = false;
        status.retry_after_seconds = SecondsUntil(window.started_at + window_length, now);
        LOG_WARN("Rate limit exceeded for {}, retry after {}s", key, status.retry_after_seconds);
        return status;
    }

    window.count += 1;
    status.remaining = rule.max_requests - window.count;
    return status;
}

RateLimitStatus RateLimiter::Check(RateLimitScope scope, const std::string& origin) const {
    RateLimitStatus status;
    if (!config_.enabled) {
        return status;
    }

    const auto& rule = RuleFor(scope);
    auto window_length = std::chrono::seconds(rule.window_seconds);
    std::string key = MakeKey(scope, origin);
    auto& shard = ShardFor(key);
    TimePoint now = clock_->Now();

    std::lock_guard<std::mutex> lock(shard.mutex);
    status.remaining = rule.max_requests;
    auto it = shard.windows.find(key);
    if (it == shard.windows.end() || now >= it->second.started_at + window_length) {
        return status;
    }

    status.remaining = std::max(rule.max_requests - it->second.count, 0);
    if (it->second.count >= rule.max_requests) {
        status.allowed = false;
        status.retry_after_seconds = SecondsUntil(it->second.started_at + window_length, now);
    }
    return status;
}

size_t RateLimiter::Sweep() {
    TimePoint now = clock_->Now();
    auto login_window = std::chrono::seconds(config_.login.window_seconds);
    auto refresh_window = std::chrono::seconds(config_.refresh.window_seconds);
    const std::string login_prefix = MakeKey(RateLimitScope::Login, "");
    size_t removed = 0;

    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (auto it = shard->windows.begin(); it != shard->windows.end();) {
            bool is_login = it->first.compare(0, login_prefix.size(), login_prefix) == 0;
            auto length = is_login ? login_window : refresh_window;
            if (now >= it->second.started_at + length) {
                it = shard->windows.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    return removed;
}

size_t RateLimiter::Size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        total += shard->windows.size();
    }
    return total;
}

}  // namespace token_service
