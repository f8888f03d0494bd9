#include "revocation/revocation_denylist.h"
#include "common/logger.h"

namespace token_service {

InMemoryRevocationDenylist::InMemoryRevocationDenylist(std::shared_ptr<Clock> clock)
    : clock_(std::move(clock))
{}

Result<void> InMemoryRevocationDenylist::Revoke(const RevokedAccessTokenEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint now = clock_->Now();

    auto it = entries_.find(entry.jti);
    if (it != entries_.end() && it->second.IsLiveAt(now)) {
        return Result<void>::Ok();
    }

    RevokedAccessTokenEntry stored = entry;
    if (stored.reason.empty()) {
        stored.reason = kDefaultRevocationReason;
    }
    stored.created_at = now;
    entries_[entry.jti] = std::move(stored);
    return Result<void>::Ok();
}

Result<bool> InMemoryRevocationDenylist::IsRevoked(const std::string& jti) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(jti);
    if (it == entries_.end()) {
        return Result<bool>::Ok(false);
    }
    if (!it->second.IsLiveAt(clock_->Now())) {
        entries_.erase(it);
        return Result<bool>::Ok(false);
    }
    return Result<bool>::Ok(true);
}

Result<std::optional<RevokedAccessTokenEntry>> InMemoryRevocationDenylist::Get(const std::string& jti) {
    using R = Result<std::optional<RevokedAccessTokenEntry>>;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(jti);
    if (it == entries_.end() || !it->second.IsLiveAt(clock_->Now())) {
        return R::Ok(std::nullopt);
    }
    return R::Ok(it->second);
}

Result<int64_t> InMemoryRevocationDenylist::SweepExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint now = clock_->Now();
    int64_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (!it->second.IsLiveAt(now)) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return Result<int64_t>::Ok(removed);
}

Result<int64_t> InMemoryRevocationDenylist::Count() {
    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint now = clock_->Now();
    int64_t live = 0;
    for (const auto& [jti, entry] : entries_) {
        if (entry.IsLiveAt(now)) ++live;
    }
    return Result<int64_t>::Ok(live);
}

Result<void> InMemoryRevocationDenylist::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    return Result<void>::Ok();
}

size_t InMemoryRevocationDenylist::RawSize() {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace token_service
