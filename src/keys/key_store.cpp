#include "keys/key_store.h"

#include <algorithm>

namespace token_service {

namespace {

bool CreatedBefore(const SigningKey& a, const SigningKey& b) {
    if (a.created_at != b.created_at) return a.created_at < b.created_at;
    return a.kid < b.kid;
}

}  // namespace

Result<void> InMemoryKeyStore::Insert(const SigningKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (keys_.count(key.kid)) {
        return Result<void>::Fail(ErrorCode::Internal, "duplicate kid: " + key.kid);
    }
    keys_.emplace(key.kid, key);
    ++insert_count_;
    return Result<void>::Ok();
}

Result<SigningKey> InMemoryKeyStore::FindByKid(const std::string& kid) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = keys_.find(kid);
    if (it == keys_.end()) {
        return Result<SigningKey>::Fail(ErrorCode::KeyNotFound);
    }
    return Result<SigningKey>::Ok(it->second);
}

std::vector<SigningKey> InMemoryKeyStore::ActiveSortedLocked() const {
    std::vector<SigningKey> active;
    for (const auto& [kid, key] : keys_) {
        if (key.is_active) active.push_back(key);
    }
    std::sort(active.begin(), active.end(), CreatedBefore);
    return active;
}

Result<std::vector<SigningKey>> InMemoryKeyStore::ListActive() {
    std::lock_guard<std::mutex> lock(mutex_);
    return Result<std::vector<SigningKey>>::Ok(ActiveSortedLocked());
}

Result<std::vector<SigningKey>> InMemoryKeyStore::ListAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SigningKey> all;
    all.reserve(keys_.size());
    for (const auto& [kid, key] : keys_) {
        all.push_back(key);
    }
    std::sort(all.begin(), all.end(), CreatedBefore);
    return Result<std::vector<SigningKey>>::Ok(std::move(all));
}

Result<void> InMemoryKeyStore::RetireIfOthersActive(const std::string& kid, TimePoint at) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = keys_.find(kid);
    if (it == keys_.end()) {
        return Result<void>::Fail(ErrorCode::KeyNotFound);
    }
    if (!it->second.is_active) {
        return Result<void>::Ok();
    }
    auto active = std::count_if(keys_.begin(), keys_.end(),
                                [](const auto& kv) { return kv.second.is_active; });
    if (active <= 1) {
        return Result<void>::Fail(ErrorCode::LastActiveKey);
    }
    it->second.is_active = false;
    it->second.retired_at = at;
    return Result<void>::Ok();
}

Result<int64_t> InMemoryKeyStore::CountActive() {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t n = std::count_if(keys_.begin(), keys_.end(),
                              [](const auto& kv) { return kv.second.is_active; });
    return Result<int64_t>::Ok(n);
}

Result<SigningKey> InMemoryKeyStore::InsertIfNoActive(const SigningKey& candidate) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto active = ActiveSortedLocked();
    if (!active.empty()) {
        return Result<SigningKey>::Ok(active.front());
    }
    keys_[candidate.kid] = candidate;
    ++insert_count_;
    return Result<SigningKey>::Ok(candidate);
}

Result<int64_t> InMemoryKeyStore::InsertAndRetireActive(const SigningKey& key, TimePoint at) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (keys_.count(key.kid)) {
        return Result<int64_t>::Fail(ErrorCode::Internal, "duplicate kid: " + key.kid);
    }
    int64_t retired = 0;
    for (auto& [kid, existing] : keys_) {
        if (existing.is_active) {
            existing.is_active = false;
            existing.retired_at = at;
            ++retired;
        }
    }
    keys_.emplace(key.kid, key);
    ++insert_count_;
    return Result<int64_t>::Ok(retired);
}

size_t InMemoryKeyStore::InsertCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return insert_count_;
}

}  // namespace token_service
