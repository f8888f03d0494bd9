#include "refresh/refresh_token_store.h"

namespace token_service {

void InMemoryRefreshTokenStore::InsertLocked(const RefreshTokenRecord& record) {
    records_[record.id] = record;
    hash_index_[record.token_hash] = record.id;
}

Result<void> InMemoryRefreshTokenStore::Insert(const RefreshTokenRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.count(record.id) || hash_index_.count(record.token_hash)) {
        return Result<void>::Fail(ErrorCode::Internal, "duplicate refresh token record");
    }
    InsertLocked(record);
    return Result<void>::Ok();
}

Result<RefreshTokenRecord> InMemoryRefreshTokenStore::FindByHash(const std::string& token_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto idx = hash_index_.find(token_hash);
    if (idx == hash_index_.end()) {
        return Result<RefreshTokenRecord>::Fail(ErrorCode::RefreshTokenInvalidOrUsed);
    }
    auto it = records_.find(idx->second);
    if (it == records_.end()) {
        return Result<RefreshTokenRecord>::Fail(ErrorCode::RefreshTokenInvalidOrUsed);
    }
    return Result<RefreshTokenRecord>::Ok(it->second);
}

Result<RefreshTokenRecord> InMemoryRefreshTokenStore::FindById(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return Result<RefreshTokenRecord>::Fail(ErrorCode::RefreshTokenInvalidOrUsed);
    }
    return Result<RefreshTokenRecord>::Ok(it->second);
}

Result<bool> InMemoryRefreshTokenStore::RotateAtomically(const std::string& old_id,
                                                         const RefreshTokenRecord& successor,
                                                         TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(old_id);
    if (it == records_.end() || !it->second.IsUsableAt(now)) {
        return Result<bool>::Ok(false);
    }
    if (records_.count(successor.id) || hash_index_.count(successor.token_hash)) {
        return Result<bool>::Fail(ErrorCode::Internal, "duplicate refresh token record");
    }

    it->second.revoked_at = now;
    it->second.replaced_by_id = successor.id;
    InsertLocked(successor);
    return Result<bool>::Ok(true);
}

Result<bool> InMemoryRefreshTokenStore::Revoke(const std::string& id, TimePoint at) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end() || it->second.IsRevoked()) {
        return Result<bool>::Ok(false);
    }
    it->second.revoked_at = at;
    return Result<bool>::Ok(true);
}

Result<int64_t> InMemoryRefreshTokenStore::RevokeAllForUser(const std::string& user_id, TimePoint at) {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t revoked = 0;
    for (auto& [id, record] : records_) {
        if (record.user_id == user_id && !record.IsRevoked()) {
            record.revoked_at = at;
            ++revoked;
        }
    }
    return Result<int64_t>::Ok(revoked);
}

Result<int64_t> InMemoryRefreshTokenStore::DeleteExpiredBefore(TimePoint cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t removed = 0;
    for (auto it = records_.begin(); it != records_.end();) {
        if (it->second.expires_at < cutoff) {
            hash_index_.erase(it->second.token_hash);
            it = records_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return Result<int64_t>::Ok(removed);
}

Result<int64_t> InMemoryRefreshTokenStore::CountActiveForUser(const std::string& user_id, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t active = 0;
    for (const auto& [id, record] : records_) {
        if (record.user_id == user_id && record.IsUsableAt(now)) ++active;
    }
    return Result<int64_t>::Ok(active);
}

size_t InMemoryRefreshTokenStore::Size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

}  // namespace token_service
