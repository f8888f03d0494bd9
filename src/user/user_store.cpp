#include "user/user_store.h"
#include "common/utils.h"

namespace token_service {

void InMemoryUserStore::Put(const UserEntity& user) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(user.id);
    if (it != users_.end()) {
        email_index_.erase(ToLower(it->second.email));
    }
    users_[user.id] = user;
    if (!user.email.empty()) {
        email_index_[ToLower(user.email)] = user.id;
    }
}

Result<UserEntity> InMemoryUserStore::GetById(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(id);
    if (it == users_.end()) {
        return Result<UserEntity>::Fail(ErrorCode::UserNotFound);
    }
    return Result<UserEntity>::Ok(it->second);
}

Result<UserEntity> InMemoryUserStore::FindByEmail(const std::string& email) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto idx = email_index_.find(ToLower(email));
    if (idx == email_index_.end()) {
        return Result<UserEntity>::Fail(ErrorCode::UserNotFound);
    }
    return Result<UserEntity>::Ok(users_.at(idx->second));
}

Result<int64_t> InMemoryUserStore::GetTokenVersion(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(id);
    if (it == users_.end()) {
        return Result<int64_t>::Fail(ErrorCode::UserNotFound);
    }
    return Result<int64_t>::Ok(it->second.token_version);
}

Result<int64_t> InMemoryUserStore::BumpTokenVersion(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(id);
    if (it == users_.end()) {
        return Result<int64_t>::Fail(ErrorCode::UserNotFound);
    }
    return Result<int64_t>::Ok(++it->second.token_version);
}

}  // namespace token_service
