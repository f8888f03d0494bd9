#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "common/result.h"
#include "entity/refresh_token.h"

namespace token_service {

/**
 * @brief Refresh Token 记录存储
 *
 * RotateAtomically 是单次使用语义的基础：只有当前驱仍未吊销且未过期时，
 * 才在同一个原子单元内写入后继并标记前驱（revoked_at + replaced_by_id）。
 * 并发轮换同一前驱时，恰好一个调用者返回 true。
 */
class RefreshTokenStore {
public:
    virtual ~RefreshTokenStore() = default;

    virtual Result<void> Insert(const RefreshTokenRecord& record) = 0;

    /// @return 不存在时 RefreshTokenInvalidOrUsed
    virtual Result<RefreshTokenRecord> FindByHash(const std::string& token_hash) = 0;

    /// @return 不存在时 RefreshTokenInvalidOrUsed
    virtual Result<RefreshTokenRecord> FindById(const std::string& id) = 0;

    /// @return false 表示前驱已被使用 / 吊销 / 过期 / 不存在
    virtual Result<bool> RotateAtomically(const std::string& old_id,
                                          const RefreshTokenRecord& successor,
                                          TimePoint now) = 0;

    /// @return false 表示不存在或已吊销
    virtual Result<bool> Revoke(const std::string& id, TimePoint at) = 0;

    /// @return 本次吊销的记录数（已吊销的不计）
    virtual Result<int64_t> RevokeAllForUser(const std::string& user_id, TimePoint at) = 0;

    /// @return 删除的记录数（expires_at < cutoff）
    virtual Result<int64_t> DeleteExpiredBefore(TimePoint cutoff) = 0;

    virtual Result<int64_t> CountActiveForUser(const std::string& user_id, TimePoint now) = 0;
};

// ==================== 内存实现 ====================
class InMemoryRefreshTokenStore : public RefreshTokenStore {
public:
    Result<void> Insert(const RefreshTokenRecord& record) override;
    Result<RefreshTokenRecord> FindByHash(const std::string& token_hash) override;
    Result<RefreshTokenRecord> FindById(const std::string& id) override;
    Result<bool> RotateAtomically(const std::string& old_id,
                                  const RefreshTokenRecord& successor,
                                  TimePoint now) override;
    Result<bool> Revoke(const std::string& id, TimePoint at) override;
    Result<int64_t> RevokeAllForUser(const std::string& user_id, TimePoint at) override;
    Result<int64_t> DeleteExpiredBefore(TimePoint cutoff) override;
    Result<int64_t> CountActiveForUser(const std::string& user_id, TimePoint now) override;

    size_t Size();

private:
    void InsertLocked(const RefreshTokenRecord& record);

    std::mutex mutex_;
    std::unordered_map<std::string, RefreshTokenRecord> records_;   // id → record
    std::unordered_map<std::string, std::string> hash_index_;       // token_hash → id
};

}  // namespace token_service
