#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "common/clock.h"
#include "common/result.h"
#include "entity/revoked_token.h"

namespace token_service {

/**
 * @brief Access Token 的 JTI 黑名单
 *
 * 条目只在 expires_at 之前有意义；过期条目视为不存在，由 SweepExpired 清理。
 * Revoke 幂等：同一 jti 重复吊销返回成功，保留首次记录。
 */
class RevocationDenylist {
public:
    virtual ~RevocationDenylist() = default;

    virtual Result<void> Revoke(const RevokedAccessTokenEntry& entry) = 0;

    virtual Result<bool> IsRevoked(const std::string& jti) = 0;

    virtual Result<std::optional<RevokedAccessTokenEntry>> Get(const std::string& jti) = 0;

    /// @return 删除的条目数（expires_at <= now）
    virtual Result<int64_t> SweepExpired() = 0;

    /// @return 未过期条目数
    virtual Result<int64_t> Count() = 0;

    virtual Result<void> Clear() = 0;
};

// ==================== 内存实现 ====================
class InMemoryRevocationDenylist : public RevocationDenylist {
public:
    explicit InMemoryRevocationDenylist(std::shared_ptr<Clock> clock);

    Result<void> Revoke(const RevokedAccessTokenEntry& entry) override;
    Result<bool> IsRevoked(const std::string& jti) override;
    Result<std::optional<RevokedAccessTokenEntry>> Get(const std::string& jti) override;
    Result<int64_t> SweepExpired() override;
    Result<int64_t> Count() override;
    Result<void> Clear() override;

    // 包含尚未清理的过期条目
    size_t RawSize();

private:
    std::shared_ptr<Clock> clock_;
    std::mutex mutex_;
    std::unordered_map<std::string, RevokedAccessTokenEntry> entries_;
};

}  // namespace token_service
