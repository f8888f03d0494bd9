#pragma once

#include <memory>
#include <optional>
#include <string>

#include "common/clock.h"
#include "common/result.h"
#include "config/config.h"
#include "entity/refresh_token.h"
#include "refresh/refresh_token_store.h"

namespace token_service {

/**
 * @brief Refresh Token 的签发 / 校验 / 单次使用轮换
 *
 * @details
 *   ┌────────────┬──────────────────────────────────────────────────────┐
 *   │ 操作       │ 说明                                                 │
 *   ├────────────┼──────────────────────────────────────────────────────┤
 *   │ Issue      │ 只存 SHA-256(secret)，expires_at = now + refresh_ttl │
 *   │ Validate   │ 格式 / 不存在 / 已用 / 过期 → Ok(空)；存储故障 → Fail│
 *   │ Rotate     │ 原子：后继入库 + 前驱吊销；输掉竞争 → InvalidOrUsed  │
 *   │ Sweep      │ 删除 expires_at < cutoff 的记录，幂等                │
 *   └────────────┴──────────────────────────────────────────────────────┘
 *
 * 重放已轮换过的旧 token 只会让本次请求失败，不级联吊销整条链。
 */
class RefreshRotationService {
public:
    RefreshRotationService(std::shared_ptr<RefreshTokenStore> store,
                           const SecurityConfig& config,
                           std::shared_ptr<Clock> clock);

    /// @return rt_ + 64 位十六进制（32 字节随机数）
    /// @throws std::runtime_error 随机数源不可用
    static std::string GenerateSecret();

    /// @return 新记录 id
    Result<std::string> Issue(const std::string& raw_secret,
                              const std::string& user_id,
                              const std::string& app_id);

    /// @return 可用记录；不可用时 Ok(nullopt)，存储不可达时透传错误码（不可与"无效"混淆）
    Result<std::optional<RefreshTokenRecord>> Validate(const std::string& raw_secret);

    /// @return 后继记录 id
    Result<std::string> Rotate(const std::string& old_id,
                               const std::string& new_raw_secret,
                               const std::string& user_id,
                               const std::string& app_id);

    /// @return false 表示不存在或已吊销
    Result<bool> Revoke(const std::string& id);

    Result<int64_t> RevokeAllForUser(const std::string& user_id);

    Result<int64_t> SweepExpired(TimePoint cutoff);

    Result<int64_t> CountActiveForUser(const std::string& user_id);

private:
    RefreshTokenRecord BuildRecord(const std::string& raw_secret,
                                   const std::string& user_id,
                                   const std::string& app_id,
                                   TimePoint now) const;

    std::shared_ptr<RefreshTokenStore> store_;
    std::chrono::seconds ttl_;
    std::shared_ptr<Clock> clock_;
};

}  // namespace token_service
