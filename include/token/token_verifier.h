#pragma once

#include <memory>
#include <optional>
#include <string>

#include "common/clock.h"
#include "common/result.h"
#include "common/token_type.h"
#include "config/config.h"
#include "keys/key_manager.h"
#include "revocation/revocation_denylist.h"
#include "user/user_store.h"

namespace token_service {

/**
 * @brief Access Token 校验
 *
 * @details 按以下顺序检查，第一个失败即返回对应错误码：
 *   ┌───┬───────────────────────────────────────────┬────────────────────┐
 *   │ # │ 检查                                      │ 错误码             │
 *   ├───┼───────────────────────────────────────────┼────────────────────┤
 *   │ 1 │ 空串                                      │ TokenMissing       │
 *   │   │ 结构 / base64url / JSON / 必填字段 / alg  │ TokenMalformed     │
 *   │ 2 │ kid 不存在（含已退役密钥的查找）          │ SignatureInvalid   │
 *   │ 3 │ ECDSA 签名不匹配                          │ SignatureInvalid   │
 *   │ 4 │ iss 与配置不一致                          │ IssuerMismatch     │
 *   │ 5 │ now >= exp + skew                         │ TokenExpired       │
 *   │ 6 │ now + skew < nbf                          │ TokenNotYetValid   │
 *   │ 7 │ 指定了 audience 且与 aud 不同             │ AudienceMismatch   │
 *   │ 8 │ tv 与用户当前版本不同 / 用户不存在        │ TokenVersionStale  │
 *   │ 9 │ 启用黑名单且 jti 已吊销                   │ TokenRevoked       │
 *   └───┴───────────────────────────────────────────┴────────────────────┘
 *   用户存储 / 黑名单不可达 → ServiceUnavailable
 */
class TokenVerifier {
public:
    TokenVerifier(std::shared_ptr<KeyManager> key_manager,
                  std::shared_ptr<UserStore> users,
                  std::shared_ptr<RevocationDenylist> denylist,
                  const SecurityConfig& config,
                  std::shared_ptr<Clock> clock);

    Result<AccessTokenClaims> Verify(const std::string& token,
                                     const std::optional<std::string>& expected_audience = std::nullopt);

    /// @brief 只做 1-3 步（结构 + 签名），用于按值吊销等不关心时效的场景
    Result<AccessTokenClaims> VerifySignature(const std::string& token);

private:
    std::shared_ptr<KeyManager> key_manager_;
    std::shared_ptr<UserStore> users_;
    std::shared_ptr<RevocationDenylist> denylist_;
    SecurityConfig config_;
    std::shared_ptr<Clock> clock_;
};

}  // namespace token_service
