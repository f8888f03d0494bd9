#pragma once

#include <memory>
#include <string>

#include "common/clock.h"
#include "common/result.h"
#include "common/token_type.h"
#include "config/config.h"
#include "entity/user_entity.h"
#include "keys/key_manager.h"

namespace token_service {

/**
 * @brief 使用当前签名密钥签发 ES256 Access Token
 *
 * @details
 *   header  = {"alg":"ES256","typ":"JWT","kid":<kid>}
 *   payload = {iss, aud, sub, role, tv, jti, iat, nbf, exp[, email][, app_id]}
 *   token   = b64url(header) "." b64url(payload) "." b64url(r||s)
 *
 *   - jti = at_ + 32 位十六进制
 *   - aud 为空时取配置的默认 audience
 *   - nbf = iat，exp = iat + access_token_ttl_seconds
 */
class TokenIssuer {
public:
    TokenIssuer(std::shared_ptr<KeyManager> key_manager,
                const SecurityConfig& config,
                std::shared_ptr<Clock> clock);

    /// @return 失败：NoActiveSigningKey / KeyGenerationFailed / 存储错误
    Result<IssuedAccessToken> Issue(const UserEntity& user, const std::string& audience = "");

    int64_t AccessTokenTtlSeconds() const { return config_.access_token_ttl_seconds; }

private:
    std::shared_ptr<KeyManager> key_manager_;
    SecurityConfig config_;
    std::shared_ptr<Clock> clock_;
};

}  // namespace token_service
