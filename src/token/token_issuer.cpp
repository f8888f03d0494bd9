#include "token/token_issuer.h"
#include "common/crypto_utils.h"
#include "common/logger.h"
#include "entity/signing_key.h"

#include <nlohmann/json.hpp>

namespace token_service {

TokenIssuer::TokenIssuer(std::shared_ptr<KeyManager> key_manager,
                         const SecurityConfig& config,
                         std::shared_ptr<Clock> clock)
    : key_manager_(std::move(key_manager))
    , config_(config)
    , clock_(std::move(clock))
{}

Result<IssuedAccessToken> TokenIssuer::Issue(const UserEntity& user, const std::string& audience) {
    auto signer = key_manager_->GetSigner();
    if (signer.IsErr()) {
        LOG_ERROR("No signing key available: {}", signer.message);
        return Result<IssuedAccessToken>::FailFrom(signer);
    }
    const auto& [key, ec] = signer.Value();

    AccessTokenClaims claims;
    try {
        claims.jti = std::string(kAccessTokenIdPrefix) + RandomHex(16);
    } catch (const std::exception& e) {
        LOG_ERROR("Generate jti failed: {}", e.what());
        return Result<IssuedAccessToken>::Fail(ErrorCode::Internal);
    }
    claims.iss = config_.jwt_issuer;
    claims.aud = audience.empty() ? config_.jwt_audience : audience;
    claims.sub = user.id;
    claims.role = user.role;
    claims.token_version = user.token_version;
    claims.iat = ToUnixSeconds(clock_->Now());
    claims.nbf = claims.iat;
    claims.exp = claims.iat + config_.access_token_ttl_seconds;
    claims.email = user.email;
    claims.app_id = user.app_id;
    claims.kid = key->kid;

    nlohmann::json header = {
        {"alg", kSigningAlgorithm},
        {"typ", "JWT"},
        {"kid", key->kid},
    };
    nlohmann::json payload = {
        {"iss", claims.iss},
        {"aud", claims.aud},
        {"sub", claims.sub},
        {"role", claims.role},
        {"tv", claims.token_version},
        {"jti", claims.jti},
        {"iat", claims.iat},
        {"nbf", claims.nbf},
        {"exp", claims.exp},
    };
    if (!claims.email.empty()) payload["email"] = claims.email;
    if (!claims.app_id.empty()) payload["app_id"] = claims.app_id;

    std::string signing_input = Base64UrlEncode(header.dump()) + "." + Base64UrlEncode(payload.dump());
    auto signature = ec->Sign(signing_input);
    if (signature.IsErr()) {
        LOG_ERROR("Sign access token with kid={} failed: {}", key->kid, signature.message);
        return Result<IssuedAccessToken>::FailFrom(signature);
    }

    IssuedAccessToken issued;
    issued.token = signing_input + "." + Base64UrlEncode(signature.Value());
    issued.claims = std::move(claims);
    LOG_DEBUG("Access token issued, sub={}, jti={}, kid={}", issued.claims.sub, issued.claims.jti, key->kid);
    return Result<IssuedAccessToken>::Ok(std::move(issued));
}

}  // namespace token_service
