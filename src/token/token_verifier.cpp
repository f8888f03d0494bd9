#include "token/token_verifier.h"
#include "common/crypto_utils.h"
#include "common/logger.h"
#include "common/utils.h"
#include "entity/signing_key.h"

#include <nlohmann/json.hpp>

namespace token_service {

namespace {

// 解码后的 JWS 三段
struct DecodedToken {
    std::string signing_input;      // b64url(header).b64url(payload)
    std::string signature;          // 原始 r||s
    AccessTokenClaims claims;
};

Result<DecodedToken> Decode(const std::string& token) {
    using R = Result<DecodedToken>;
    if (token.empty()) {
        return R::Fail(ErrorCode::TokenMissing);
    }

    auto parts = SplitView(token, '.');
    if (parts.size() != 3 || parts[0].empty() || parts[1].empty() || parts[2].empty()) {
        return R::Fail(ErrorCode::TokenMalformed);
    }

    auto header_raw = Base64UrlDecode(parts[0]);
    auto payload_raw = Base64UrlDecode(parts[1]);
    auto signature = Base64UrlDecode(parts[2]);
    if (!header_raw || !payload_raw || !signature) {
        return R::Fail(ErrorCode::TokenMalformed);
    }

    DecodedToken decoded;
    try {
        auto header = nlohmann::json::parse(*header_raw);
        auto payload = nlohmann::json::parse(*payload_raw);
        if (!header.is_object() || !payload.is_object()) {
            return R::Fail(ErrorCode::TokenMalformed);
        }
        if (header.value("alg", "") != kSigningAlgorithm) {
            return R::Fail(ErrorCode::TokenMalformed, "unsupported alg");
        }

        auto& claims = decoded.claims;
        claims.kid = header.at("kid").get<std::string>();
        claims.iss = payload.at("iss").get<std::string>();
        claims.aud = payload.at("aud").get<std::string>();
        claims.sub = payload.at("sub").get<std::string>();
        claims.jti = payload.at("jti").get<std::string>();
        claims.token_version = payload.at("tv").get<int64_t>();
        claims.iat = payload.at("iat").get<int64_t>();
        claims.exp = payload.at("exp").get<int64_t>();
        claims.nbf = payload.at("nbf").get<int64_t>();
        claims.role = payload.at("role").get<std::string>();
        claims.email = payload.value("email", std::string());
        claims.app_id = payload.value("app_id", std::string());
        if (claims.kid.empty() || claims.sub.empty() || claims.jti.empty()) {
            return R::Fail(ErrorCode::TokenMalformed);
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_DEBUG("Malformed token body: {}", e.what());
        return R::Fail(ErrorCode::TokenMalformed);
    }

    decoded.signing_input = std::string(parts[0]) + "." + std::string(parts[1]);
    decoded.signature = std::move(*signature);
    return R::Ok(std::move(decoded));
}

}  // namespace

TokenVerifier::TokenVerifier(std::shared_ptr<KeyManager> key_manager,
                             std::shared_ptr<UserStore> users,
                             std::shared_ptr<RevocationDenylist> denylist,
                             const SecurityConfig& config,
                             std::shared_ptr<Clock> clock)
    : key_manager_(std::move(key_manager))
    , users_(std::move(users))
    , denylist_(std::move(denylist))
    , config_(config)
    , clock_(std::move(clock))
{}

Result<AccessTokenClaims> TokenVerifier::VerifySignature(const std::string& token) {
    using R = Result<AccessTokenClaims>;

    auto decoded = Decode(token);
    if (decoded.IsErr()) {
        return R::FailFrom(decoded);
    }
    auto& d = decoded.Value();

    auto verifier = key_manager_->GetVerifier(d.claims.kid);
    if (verifier.IsErr()) {
        if (verifier.code == ErrorCode::KeyNotFound) {
            LOG_DEBUG("Unknown kid {}", d.claims.kid);
            return R::Fail(ErrorCode::SignatureInvalid);
        }
        return R::Fail(ErrorCode::ServiceUnavailable);
    }

    if (!verifier.Value()->Verify(d.signing_input, d.signature)) {
        return R::Fail(ErrorCode::SignatureInvalid);
    }
    return R::Ok(std::move(d.claims));
}

Result<AccessTokenClaims> TokenVerifier::Verify(const std::string& token,
                                                const std::optional<std::string>& expected_audience) {
    using R = Result<AccessTokenClaims>;

    auto verified = VerifySignature(token);
    if (verified.IsErr()) {
        return verified;
    }
    const auto& claims = verified.Value();

    if (claims.iss != config_.jwt_issuer) {
        return R::Fail(ErrorCode::IssuerMismatch);
    }

    int64_t now = ToUnixSeconds(clock_->Now());
    int64_t skew = config_.clock_skew_seconds;
    if (now >= claims.exp + skew) {
        return R::Fail(ErrorCode::TokenExpired);
    }
    if (now + skew < claims.nbf) {
        return R::Fail(ErrorCode::TokenNotYetValid);
    }

    if (expected_audience && !expected_audience->empty() && *expected_audience != claims.aud) {
        return R::Fail(ErrorCode::AudienceMismatch);
    }

    auto version = users_->GetTokenVersion(claims.sub);
    if (version.IsErr()) {
        if (version.code == ErrorCode::UserNotFound) {
            return R::Fail(ErrorCode::TokenVersionStale);
        }
        LOG_ERROR("Load token version for {} failed: {}", claims.sub, version.message);
        return R::Fail(ErrorCode::ServiceUnavailable);
    }
    if (version.Value() != claims.token_version) {
        return R::Fail(ErrorCode::TokenVersionStale);
    }

    if (config_.enable_jti_denylist) {
        auto revoked = denylist_->IsRevoked(claims.jti);
        if (revoked.IsErr()) {
            LOG_ERROR("Denylist lookup for {} failed: {}", claims.jti, revoked.message);
            return R::Fail(ErrorCode::ServiceUnavailable);
        }
        if (revoked.Value()) {
            return R::Fail(ErrorCode::TokenRevoked);
        }
    }

    return verified;
}

}  // namespace token_service
