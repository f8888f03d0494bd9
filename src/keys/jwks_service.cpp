#include "keys/jwks_service.h"
#include "common/crypto_utils.h"
#include "common/logger.h"

#include <nlohmann/json.hpp>

namespace token_service {

JwksService::JwksService(std::shared_ptr<KeyManager> key_manager,
                         const SecurityConfig& config,
                         std::shared_ptr<Clock> clock)
    : key_manager_(std::move(key_manager))
    , config_(config)
    , clock_(std::move(clock))
{}

std::string JwksService::CacheControl() const {
    return "public, max-age=" + std::to_string(config_.jwks_max_age_seconds) +
           ", stale-while-revalidate=" + std::to_string(config_.jwks_stale_while_revalidate_seconds);
}

Result<JwksDocument> JwksService::GetKeySet() {
    std::lock_guard<std::mutex> lock(mutex_);

    TimePoint now = clock_->Now();
    uint64_t generation = key_manager_->Generation();
    if (cached_ && cached_generation_ == generation &&
        now < cached_at_ + std::chrono::seconds(config_.jwks_max_age_seconds)) {
        return Result<JwksDocument>::Ok(*cached_);
    }

    auto rendered = Render();
    if (rendered.IsErr()) {
        return rendered;
    }
    cached_ = std::make_shared<const JwksDocument>(rendered.Value());
    cached_generation_ = generation;
    cached_at_ = now;
    return rendered;
}

Result<JwksDocument> JwksService::Render() {
    // 首次访问时触发引导，保证发布的集合不为空
    auto current = key_manager_->GetSigningKey();
    if (current.IsErr()) {
        return Result<JwksDocument>::FailFrom(current);
    }

    auto active = key_manager_->ListActivePublicKeys();
    if (active.IsErr()) {
        return Result<JwksDocument>::FailFrom(active);
    }

    JwksDocument doc;
    nlohmann::json keys = nlohmann::json::array();
    for (const auto& key : active.Value()) {
        auto ec = EcKey::FromPublicPem(key.public_key_pem);
        if (ec.IsErr()) {
            LOG_ERROR("Skip unparsable public key kid={}: {}", key.kid, ec.message);
            continue;
        }
        auto coords = ec.Value()->PublicCoordinates();
        if (coords.IsErr()) {
            LOG_ERROR("Skip key kid={}: {}", key.kid, coords.message);
            continue;
        }

        JsonWebKey jwk;
        jwk.x = Base64UrlEncode(coords.Value().x);
        jwk.y = Base64UrlEncode(coords.Value().y);
        jwk.kid = key.kid;

        keys.push_back({
            {"kty", jwk.kty},
            {"crv", jwk.crv},
            {"x", jwk.x},
            {"y", jwk.y},
            {"alg", jwk.alg},
            {"use", jwk.use},
            {"kid", jwk.kid},
        });
        doc.keys.push_back(std::move(jwk));
    }

    doc.json = nlohmann::json{{"keys", keys}}.dump();
    doc.cache_control = CacheControl();
    LOG_DEBUG("JWKS rendered, {} keys", doc.keys.size());
    return Result<JwksDocument>::Ok(std::move(doc));
}

}  // namespace token_service
