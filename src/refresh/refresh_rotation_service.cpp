#include "refresh/refresh_rotation_service.h"
#include "common/crypto_utils.h"
#include "common/logger.h"
#include "common/token_type.h"
#include "common/uuid.h"
#include "common/utils.h"

namespace token_service {

RefreshRotationService::RefreshRotationService(std::shared_ptr<RefreshTokenStore> store,
                                               const SecurityConfig& config,
                                               std::shared_ptr<Clock> clock)
    : store_(std::move(store))
    , ttl_(config.refresh_token_ttl_seconds)
    , clock_(std::move(clock))
{}

std::string RefreshRotationService::GenerateSecret() {
    return std::string(kRefreshTokenPrefix) + RandomHex(32);
}

RefreshTokenRecord RefreshRotationService::BuildRecord(const std::string& raw_secret,
                                                       const std::string& user_id,
                                                       const std::string& app_id,
                                                       TimePoint now) const {
    RefreshTokenRecord record;
    record.id = UUIDHelper::RefreshRecordId();
    record.user_id = user_id;
    record.token_hash = Sha256Hex(raw_secret);
    record.app_id = app_id;
    record.created_at = now;
    record.expires_at = now + ttl_;
    return record;
}

Result<std::string> RefreshRotationService::Issue(const std::string& raw_secret,
                                                  const std::string& user_id,
                                                  const std::string& app_id) {
    auto record = BuildRecord(raw_secret, user_id, app_id, clock_->Now());
    auto inserted = store_->Insert(record);
    if (inserted.IsErr()) {
        LOG_ERROR("Issue refresh token for user_id={} failed: {}", user_id, inserted.message);
        return Result<std::string>::FailFrom(inserted);
    }
    LOG_DEBUG("Refresh token issued, id={}, user_id={}", record.id, user_id);
    return Result<std::string>::Ok(record.id);
}

Result<std::optional<RefreshTokenRecord>> RefreshRotationService::Validate(const std::string& raw_secret) {
    using R = Result<std::optional<RefreshTokenRecord>>;
    if (!StartsWith(raw_secret, kRefreshTokenPrefix)) {
        return R::Ok(std::optional<RefreshTokenRecord>{});
    }

    auto found = store_->FindByHash(Sha256Hex(raw_secret));
    if (found.IsErr()) {
        if (found.code == ErrorCode::RefreshTokenInvalidOrUsed) {
            return R::Ok(std::optional<RefreshTokenRecord>{});
        }
        LOG_WARN("Validate refresh token store failure: {}", found.message);
        return R::FailFrom(found);
    }
    if (!found.Value().IsUsableAt(clock_->Now())) {
        return R::Ok(std::optional<RefreshTokenRecord>{});
    }
    return R::Ok(std::optional<RefreshTokenRecord>(std::move(found).Value()));
}

Result<std::string> RefreshRotationService::Rotate(const std::string& old_id,
                                                   const std::string& new_raw_secret,
                                                   const std::string& user_id,
                                                   const std::string& app_id) {
    TimePoint now = clock_->Now();
    auto successor = BuildRecord(new_raw_secret, user_id, app_id, now);

    auto rotated = store_->RotateAtomically(old_id, successor, now);
    if (rotated.IsErr()) {
        return Result<std::string>::FailFrom(rotated);
    }
    if (!rotated.Value()) {
        LOG_WARN("Refresh token {} already used or expired, rotation rejected", old_id);
        return Result<std::string>::Fail(ErrorCode::RefreshTokenInvalidOrUsed);
    }
    LOG_DEBUG("Refresh token rotated, {} -> {}", old_id, successor.id);
    return Result<std::string>::Ok(successor.id);
}

Result<bool> RefreshRotationService::Revoke(const std::string& id) {
    return store_->Revoke(id, clock_->Now());
}

Result<int64_t> RefreshRotationService::RevokeAllForUser(const std::string& user_id) {
    return store_->RevokeAllForUser(user_id, clock_->Now());
}

Result<int64_t> RefreshRotationService::SweepExpired(TimePoint cutoff) {
    return store_->DeleteExpiredBefore(cutoff);
}

Result<int64_t> RefreshRotationService::CountActiveForUser(const std::string& user_id) {
    return store_->CountActiveForUser(user_id, clock_->Now());
}

}  // namespace token_service
