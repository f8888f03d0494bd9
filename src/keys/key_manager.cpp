#include "keys/key_manager.h"
#include "common/logger.h"
#include "common/token_type.h"

#include <stdexcept>
#include <utility>

namespace token_service {

namespace {

SigningKey StripPrivate(SigningKey key) {
    key.private_key_pem.clear();
    return key;
}

}  // namespace

KeyManager::KeyManager(std::shared_ptr<KeyStore> store, std::shared_ptr<Clock> clock,
                       std::chrono::seconds current_key_ttl)
    : store_(std::move(store))
    , clock_(std::move(clock))
    , current_key_ttl_(current_key_ttl)
{
    if (!store_) {
        throw std::invalid_argument("KeyManager: store is nullptr");
    }
    if (!clock_) {
        throw std::invalid_argument("KeyManager: clock is nullptr");
    }
    if (current_key_ttl_.count() <= 0) {
        throw std::invalid_argument("KeyManager: current_key_ttl must be positive");
    }
}

// ==================== 生成 / 激活 ====================

Result<SigningKey> KeyManager::GenerateKeyPair() {
    auto generated = EcKey::Generate();
    if (generated.IsErr()) {
        return Result<SigningKey>::FailFrom(generated);
    }
    const auto& ec = generated.Value();

    auto public_pem = ec->PublicPem();
    auto private_pem = ec->PrivatePem();
    if (public_pem.IsErr() || private_pem.IsErr()) {
        LOG_ERROR("Export generated key pair failed");
        return Result<SigningKey>::Fail(ErrorCode::KeyGenerationFailed);
    }

    SigningKey key;
    try {
        key.kid = std::string(kKeyIdPrefix) + RandomHex(16);
    } catch (const std::exception& e) {
        LOG_ERROR("Generate kid failed: {}", e.what());
        return Result<SigningKey>::Fail(ErrorCode::KeyGenerationFailed);
    }
    key.algorithm = kSigningAlgorithm;
    key.public_key_pem = public_pem.Value();
    key.private_key_pem = private_pem.Value();
    key.created_at = clock_->Now();
    key.is_active = true;

    // 新 kid 的解析结果直接放入缓存，省去一次 PEM 解析
    {
        std::unique_lock<std::shared_mutex> lock(key_cache_mutex_);
        key_cache_[key.kid] = ec;
    }
    return Result<SigningKey>::Ok(std::move(key));
}

Result<void> KeyManager::ActivateAndPersist(SigningKey key) {
    std::lock_guard<std::mutex> lock(bootstrap_mutex_);

    key.is_active = true;
    key.retired_at.reset();
    auto inserted = store_->Insert(key);
    if (inserted.IsErr()) {
        LOG_ERROR("Persist signing key {} failed: {}", key.kid, inserted.message);
        return inserted;
    }
    InvalidateCache();
    LOG_INFO("Signing key activated, kid={}", key.kid);
    return Result<void>::Ok();
}

// ==================== 查询 ====================

Result<std::shared_ptr<const SigningKey>> KeyManager::GetSigningKey() {
    using R = Result<std::shared_ptr<const SigningKey>>;
    auto fresh = [this](TimePoint now) {
        return current_ && now - current_loaded_at_ < current_key_ttl_;
    };
    {
        std::lock_guard<std::mutex> lock(current_mutex_);
        if (fresh(clock_->Now())) return R::Ok(current_);
    }

    std::lock_guard<std::mutex> bootstrap(bootstrap_mutex_);
    {
        std::lock_guard<std::mutex> lock(current_mutex_);
        if (fresh(clock_->Now())) return R::Ok(current_);
    }

    auto active = store_->ListActive();
    if (active.IsErr()) {
        return R::FailFrom(active);
    }

    SigningKey selected;
    if (!active.Value().empty()) {
        selected = active.Value().front();
    } else {
        auto candidate = GenerateKeyPair();
        if (candidate.IsErr()) {
            return R::FailFrom(candidate);
        }
        auto authoritative = store_->InsertIfNoActive(candidate.Value());
        if (authoritative.IsErr()) {
            return R::FailFrom(authoritative);
        }
        selected = std::move(authoritative).Value();
        if (selected.kid == candidate.Value().kid) {
            LOG_INFO("No active signing key, bootstrapped kid={}", selected.kid);
        } else {
            LOG_INFO("Another instance bootstrapped signing key, kid={}", selected.kid);
        }
        generation_.fetch_add(1);
    }

    if (selected.private_key_pem.empty()) {
        LOG_ERROR("Active signing key {} has no private material", selected.kid);
        return R::Fail(ErrorCode::NoActiveSigningKey);
    }

    auto current = std::make_shared<const SigningKey>(std::move(selected));
    {
        std::lock_guard<std::mutex> lock(current_mutex_);
        // 其他实例轮换或退役了密钥：本实例的 JWKS 也需要刷新
        if (current_ && current_->kid != current->kid) {
            LOG_INFO("Signing key changed in store, kid {} -> {}", current_->kid, current->kid);
            generation_.fetch_add(1);
        }
        current_ = current;
        current_loaded_at_ = clock_->Now();
    }
    return R::Ok(current);
}

Result<std::vector<SigningKey>> KeyManager::ListActivePublicKeys() {
    auto active = store_->ListActive();
    if (active.IsErr()) {
        return active;
    }
    std::vector<SigningKey> keys;
    keys.reserve(active.Value().size());
    for (auto& key : active.Value()) {
        keys.push_back(StripPrivate(std::move(key)));
    }
    return Result<std::vector<SigningKey>>::Ok(std::move(keys));
}

Result<SigningKey> KeyManager::FindPublicKey(const std::string& kid) {
    auto found = store_->FindByKid(kid);
    if (found.IsErr()) {
        return found;
    }
    return Result<SigningKey>::Ok(StripPrivate(std::move(found).Value()));
}

Result<std::vector<SigningKeyInfo>> KeyManager::ListKeys() {
    auto all = store_->ListAll();
    if (all.IsErr()) {
        return Result<std::vector<SigningKeyInfo>>::FailFrom(all);
    }
    std::vector<SigningKeyInfo> infos;
    infos.reserve(all.Value().size());
    for (const auto& key : all.Value()) {
        infos.push_back(ToKeyInfo(key));
    }
    return Result<std::vector<SigningKeyInfo>>::Ok(std::move(infos));
}

// ==================== 签名 / 验签材料 ====================

Result<std::shared_ptr<const EcKey>> KeyManager::LoadEcKey(const SigningKey& key) {
    using R = Result<std::shared_ptr<const EcKey>>;
    {
        std::shared_lock<std::shared_mutex> lock(key_cache_mutex_);
        auto it = key_cache_.find(key.kid);
        if (it != key_cache_.end() &&
            (it->second->HasPrivate() || key.private_key_pem.empty())) {
            return R::Ok(it->second);
        }
    }

    auto parsed = key.private_key_pem.empty()
                      ? EcKey::FromPublicPem(key.public_key_pem)
                      : EcKey::FromPrivatePem(key.private_key_pem);
    if (parsed.IsErr()) {
        LOG_ERROR("Parse key material for kid={} failed: {}", key.kid, parsed.message);
        return R::FailFrom(parsed);
    }

    std::shared_ptr<const EcKey> ec = parsed.Value();
    {
        std::unique_lock<std::shared_mutex> lock(key_cache_mutex_);
        // 已有含私钥的解析结果时不被公钥版本覆盖
        auto& slot = key_cache_[key.kid];
        if (!slot || (!slot->HasPrivate() && ec->HasPrivate())) {
            slot = ec;
        }
    }
    return R::Ok(ec);
}

Result<std::pair<std::shared_ptr<const SigningKey>, std::shared_ptr<const EcKey>>>
KeyManager::GetSigner() {
    using Pair = std::pair<std::shared_ptr<const SigningKey>, std::shared_ptr<const EcKey>>;

    auto current = GetSigningKey();
    if (current.IsErr()) {
        return Result<Pair>::FailFrom(current);
    }
    auto ec = LoadEcKey(*current.Value());
    if (ec.IsErr() || !ec.Value()->HasPrivate()) {
        return Result<Pair>::Fail(ErrorCode::NoActiveSigningKey);
    }
    return Result<Pair>::Ok(Pair{current.Value(), ec.Value()});
}

Result<std::shared_ptr<const EcKey>> KeyManager::GetVerifier(const std::string& kid) {
    using R = Result<std::shared_ptr<const EcKey>>;
    {
        std::shared_lock<std::shared_mutex> lock(key_cache_mutex_);
        auto it = key_cache_.find(kid);
        if (it != key_cache_.end()) {
            return R::Ok(it->second);
        }
    }

    auto found = store_->FindByKid(kid);
    if (found.IsErr()) {
        return R::FailFrom(found);
    }
    return LoadEcKey(found.Value());
}

// ==================== 退役 / 轮换 ====================

Result<void> KeyManager::Retire(const std::string& kid) {
    std::lock_guard<std::mutex> lock(bootstrap_mutex_);

    auto retired = store_->RetireIfOthersActive(kid, clock_->Now());
    if (retired.IsErr()) {
        if (retired.code == ErrorCode::LastActiveKey) {
            LOG_WARN("Refuse to retire the last active signing key, kid={}", kid);
        }
        return retired;
    }
    InvalidateCache();
    LOG_INFO("Signing key retired, kid={}", kid);
    return Result<void>::Ok();
}

Result<SigningKey> KeyManager::Rotate(bool graceful_keep_old) {
    std::lock_guard<std::mutex> lock(bootstrap_mutex_);

    auto generated = GenerateKeyPair();
    if (generated.IsErr()) {
        return generated;
    }
    SigningKey key = std::move(generated).Value();

    int64_t retired = 0;
    if (graceful_keep_old) {
        auto inserted = store_->Insert(key);
        if (inserted.IsErr()) {
            return Result<SigningKey>::FailFrom(inserted);
        }
    } else {
        auto swapped = store_->InsertAndRetireActive(key, clock_->Now());
        if (swapped.IsErr()) {
            LOG_ERROR("Rotate to {} failed: {}", key.kid, swapped.message);
            return Result<SigningKey>::FailFrom(swapped);
        }
        retired = swapped.Value();
    }

    InvalidateCache();
    LOG_INFO("Signing keys rotated, new kid={}, graceful={}, retired={}",
             key.kid, graceful_keep_old, retired);
    return Result<SigningKey>::Ok(StripPrivate(std::move(key)));
}

void KeyManager::InvalidateCache() {
    {
        std::lock_guard<std::mutex> lock(current_mutex_);
        current_.reset();
    }
    generation_.fetch_add(1);
}

}  // namespace token_service
