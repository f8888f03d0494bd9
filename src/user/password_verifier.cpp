#include "user/password_verifier.h"
#include "common/logger.h"
#include "common/password_helper.h"

namespace token_service {

namespace {

// 用户不存在时参与比较的占位记录
constexpr const char* kDummyHash =
    "$sha256$00000000000000000000000000000000$"
    "0000000000000000000000000000000000000000000000000000000000000000";

}  // namespace

StoredHashPasswordVerifier::StoredHashPasswordVerifier(std::shared_ptr<UserStore> users)
    : users_(std::move(users))
{}

Result<UserEntity> StoredHashPasswordVerifier::Verify(const std::string& email,
                                                      const std::string& password) {
    auto user = users_->FindByEmail(email);
    if (user.IsErr()) {
        if (user.code != ErrorCode::UserNotFound) {
            return user;
        }
        PasswordHelper::Verify(password, kDummyHash);
        return Result<UserEntity>::Fail(ErrorCode::InvalidCredentials);
    }

    if (!PasswordHelper::Verify(password, user.Value().password_hash)) {
        LOG_DEBUG("Password mismatch, user_id={}", user.Value().id);
        return Result<UserEntity>::Fail(ErrorCode::InvalidCredentials);
    }
    return user;
}

}  // namespace token_service
