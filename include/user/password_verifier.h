#pragma once

#include <memory>
#include <string>

#include "common/result.h"
#include "entity/user_entity.h"
#include "user/user_store.h"

namespace token_service {

// 口令校验（外部协作方接口）
class PasswordVerifier {
public:
    virtual ~PasswordVerifier() = default;

    /// @return 用户不存在与口令错误都返回 InvalidCredentials，不区分
    virtual Result<UserEntity> Verify(const std::string& email, const std::string& password) = 0;
};

/**
 * @brief 校验 UserStore 中的 $sha256$<salt>$<hex> 记录
 *
 * 用户不存在时仍计算一次哈希，使两种失败的耗时接近。
 */
class StoredHashPasswordVerifier : public PasswordVerifier {
public:
    explicit StoredHashPasswordVerifier(std::shared_ptr<UserStore> users);

    Result<UserEntity> Verify(const std::string& email, const std::string& password) override;

private:
    std::shared_ptr<UserStore> users_;
};

}  // namespace token_service
