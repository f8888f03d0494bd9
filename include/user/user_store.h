#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "common/result.h"
#include "entity/user_entity.h"

namespace token_service {

/**
 * @brief 用户记录存储（外部协作方接口）
 *
 * 本服务只读取 id / email / role / token_version / app_id / password_hash，
 * 唯一的写操作是 BumpTokenVersion。
 */
class UserStore {
public:
    virtual ~UserStore() = default;

    /// @return 不存在时 UserNotFound
    virtual Result<UserEntity> GetById(const std::string& id) = 0;

    /// @return 不存在时 UserNotFound（email 大小写不敏感）
    virtual Result<UserEntity> FindByEmail(const std::string& email) = 0;

    virtual Result<int64_t> GetTokenVersion(const std::string& id) = 0;

    /// @brief 原子 +1
    /// @return 新版本号
    virtual Result<int64_t> BumpTokenVersion(const std::string& id) = 0;
};

// ==================== 内存实现 ====================
class InMemoryUserStore : public UserStore {
public:
    Result<UserEntity> GetById(const std::string& id) override;
    Result<UserEntity> FindByEmail(const std::string& email) override;
    Result<int64_t> GetTokenVersion(const std::string& id) override;
    Result<int64_t> BumpTokenVersion(const std::string& id) override;

    /// @brief 写入或覆盖（测试 / 本地开发造数据）
    void Put(const UserEntity& user);

private:
    std::mutex mutex_;
    std::unordered_map<std::string, UserEntity> users_;
    std::unordered_map<std::string, std::string> email_index_;   // 小写 email → id
};

}  // namespace token_service
