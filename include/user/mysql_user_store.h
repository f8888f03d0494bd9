#pragma once

#include <memory>
#include "user/user_store.h"
#include "pool/connection_pool.h"
#include "db/mysql_connection.h"

namespace token_service {

// users 表的只读 DAO（外加 token_version 自增）
class MySQLUserStore : public UserStore {
public:
    using MySQLPool = TemplateConnectionPool<MySQLConnection>;

    explicit MySQLUserStore(std::shared_ptr<MySQLPool> pool);

    Result<UserEntity> GetById(const std::string& id) override;
    Result<UserEntity> FindByEmail(const std::string& email) override;
    Result<int64_t> GetTokenVersion(const std::string& id) override;
    Result<int64_t> BumpTokenVersion(const std::string& id) override;

private:
    Result<UserEntity> FindByField(const std::string& field, const std::string& value);
    static UserEntity ParseRow(const MySQLResult& res);

    std::shared_ptr<MySQLPool> pool_;
};

}  // namespace token_service
