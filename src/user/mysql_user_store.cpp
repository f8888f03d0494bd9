#include "user/mysql_user_store.h"
#include "common/utils.h"
#include "db/store_macros.h"

namespace token_service {

MySQLUserStore::MySQLUserStore(std::shared_ptr<MySQLPool> pool)
    : pool_(std::move(pool))
{}

UserEntity MySQLUserStore::ParseRow(const MySQLResult& res) {
    UserEntity user;
    user.id = res.GetString("id").value_or("");
    user.email = res.GetString("email").value_or("");
    user.role = res.GetString("role").value_or(kDefaultRole);
    user.token_version = res.GetInt("token_version").value_or(0);
    user.app_id = res.GetString("app_id").value_or("");
    user.password_hash = res.GetString("password_hash").value_or("");
    return user;
}

// field 只由本文件传入固定列名，不拼接外部输入
Result<UserEntity> MySQLUserStore::FindByField(const std::string& field, const std::string& value) {
    try {
        auto conn = pool_->CreateConnection();
        CHECK_CONN(conn, Result<UserEntity>);

        std::string sql = "SELECT id, email, role, token_version, app_id, password_hash "
                          "FROM users WHERE " + field + " = ? LIMIT 1";
        auto res = conn->Query(sql, {value});
        if (!res.Next()) {
            return Result<UserEntity>::Fail(ErrorCode::UserNotFound);
        }
        return Result<UserEntity>::Ok(ParseRow(res));

    } catch (const std::exception& e) {
        STORE_FAIL(Result<UserEntity>, "Find user by " + field, e);
    }
}

Result<UserEntity> MySQLUserStore::GetById(const std::string& id) {
    return FindByField("id", id);
}

Result<UserEntity> MySQLUserStore::FindByEmail(const std::string& email) {
    // email 列使用 utf8mb4_general_ci，比较本身大小写不敏感
    return FindByField("email", ToLower(email));
}

Result<int64_t> MySQLUserStore::GetTokenVersion(const std::string& id) {
    try {
        auto conn = pool_->CreateConnection();
        CHECK_CONN(conn, Result<int64_t>);

        auto res = conn->Query("SELECT token_version FROM users WHERE id = ?", {id});
        if (!res.Next()) {
            return Result<int64_t>::Fail(ErrorCode::UserNotFound);
        }
        return Result<int64_t>::Ok(res.GetInt("token_version").value_or(0));

    } catch (const std::exception& e) {
        STORE_FAIL(Result<int64_t>, "GetTokenVersion", e);
    }
}

Result<int64_t> MySQLUserStore::BumpTokenVersion(const std::string& id) {
    try {
        auto conn = pool_->CreateConnection();
        CHECK_CONN(conn, Result<int64_t>);

        Transaction tx(*conn);
        auto affected = conn->Execute(
            "UPDATE users SET token_version = token_version + 1 WHERE id = ?", {id});
        if (affected == 0) {
            return Result<int64_t>::Fail(ErrorCode::UserNotFound);
        }

        // 同一事务内读回，拿到的是本次自增后的值
        auto res = conn->Query("SELECT token_version FROM users WHERE id = ?", {id});
        int64_t version = 0;
        if (res.Next()) {
            version = res.GetInt("token_version").value_or(0);
        }
        tx.Commit();

        LOG_INFO("Token version bumped, user_id={}, version={}", id, version);
        return Result<int64_t>::Ok(version);

    } catch (const std::exception& e) {
        STORE_FAIL(Result<int64_t>, "BumpTokenVersion", e);
    }
}

}  // namespace token_service
