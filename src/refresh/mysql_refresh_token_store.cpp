#include "refresh/mysql_refresh_token_store.h"
#include "db/store_macros.h"
#include "exception/mysql_exception.h"

namespace token_service {

MySQLRefreshTokenStore::MySQLRefreshTokenStore(std::shared_ptr<MySQLPool> pool)
    : pool_(std::move(pool))
{}

RefreshTokenRecord MySQLRefreshTokenStore::ParseRow(const MySQLResult& res) {
    RefreshTokenRecord record;
    record.id = res.GetString("id").value_or("");
    record.user_id = res.GetString("user_id").value_or("");
    record.token_hash = res.GetString("token_hash").value_or("");
    record.app_id = res.GetString("app_id").value_or("");
    record.created_at = FromDatetimeString(res.GetString("created_at").value_or(""));
    record.expires_at = FromDatetimeString(res.GetString("expires_at").value_or(""));
    if (auto revoked = res.GetString("revoked_at")) {
        record.revoked_at = FromDatetimeString(*revoked);
    }
    record.replaced_by_id = res.GetString("replaced_by_id");
    return record;
}

void MySQLRefreshTokenStore::InsertRow(MySQLConnection& conn, const RefreshTokenRecord& record) {
    MySQLConnection::Param revoked_at = nullptr;
    if (record.revoked_at) {
        revoked_at = ToDatetimeString(*record.revoked_at);
    }
    MySQLConnection::Param replaced_by = nullptr;
    if (record.replaced_by_id) {
        replaced_by = *record.replaced_by_id;
    }
    conn.Execute(
        "INSERT INTO refresh_tokens "
        "(id, user_id, token_hash, app_id, created_at, expires_at, revoked_at, replaced_by_id) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?)",
        {record.id, record.user_id, record.token_hash, record.app_id,
         ToDatetimeString(record.created_at), ToDatetimeString(record.expires_at),
         revoked_at, replaced_by});
}

// ==================== 新增 ====================

Result<void> MySQLRefreshTokenStore::Insert(const RefreshTokenRecord& record) {
    try {
        auto conn = pool_->CreateConnection();
        CHECK_CONN(conn, Result<void>);

        InsertRow(*conn, record);
        LOG_DEBUG("Refresh token saved, id={}, user_id={}", record.id, record.user_id);
        return Result<void>::Ok();

    } catch (const MySQLDuplicateKeyException& e) {
        // SHA-256 冲突理论上不会发生
        LOG_ERROR("Duplicate refresh token record: {}", e.what());
        return Result<void>::Fail(ErrorCode::Internal);
    } catch (const std::exception& e) {
        STORE_FAIL(Result<void>, "Insert refresh token", e);
    }
}

// ==================== 查询 ====================

// field 只由本文件传入固定列名
Result<RefreshTokenRecord> MySQLRefreshTokenStore::FindByField(const std::string& field,
                                                               const std::string& value) {
    try {
        auto conn = pool_->CreateConnection();
        CHECK_CONN(conn, Result<RefreshTokenRecord>);

        std::string sql =
            "SELECT id, user_id, token_hash, app_id, created_at, expires_at, revoked_at, replaced_by_id "
            "FROM refresh_tokens WHERE " + field + " = ?";
        auto res = conn->Query(sql, {value});
        if (!res.Next()) {
            return Result<RefreshTokenRecord>::Fail(ErrorCode::RefreshTokenInvalidOrUsed);
        }
        return Result<RefreshTokenRecord>::Ok(ParseRow(res));

    } catch (const std::exception& e) {
        STORE_FAIL(Result<RefreshTokenRecord>, "Find refresh token by " + field, e);
    }
}

Result<RefreshTokenRecord> MySQLRefreshTokenStore::FindByHash(const std::string& token_hash) {
    return FindByField("token_hash", token_hash);
}

Result<RefreshTokenRecord> MySQLRefreshTokenStore::FindById(const std::string& id) {
    return FindByField("id", id);
}

Result<int64_t> MySQLRefreshTokenStore::CountActiveForUser(const std::string& user_id, TimePoint now) {
    try {
        auto conn = pool_->CreateConnection();
        CHECK_CONN(conn, Result<int64_t>);

        auto res = conn->Query(
            "SELECT COUNT(*) FROM refresh_tokens "
            "WHERE user_id = ? AND revoked_at IS NULL AND expires_at > ?",
            {user_id, ToDatetimeString(now)});
        int64_t count = 0;
        if (res.Next()) {
            count = res.GetInt(0).value_or(0);
        }
        return Result<int64_t>::Ok(count);

    } catch (const std::exception& e) {
        STORE_FAIL(Result<int64_t>, "CountActiveForUser", e);
    }
}

// ==================== 轮换 ====================

Result<bool> MySQLRefreshTokenStore::RotateAtomically(const std::string& old_id,
                                                      const RefreshTokenRecord& successor,
                                                      TimePoint now) {
    try {
        auto conn = pool_->CreateConnection();
        CHECK_CONN(conn, Result<bool>);

        Transaction tx(*conn);
        auto res = conn->Query(
            "SELECT revoked_at, expires_at FROM refresh_tokens WHERE id = ? FOR UPDATE",
            {old_id});
        if (!res.Next()) {
            return Result<bool>::Ok(false);
        }
        bool revoked = !res.IsNull("revoked_at");
        TimePoint expires_at = FromDatetimeString(res.GetString("expires_at").value_or(""));
        if (revoked || expires_at <= now) {
            LOG_DEBUG("Rotate rejected, predecessor {} already used or expired", old_id);
            return Result<bool>::Ok(false);
        }

        InsertRow(*conn, successor);
        conn->Execute("UPDATE refresh_tokens SET revoked_at = ?, replaced_by_id = ? WHERE id = ?",
                      {ToDatetimeString(now), successor.id, old_id});
        tx.Commit();
        return Result<bool>::Ok(true);

    } catch (const MySQLDeadlockException& e) {
        // 死锁回滚后等价于"输给了另一个调用者"
        LOG_WARN("Rotate {} hit deadlock: {}", old_id, e.what());
        return Result<bool>::Ok(false);
    } catch (const std::exception& e) {
        STORE_FAIL(Result<bool>, "RotateAtomically", e);
    }
}

// ==================== 吊销 / 清理 ====================

Result<bool> MySQLRefreshTokenStore::Revoke(const std::string& id, TimePoint at) {
    try {
        auto conn = pool_->CreateConnection();
        CHECK_CONN(conn, Result<bool>);

        auto affected = conn->Execute(
            "UPDATE refresh_tokens SET revoked_at = ? WHERE id = ? AND revoked_at IS NULL",
            {ToDatetimeString(at), id});
        return Result<bool>::Ok(affected > 0);

    } catch (const std::exception& e) {
        STORE_FAIL(Result<bool>, "Revoke refresh token", e);
    }
}

Result<int64_t> MySQLRefreshTokenStore::RevokeAllForUser(const std::string& user_id, TimePoint at) {
    try {
        auto conn = pool_->CreateConnection();
        CHECK_CONN(conn, Result<int64_t>);

        auto affected = conn->Execute(
            "UPDATE refresh_tokens SET revoked_at = ? WHERE user_id = ? AND revoked_at IS NULL",
            {ToDatetimeString(at), user_id});
        LOG_INFO("Revoked {} refresh tokens for user_id={}", affected, user_id);
        return Result<int64_t>::Ok(static_cast<int64_t>(affected));

    } catch (const std::exception& e) {
        STORE_FAIL(Result<int64_t>, "RevokeAllForUser", e);
    }
}

Result<int64_t> MySQLRefreshTokenStore::DeleteExpiredBefore(TimePoint cutoff) {
    try {
        auto conn = pool_->CreateConnection();
        CHECK_CONN(conn, Result<int64_t>);

        auto affected = conn->Execute("DELETE FROM refresh_tokens WHERE expires_at < ?",
                                      {ToDatetimeString(cutoff)});
        return Result<int64_t>::Ok(static_cast<int64_t>(affected));

    } catch (const std::exception& e) {
        STORE_FAIL(Result<int64_t>, "DeleteExpiredBefore", e);
    }
}

}  // namespace token_service
