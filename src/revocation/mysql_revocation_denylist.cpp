#include "revocation/mysql_revocation_denylist.h"
#include "db/store_macros.h"

namespace token_service {

MySQLRevocationDenylist::MySQLRevocationDenylist(std::shared_ptr<MySQLPool> pool,
                                                 std::shared_ptr<Clock> clock)
    : pool_(std::move(pool))
    , clock_(std::move(clock))
{}

Result<void> MySQLRevocationDenylist::Revoke(const RevokedAccessTokenEntry& entry) {
    try {
        auto conn = pool_->CreateConnection();
        CHECK_CONN(conn, Result<void>);

        std::string now = ToDatetimeString(clock_->Now());
        std::string reason = entry.reason.empty() ? kDefaultRevocationReason : entry.reason;

        // 已存在但已过期的条目视为新吊销；仍有效的保持首次记录
        conn->Execute(
            "INSERT INTO revoked_access_tokens (jti, user_id, app_id, reason, expires_at, created_at) "
            "VALUES (?, ?, ?, ?, ?, ?) "
            "ON DUPLICATE KEY UPDATE "
            "user_id = IF(expires_at <= ?, VALUES(user_id), user_id), "
            "app_id = IF(expires_at <= ?, VALUES(app_id), app_id), "
            "reason = IF(expires_at <= ?, VALUES(reason), reason), "
            "created_at = IF(expires_at <= ?, VALUES(created_at), created_at), "
            "expires_at = IF(expires_at <= ?, VALUES(expires_at), expires_at)",
            {entry.jti, entry.user_id, entry.app_id, reason,
             ToDatetimeString(entry.expires_at), now,
             now, now, now, now, now});

        LOG_INFO("Access token revoked, jti={}, user_id={}, reason={}", entry.jti, entry.user_id, reason);
        return Result<void>::Ok();

    } catch (const std::exception& e) {
        STORE_FAIL(Result<void>, "Revoke access token", e);
    }
}

Result<bool> MySQLRevocationDenylist::IsRevoked(const std::string& jti) {
    try {
        auto conn = pool_->CreateConnection();
        CHECK_CONN(conn, Result<bool>);

        auto res = conn->Query("SELECT 1 FROM revoked_access_tokens WHERE jti = ? AND expires_at > ?",
                               {jti, ToDatetimeString(clock_->Now())});
        return Result<bool>::Ok(!res.Empty());

    } catch (const std::exception& e) {
        STORE_FAIL(Result<bool>, "IsRevoked", e);
    }
}

Result<std::optional<RevokedAccessTokenEntry>> MySQLRevocationDenylist::Get(const std::string& jti) {
    using R = Result<std::optional<RevokedAccessTokenEntry>>;
    try {
        auto conn = pool_->CreateConnection();
        CHECK_CONN(conn, R);

        auto res = conn->Query(
            "SELECT jti, user_id, app_id, reason, expires_at, created_at "
            "FROM revoked_access_tokens WHERE jti = ? AND expires_at > ?",
            {jti, ToDatetimeString(clock_->Now())});
        if (!res.Next()) {
            return R::Ok(std::nullopt);
        }

        RevokedAccessTokenEntry entry;
        entry.jti = res.GetString("jti").value_or("");
        entry.user_id = res.GetString("user_id").value_or("");
        entry.app_id = res.GetString("app_id").value_or("");
        entry.reason = res.GetString("reason").value_or(kDefaultRevocationReason);
        entry.expires_at = FromDatetimeString(res.GetString("expires_at").value_or(""));
        entry.created_at = FromDatetimeString(res.GetString("created_at").value_or(""));
        return R::Ok(std::move(entry));

    } catch (const std::exception& e) {
        STORE_FAIL(R, "Get revoked entry", e);
    }
}

Result<int64_t> MySQLRevocationDenylist::SweepExpired() {
    try {
        auto conn = pool_->CreateConnection();
        CHECK_CONN(conn, Result<int64_t>);

        auto removed = conn->Execute("DELETE FROM revoked_access_tokens WHERE expires_at <= ?",
                                     {ToDatetimeString(clock_->Now())});
        return Result<int64_t>::Ok(static_cast<int64_t>(removed));

    } catch (const std::exception& e) {
        STORE_FAIL(Result<int64_t>, "Sweep revoked access tokens", e);
    }
}

Result<int64_t> MySQLRevocationDenylist::Count() {
    try {
        auto conn = pool_->CreateConnection();
        CHECK_CONN(conn, Result<int64_t>);

        auto res = conn->Query("SELECT COUNT(*) FROM revoked_access_tokens WHERE expires_at > ?",
                               {ToDatetimeString(clock_->Now())});
        int64_t count = 0;
        if (res.Next()) {
            count = res.GetInt(0).value_or(0);
        }
        return Result<int64_t>::Ok(count);

    } catch (const std::exception& e) {
        STORE_FAIL(Result<int64_t>, "Count revoked access tokens", e);
    }
}

Result<void> MySQLRevocationDenylist::Clear() {
    try {
        auto conn = pool_->CreateConnection();
        CHECK_CONN(conn, Result<void>);

        conn->Execute("DELETE FROM revoked_access_tokens");
        LOG_WARN("Revocation denylist cleared");
        return Result<void>::Ok();

    } catch (const std::exception& e) {
        STORE_FAIL(Result<void>, "Clear revoked access tokens", e);
    }
}

}  // namespace token_service
