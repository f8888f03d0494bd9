#include "keys/mysql_key_store.h"
#include "db/store_macros.h"
#include "exception/mysql_exception.h"

namespace token_service {

namespace {

constexpr const char* kSelectColumns =
    "SELECT kid, algorithm, public_key_pem, private_key_pem, created_at, retired_at, is_active "
    "FROM signing_keys ";

}  // namespace

MySQLKeyStore::MySQLKeyStore(std::shared_ptr<MySQLPool> pool)
    : pool_(std::move(pool))
{}

SigningKey MySQLKeyStore::ParseRow(const MySQLResult& res) {
    SigningKey key;
    key.kid = res.GetString("kid").value_or("");
    key.algorithm = res.GetString("algorithm").value_or(kSigningAlgorithm);
    key.public_key_pem = res.GetString("public_key_pem").value_or("");
    key.private_key_pem = res.GetString("private_key_pem").value_or("");
    key.created_at = FromDatetimeString(res.GetString("created_at").value_or(""));
    if (auto retired = res.GetString("retired_at")) {
        key.retired_at = FromDatetimeString(*retired);
    }
    key.is_active = res.GetInt("is_active").value_or(0) != 0;
    return key;
}

void MySQLKeyStore::InsertRow(MySQLConnection& conn, const SigningKey& key) {
    MySQLConnection::Param retired_at = nullptr;
    if (key.retired_at) {
        retired_at = ToDatetimeString(*key.retired_at);
    }
    conn.Execute(
        "INSERT INTO signing_keys "
        "(kid, algorithm, public_key_pem, private_key_pem, created_at, retired_at, is_active) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)",
        {key.kid, key.algorithm, key.public_key_pem, key.private_key_pem,
         ToDatetimeString(key.created_at), retired_at, key.is_active});
}

// 密钥集合变更的全局互斥点，持有至事务结束
void MySQLKeyStore::LockKeyRows(MySQLConnection& conn) {
    conn.Query("SELECT id FROM key_bootstrap_lock WHERE id = 1 FOR UPDATE");
}

// ==================== 写入 ====================

Result<void> MySQLKeyStore::Insert(const SigningKey& key) {
    try {
        auto conn = pool_->CreateConnection();
        CHECK_CONN(conn, Result<void>);

        InsertRow(*conn, key);
        LOG_INFO("Signing key persisted, kid={}", key.kid);
        return Result<void>::Ok();

    } catch (const MySQLDuplicateKeyException& e) {
        LOG_ERROR("Duplicate kid {}: {}", key.kid, e.what());
        return Result<void>::Fail(ErrorCode::Internal);
    } catch (const std::exception& e) {
        STORE_FAIL(Result<void>, "Insert signing key", e);
    }
}

Result<void> MySQLKeyStore::RetireIfOthersActive(const std::string& kid, TimePoint at) {
    try {
        auto conn = pool_->CreateConnection();
        CHECK_CONN(conn, Result<void>);

        Transaction tx(*conn);
        LockKeyRows(*conn);

        auto found = conn->Query("SELECT is_active FROM signing_keys WHERE kid = ?", {kid});
        if (!found.Next()) {
            return Result<void>::Fail(ErrorCode::KeyNotFound);
        }
        // 已退役的行不再改写 retired_at
        if (found.GetInt("is_active").value_or(0) == 0) {
            tx.Commit();
            return Result<void>::Ok();
        }

        auto count = conn->Query("SELECT COUNT(*) FROM signing_keys WHERE is_active = 1");
        int64_t active = count.Next() ? count.GetInt(0).value_or(0) : 0;
        if (active <= 1) {
            return Result<void>::Fail(ErrorCode::LastActiveKey);
        }

        conn->Execute("UPDATE signing_keys SET is_active = 0, retired_at = ? "
                      "WHERE kid = ? AND is_active = 1",
                      {ToDatetimeString(at), kid});
        tx.Commit();
        return Result<void>::Ok();

    } catch (const std::exception& e) {
        STORE_FAIL(Result<void>, "Retire signing key", e);
    }
}

Result<int64_t> MySQLKeyStore::InsertAndRetireActive(const SigningKey& key, TimePoint at) {
    try {
        auto conn = pool_->CreateConnection();
        CHECK_CONN(conn, Result<int64_t>);

        Transaction tx(*conn);
        LockKeyRows(*conn);

        auto retired = conn->Execute("UPDATE signing_keys SET is_active = 0, retired_at = ? "
                                     "WHERE is_active = 1",
                                     {ToDatetimeString(at)});
        InsertRow(*conn, key);
        tx.Commit();
        LOG_INFO("Signing key persisted, kid={}, retired={}", key.kid, retired);
        return Result<int64_t>::Ok(static_cast<int64_t>(retired));

    } catch (const MySQLDuplicateKeyException& e) {
        LOG_ERROR("Duplicate kid {}: {}", key.kid, e.what());
        return Result<int64_t>::Fail(ErrorCode::Internal);
    } catch (const std::exception& e) {
        STORE_FAIL(Result<int64_t>, "Rotate signing keys", e);
    }
}

Result<SigningKey> MySQLKeyStore::InsertIfNoActive(const SigningKey& candidate) {
    try {
        auto conn = pool_->CreateConnection();
        CHECK_CONN(conn, Result<SigningKey>);

        Transaction tx(*conn);
        LockKeyRows(*conn);

        auto res = conn->Query(std::string(kSelectColumns) +
                               "WHERE is_active = 1 ORDER BY created_at ASC, kid ASC LIMIT 1");
        if (res.Next()) {
            SigningKey existing = ParseRow(res);
            tx.Commit();
            return Result<SigningKey>::Ok(std::move(existing));
        }

        InsertRow(*conn, candidate);
        tx.Commit();
        LOG_INFO("Bootstrap signing key persisted, kid={}", candidate.kid);
        return Result<SigningKey>::Ok(candidate);

    } catch (const std::exception& e) {
        STORE_FAIL(Result<SigningKey>, "Bootstrap signing key", e);
    }
}

// ==================== 查询 ====================

Result<SigningKey> MySQLKeyStore::FindByKid(const std::string& kid) {
    try {
        auto conn = pool_->CreateConnection();
        CHECK_CONN(conn, Result<SigningKey>);

        auto res = conn->Query(std::string(kSelectColumns) + "WHERE kid = ?", {kid});
        if (!res.Next()) {
            return Result<SigningKey>::Fail(ErrorCode::KeyNotFound);
        }
        return Result<SigningKey>::Ok(ParseRow(res));

    } catch (const std::exception& e) {
        STORE_FAIL(Result<SigningKey>, "FindByKid", e);
    }
}

Result<std::vector<SigningKey>> MySQLKeyStore::ListActive() {
    try {
        auto conn = pool_->CreateConnection();
        CHECK_CONN(conn, Result<std::vector<SigningKey>>);

        auto res = conn->Query(std::string(kSelectColumns) +
                               "WHERE is_active = 1 ORDER BY created_at ASC, kid ASC");
        std::vector<SigningKey> keys;
        keys.reserve(res.RowCount());
        while (res.Next()) {
            keys.push_back(ParseRow(res));
        }
        return Result<std::vector<SigningKey>>::Ok(std::move(keys));

    } catch (const std::exception& e) {
        STORE_FAIL(Result<std::vector<SigningKey>>, "ListActive signing keys", e);
    }
}

Result<std::vector<SigningKey>> MySQLKeyStore::ListAll() {
    try {
        auto conn = pool_->CreateConnection();
        CHECK_CONN(conn, Result<std::vector<SigningKey>>);

        auto res = conn->Query(std::string(kSelectColumns) + "ORDER BY created_at ASC, kid ASC");
        std::vector<SigningKey> keys;
        keys.reserve(res.RowCount());
        while (res.Next()) {
            keys.push_back(ParseRow(res));
        }
        return Result<std::vector<SigningKey>>::Ok(std::move(keys));

    } catch (const std::exception& e) {
        STORE_FAIL(Result<std::vector<SigningKey>>, "ListAll signing keys", e);
    }
}

Result<int64_t> MySQLKeyStore::CountActive() {
    try {
        auto conn = pool_->CreateConnection();
        CHECK_CONN(conn, Result<int64_t>);

        auto res = conn->Query("SELECT COUNT(*) FROM signing_keys WHERE is_active = 1");
        int64_t count = 0;
        if (res.Next()) {
            count = res.GetInt(0).value_or(0);
        }
        return Result<int64_t>::Ok(count);

    } catch (const std::exception& e) {
        STORE_FAIL(Result<int64_t>, "CountActive signing keys", e);
    }
}

}  // namespace token_service
