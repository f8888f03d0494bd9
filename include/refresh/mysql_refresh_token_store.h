#pragma once

#include <memory>
#include "refresh/refresh_token_store.h"
#include "pool/connection_pool.h"
#include "db/mysql_connection.h"

namespace token_service {

/**
 * @brief refresh_tokens 表的 DAO
 *
 * RotateAtomically：START TRANSACTION → SELECT ... FOR UPDATE 锁住前驱行 →
 * 检查未吊销且未过期 → INSERT 后继 → UPDATE 前驱 → COMMIT。
 * 并发轮换同一前驱时，后到者在行锁上等待，拿到锁后看到 revoked_at 已置位。
 */
class MySQLRefreshTokenStore : public RefreshTokenStore {
public:
    using MySQLPool = TemplateConnectionPool<MySQLConnection>;

    explicit MySQLRefreshTokenStore(std::shared_ptr<MySQLPool> pool);

    Result<void> Insert(const RefreshTokenRecord& record) override;
    Result<RefreshTokenRecord> FindByHash(const std::string& token_hash) override;
    Result<RefreshTokenRecord> FindById(const std::string& id) override;
    Result<bool> RotateAtomically(const std::string& old_id,
                                  const RefreshTokenRecord& successor,
                                  TimePoint now) override;
    Result<bool> Revoke(const std::string& id, TimePoint at) override;
    Result<int64_t> RevokeAllForUser(const std::string& user_id, TimePoint at) override;
    Result<int64_t> DeleteExpiredBefore(TimePoint cutoff) override;
    Result<int64_t> CountActiveForUser(const std::string& user_id, TimePoint now) override;

private:
    Result<RefreshTokenRecord> FindByField(const std::string& field, const std::string& value);
    static RefreshTokenRecord ParseRow(const MySQLResult& res);
    static void InsertRow(MySQLConnection& conn, const RefreshTokenRecord& record);

    std::shared_ptr<MySQLPool> pool_;
};

}  // namespace token_service
