#pragma once

#include <memory>
#include "revocation/revocation_denylist.h"
#include "pool/connection_pool.h"
#include "db/mysql_connection.h"

namespace token_service {

// revoked_access_tokens 表（jti 主键）
class MySQLRevocationDenylist : public RevocationDenylist {
public:
    using MySQLPool = TemplateConnectionPool<MySQLConnection>;

    MySQLRevocationDenylist(std::shared_ptr<MySQLPool> pool, std::shared_ptr<Clock> clock);

    Result<void> Revoke(const RevokedAccessTokenEntry& entry) override;
    Result<bool> IsRevoked(const std::string& jti) override;
    Result<std::optional<RevokedAccessTokenEntry>> Get(const std::string& jti) override;
    Result<int64_t> SweepExpired() override;
    Result<int64_t> Count() override;
    Result<void> Clear() override;

private:
    std::shared_ptr<MySQLPool> pool_;
    std::shared_ptr<Clock> clock_;
};

}  // namespace token_service
