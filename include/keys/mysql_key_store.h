#pragma once

#include <memory>
#include "keys/key_store.h"
#include "pool/connection_pool.h"
#include "db/mysql_connection.h"

namespace token_service {

/**
 * @brief signing_keys 表的 DAO
 *
 * InsertIfNoActive / RetireIfOthersActive / InsertAndRetireActive 均在事务内
 * 对 key_bootstrap_lock 的单行加 FOR UPDATE 锁：多个实例同时冷启动时只有一个
 * 能插入首个密钥，并发的退役与轮换也不会让活跃密钥数归零。
 */
class MySQLKeyStore : public KeyStore {
public:
    using MySQLPool = TemplateConnectionPool<MySQLConnection>;

    explicit MySQLKeyStore(std::shared_ptr<MySQLPool> pool);

    Result<void> Insert(const SigningKey& key) override;
    Result<SigningKey> FindByKid(const std::string& kid) override;
    Result<std::vector<SigningKey>> ListActive() override;
    Result<std::vector<SigningKey>> ListAll() override;
    Result<void> RetireIfOthersActive(const std::string& kid, TimePoint at) override;
    Result<int64_t> CountActive() override;
    Result<SigningKey> InsertIfNoActive(const SigningKey& candidate) override;
    Result<int64_t> InsertAndRetireActive(const SigningKey& key, TimePoint at) override;

private:
    static SigningKey ParseRow(const MySQLResult& res);
    static void InsertRow(MySQLConnection& conn, const SigningKey& key);
    static void LockKeyRows(MySQLConnection& conn);

    std::shared_ptr<MySQLPool> pool_;
};

}  // namespace token_service
