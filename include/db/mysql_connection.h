#pragma once

#include "config/config.h"
#include "db/mysql_result.h"
#include <mysql/mysql.h>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <variant>
#include <vector>

namespace token_service {

/**
 * @brief MySQL 连接封装（MySQL C API）
 *
 * - 构造即连接，可重试错误按 max_retries / retry_interval_ms 重连
 * - Query / Execute 使用 "?" 占位符，字符串参数经 mysql_real_escape_string 转义
 * - 错误统一转换为 MySQLException 体系（见 exception/mysql_exception.h）
 * - 非线程安全：一个连接同一时刻只能被一个线程使用（由连接池保证）
 */
class MySQLConnection {
public:
    using Param = std::variant<std::nullptr_t, int64_t, uint64_t, double, std::string, bool>;

    /// @throws MySQLException 连接失败（重试耗尽）
    explicit MySQLConnection(const MySQLConfig& config);
    ~MySQLConnection();

    MySQLConnection(const MySQLConnection&) = delete;
    MySQLConnection& operator=(const MySQLConnection&) = delete;
    MySQLConnection(MySQLConnection&&) = delete;
    MySQLConnection& operator=(MySQLConnection&&) = delete;

    bool Valid() const { return mysql_ && mysql_ping(mysql_) == 0; }

    // ==================== 查询 / 执行 ====================

    MySQLResult Query(const std::string& sql, std::initializer_list<Param> params = {});
    MySQLResult Query(const std::string& sql, const std::vector<Param>& params);

    /// @return 受影响行数
    uint64_t Execute(const std::string& sql, std::initializer_list<Param> params = {});
    uint64_t Execute(const std::string& sql, const std::vector<Param>& params);

    // ==================== 事务 ====================

    void BeginTransaction();
    void Commit();
    void Rollback();

private:
    void InitAndSetOptions(const MySQLConfig& config);
    bool TryConnect(const MySQLConfig& config);
    void ConnectWithRetry(const MySQLConfig& config);
    static bool IsRetryableError(unsigned int err_code);

    std::string Escape(const std::string& str);

    template<typename Iter>
    std::string BuildSQL(const std::string& sql, Iter begin, Iter end);

    MySQLResult DoQuery(const std::string& sql);
    uint64_t DoExecute(const std::string& sql);

    [[noreturn]] void ThrowLastError();

    MYSQL* mysql_ = nullptr;
};

/**
 * @brief 事务 RAII 守卫
 *
 * 构造时 START TRANSACTION，析构时若未 Commit() 则自动 ROLLBACK。
 * 回滚失败只记录日志（析构中不抛异常），连接归还连接池时会做有效性检测。
 */
class Transaction {
public:
    explicit Transaction(MySQLConnection& conn);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void Commit();

private:
    MySQLConnection& conn_;
    bool finished_ = false;
};

} // namespace token_service
