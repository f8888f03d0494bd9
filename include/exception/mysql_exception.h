#pragma once

#include <stdexcept>
#include <string>

namespace token_service {

// MySQL 异常基类（带 MySQL 错误码）
class MySQLException : public std::runtime_error {
public:
    MySQLException(unsigned int mysql_errno, const std::string& msg)
        : std::runtime_error(msg), errno_(mysql_errno)
    {}

    unsigned int mysql_errno() const { return errno_; }

    // 是否可重试（网络抖动 / 死锁）
    bool IsRetryable() const {
        return errno_ == 1213 ||    // 死锁
               errno_ == 1205 ||    // 锁等待超时
               errno_ == 2002 ||    // socket 错误
               errno_ == 2003 ||    // 无法连接主机
               errno_ == 2006 ||    // 服务断开
               errno_ == 2013;      // 连接丢失
    }

private:
    unsigned int errno_;
};

// ========== 连接类 ==========
class MySQLConnectionException : public MySQLException {
public:
    using MySQLException::MySQLException;
    explicit MySQLConnectionException(const std::string& msg) : MySQLException(0, msg) {}
};

// ========== 认证 / 权限类（配置问题，致命） ==========
class MySQLAuthException : public MySQLException {
public:
    using MySQLException::MySQLException;
};

// ========== 锁相关（可重试） ==========
class MySQLDeadlockException : public MySQLException {
public:
    using MySQLException::MySQLException;
};

// ========== 约束类：唯一键冲突 ==========
class MySQLDuplicateKeyException : public MySQLException {
public:
    MySQLDuplicateKeyException(unsigned int mysql_errno, const std::string& msg)
        : MySQLException(mysql_errno, msg), key_name_(ParseKeyName(msg))
    {}

    // 冲突的索引名（如 "PRIMARY"、"uk_token_hash"）
    const std::string& key_name() const { return key_name_; }

private:
    std::string key_name_;

    // MySQL 8 格式: "Duplicate entry 'x' for key 'table.index_name'"
    // MySQL 5.7 格式: "Duplicate entry 'x' for key 'index_name'"
    static std::string ParseKeyName(const std::string& msg) {
        auto end = msg.rfind('\'');
        if (end == std::string::npos || end == 0) return "";
        auto start = msg.rfind('\'', end - 1);
        if (start == std::string::npos) return "";
        std::string key = msg.substr(start + 1, end - start - 1);
        auto dot = key.rfind('.');
        return dot == std::string::npos ? key : key.substr(dot + 1);
    }
};

// ========== 查询类（SQL 语法 / 表不存在等，编程错误） ==========
class MySQLQueryException : public MySQLException {
public:
    using MySQLException::MySQLException;
};

// SQL 构建异常（参数与占位符数量不匹配等，非 MySQL 错误）
class MySQLBuildException : public std::logic_error {
public:
    explicit MySQLBuildException(const std::string& msg)
        : std::logic_error(msg)
    {}
};

// 结果集使用错误（列越界 / 列名不存在，非 MySQL 错误）
class MySQLResultException : public std::runtime_error {
public:
    explicit MySQLResultException(const std::string& msg)
        : std::runtime_error(msg) {}
};

// 根据 MySQL 错误码抛出对应异常
[[noreturn]] inline void ThrowMySQLException(unsigned int code, const std::string& msg) {
    switch (code) {
        case 2002:  // CR_CONNECTION_ERROR
        case 2003:  // CR_CONN_HOST_ERROR
        case 2005:  // CR_UNKNOWN_HOST
        case 2006:  // CR_SERVER_GONE_ERROR
        case 2013:  // CR_SERVER_LOST
        case 2055:  // CR_SERVER_LOST_EXTENDED
            throw MySQLConnectionException(code, msg);

        case 1044:  // ER_DBACCESS_DENIED_ERROR
        case 1045:  // ER_ACCESS_DENIED_ERROR
        case 1049:  // ER_BAD_DB_ERROR
        case 1142:  // ER_TABLEACCESS_DENIED_ERROR
            throw MySQLAuthException(code, msg);

        case 1205:  // ER_LOCK_WAIT_TIMEOUT
        case 1213:  // ER_LOCK_DEADLOCK
            throw MySQLDeadlockException(code, msg);

        case 1062:  // ER_DUP_ENTRY
            throw MySQLDuplicateKeyException(code, msg);

        case 1064:  // ER_PARSE_ERROR
        case 1054:  // ER_BAD_FIELD_ERROR
        case 1146:  // ER_NO_SUCH_TABLE
        case 1048:  // ER_BAD_NULL_ERROR
        case 1406:  // ER_DATA_TOO_LONG
            throw MySQLQueryException(code, msg);

        default:
            throw MySQLException(code, "[" + std::to_string(code) + "] " + msg);
    }
}

}  // namespace token_service
