#include "db/mysql_connection.h"
#include "exception/mysql_exception.h"
#include "common/logger.h"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <thread>
#include <type_traits>

namespace token_service {

MySQLConnection::MySQLConnection(const MySQLConfig& config) {
    InitAndSetOptions(config);

    if (TryConnect(config)) {
        return;
    }

    // 一定要先保存错误信息，释放 mysql_ 后就拿不到了
    unsigned int err_code = mysql_errno(mysql_);
    std::string err_msg = mysql_error(mysql_);
    mysql_close(mysql_);
    mysql_ = nullptr;

    bool should_retry = config.auto_reconnect.value_or(true) &&
                        config.max_retries > 0 &&
                        IsRetryableError(err_code);
    if (!should_retry) {
        ThrowMySQLException(err_code, err_msg);
    }

    ConnectWithRetry(config);
}

MySQLConnection::~MySQLConnection() {
    if (mysql_) {
        mysql_close(mysql_);
        mysql_ = nullptr;
    }
}

// ==================== 连接建立 ====================

void MySQLConnection::InitAndSetOptions(const MySQLConfig& config) {
    mysql_ = mysql_init(nullptr);
    if (!mysql_) {
        // mysql_ 为空时不能调用 mysql_errno
        throw MySQLConnectionException("mysql_init failed: out of memory");
    }

    // 超时：MySQL C API 以秒为单位
    if (config.connection_timeout_ms.has_value()) {
        unsigned int timeout = std::max(1u, config.connection_timeout_ms.value() / 1000);
        mysql_options(mysql_, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
    }
    if (config.read_timeout_ms.has_value()) {
        unsigned int timeout = std::max(1u, config.read_timeout_ms.value() / 1000);
        mysql_options(mysql_, MYSQL_OPT_READ_TIMEOUT, &timeout);
    }
    if (config.write_timeout_ms.has_value()) {
        unsigned int timeout = std::max(1u, config.write_timeout_ms.value() / 1000);
        mysql_options(mysql_, MYSQL_OPT_WRITE_TIMEOUT, &timeout);
    }

    mysql_options(mysql_, MYSQL_SET_CHARSET_NAME, config.charset.c_str());
}

bool MySQLConnection::TryConnect(const MySQLConfig& config) {
    if (!mysql_real_connect(mysql_,
                            config.host.c_str(),
                            config.username.c_str(),
                            config.password.c_str(),
                            config.database.c_str(),
                            static_cast<unsigned int>(config.port),
                            nullptr,
                            0)) {
        return false;
    }
    // DATETIME 列统一按 UTC 读写
    if (mysql_query(mysql_, "SET time_zone = '+00:00'") != 0) {
        return false;
    }
    return true;
}

bool MySQLConnection::IsRetryableError(unsigned int err_code) {
    switch (err_code) {
        case 2002:  // CR_CONNECTION_ERROR
        case 2003:  // CR_CONN_HOST_ERROR
        case 2006:  // CR_SERVER_GONE_ERROR
        case 2013:  // CR_SERVER_LOST
            return true;
        default:
            return false;
    }
}

void MySQLConnection::ConnectWithRetry(const MySQLConfig& config) {
    unsigned int err_code = 0;
    std::string err_msg;

    for (unsigned int attempt = 1; attempt <= config.max_retries; ++attempt) {
        std::this_thread::sleep_for(std::chrono::milliseconds(config.retry_interval_ms));

        InitAndSetOptions(config);
        if (TryConnect(config)) {
            LOG_INFO("MySQL connected after {} retries", attempt);
            return;
        }

        err_code = mysql_errno(mysql_);
        err_msg = mysql_error(mysql_);
        mysql_close(mysql_);
        mysql_ = nullptr;

        LOG_WARN("MySQL connect attempt {}/{} failed: [{}] {}",
                 attempt, config.max_retries, err_code, err_msg);

        if (!IsRetryableError(err_code)) {
            break;
        }
    }

    ThrowMySQLException(err_code,
        "Failed after " + std::to_string(config.max_retries) + " retries: " + err_msg);
}

// ==================== 查询 / 执行 ====================

MySQLResult MySQLConnection::Query(const std::string& sql, std::initializer_list<Param> params) {
    return DoQuery(BuildSQL(sql, params.begin(), params.end()));
}

MySQLResult MySQLConnection::Query(const std::string& sql, const std::vector<Param>& params) {
    return DoQuery(BuildSQL(sql, params.begin(), params.end()));
}

uint64_t MySQLConnection::Execute(const std::string& sql, std::initializer_list<Param> params) {
    return DoExecute(BuildSQL(sql, params.begin(), params.end()));
}

uint64_t MySQLConnection::Execute(const std::string& sql, const std::vector<Param>& params) {
    return DoExecute(BuildSQL(sql, params.begin(), params.end()));
}

MySQLResult MySQLConnection::DoQuery(const std::string& sql) {
    if (mysql_query(mysql_, sql.c_str()) != 0) {
        ThrowLastError();
    }

    MYSQL_RES* res = mysql_store_result(mysql_);
    // SELECT 出错时 res 为空；空结果集不会为空
    if (res == nullptr && mysql_field_count(mysql_) > 0) {
        ThrowLastError();
    }
    return MySQLResult(res);
}

uint64_t MySQLConnection::DoExecute(const std::string& sql) {
    if (mysql_query(mysql_, sql.c_str()) != 0) {
        ThrowLastError();
    }
    return mysql_affected_rows(mysql_);
}

void MySQLConnection::ThrowLastError() {
    unsigned int err_code = mysql_errno(mysql_);
    std::string err_msg = mysql_error(mysql_);
    ThrowMySQLException(err_code, err_msg);
}

// ==================== 事务 ====================

void MySQLConnection::BeginTransaction() {
    DoExecute("START TRANSACTION");
}

void MySQLConnection::Commit() {
    DoExecute("COMMIT");
}

void MySQLConnection::Rollback() {
    DoExecute("ROLLBACK");
}

Transaction::Transaction(MySQLConnection& conn)
    : conn_(conn) {
    conn_.BeginTransaction();
}

Transaction::~Transaction() {
    if (finished_) return;
    try {
        conn_.Rollback();
    } catch (const std::exception& e) {
        LOG_ERROR("Transaction rollback failed: {}", e.what());
    }
}

void Transaction::Commit() {
    conn_.Commit();
    finished_ = true;
}

// ==================== SQL 构建 ====================

// 只能用于转义"参数值"
std::string MySQLConnection::Escape(const std::string& str) {
    if (!mysql_) {
        throw MySQLConnectionException("Connection not established");
    }
    std::vector<char> buffer(str.size() * 2 + 1);
    unsigned long len = mysql_real_escape_string(mysql_, buffer.data(), str.c_str(),
                                                 static_cast<unsigned long>(str.size()));
    return std::string(buffer.data(), len);
}

/// @brief "?" 占位符替换：sql 中不可以出现非占位用途的 '?'
template<typename Iter>
std::string MySQLConnection::BuildSQL(const std::string& sql, Iter begin, Iter end) {
    std::string result;
    result.reserve(sql.size() + static_cast<size_t>(std::distance(begin, end)) * 32);

    Iter param = begin;
    for (char c : sql) {
        if (c != '?') {
            result.push_back(c);
            continue;
        }
        if (param == end) {
            throw MySQLBuildException("Not enough parameters for SQL placeholders");
        }

        std::visit([&](auto&& val) {
            using T = std::decay_t<decltype(val)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                result += "NULL";
            } else if constexpr (std::is_same_v<T, std::string>) {
                result += '\'';
                result += Escape(val);
                result += '\'';
            } else if constexpr (std::is_same_v<T, bool>) {
                result += val ? "1" : "0";
            } else {
                result += std::to_string(val);
            }
        }, *param);
        ++param;
    }

    if (param != end) {
        throw MySQLBuildException("Too many parameters for SQL placeholders");
    }
    return result;
}

} // namespace token_service
