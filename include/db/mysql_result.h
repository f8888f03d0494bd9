#pragma once
#include <mysql/mysql.h>
#include <string>
#include <cstdint>
#include <optional>
#include <unordered_map>

namespace token_service {

/**
 * @brief MYSQL_RES 的 RAII 封装（只移动，不拷贝）
 *
 * @code
 *   auto res = conn->Query("SELECT kid, is_active FROM signing_keys");
 *   while (res.Next()) {
 *       auto kid = res.GetString("kid");
 *       bool active = res.GetInt("is_active").value_or(0) != 0;
 *   }
 * @endcode
 *
 * NULL 字段一律返回 std::nullopt。
 */
class MySQLResult {
public:
    explicit MySQLResult(MYSQL_RES* res);
    ~MySQLResult();

    MySQLResult(const MySQLResult&) = delete;
    MySQLResult& operator=(const MySQLResult&) = delete;
    MySQLResult(MySQLResult&& other) noexcept;
    MySQLResult& operator=(MySQLResult&& other) noexcept;

    // ==================== 遍历接口 ====================

    bool Next();

    // ==================== 元信息接口 ====================

    size_t RowCount() const;
    size_t FieldCount() const { return field_count_; }
    bool Empty() const { return result_ == nullptr || RowCount() == 0; }

    // ==================== 按列名获取字段值 ====================

    bool IsNull(const std::string& col_name) const;
    std::optional<std::string> GetString(const std::string& col_name) const;
    std::optional<int64_t> GetInt(const std::string& col_name) const;

    // ==================== 按索引获取字段值 ====================

    std::optional<std::string> GetString(size_t col) const;
    std::optional<int64_t> GetInt(size_t col) const;

private:
    void CheckColumn(size_t col) const;
    size_t GetColumnIndex(const std::string& col_name) const;
    void Release();

    MYSQL_RES* result_ = nullptr;           ///< MySQL 原生结果集
    MYSQL_ROW current_row_ = nullptr;       ///< 当前行
    unsigned long* lengths_ = nullptr;      ///< 当前行各字段长度
    unsigned int field_count_ = 0;

    std::unordered_map<std::string, size_t> col_name_map_;
};

} // namespace token_service
