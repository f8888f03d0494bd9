#include "db/mysql_result.h"
#include "exception/mysql_exception.h"

#include <cstdlib>

namespace token_service {

// ==================== 构造与析构 ====================

MySQLResult::MySQLResult(MYSQL_RES* res)
    : result_(res),
      field_count_(res ? mysql_num_fields(res) : 0) {
    if (!result_) return;

    // 构建列名映射，支持按列名取值
    MYSQL_FIELD* fields = mysql_fetch_fields(result_);
    for (unsigned int i = 0; i < field_count_; ++i) {
        col_name_map_.emplace(fields[i].name, i);
    }
}

MySQLResult::~MySQLResult() {
    Release();
}

void MySQLResult::Release() {
    if (result_) {
        mysql_free_result(result_);
        result_ = nullptr;
    }
}

// ==================== 移动语义 ====================

MySQLResult::MySQLResult(MySQLResult&& other) noexcept
    : result_(other.result_),
      current_row_(other.current_row_),
      lengths_(other.lengths_),
      field_count_(other.field_count_),
      col_name_map_(std::move(other.col_name_map_)) {
    other.result_ = nullptr;
    other.current_row_ = nullptr;
    other.lengths_ = nullptr;
    other.field_count_ = 0;
}

MySQLResult& MySQLResult::operator=(MySQLResult&& other) noexcept {
    if (&other != this) {
        Release();

        result_ = other.result_;
        current_row_ = other.current_row_;
        lengths_ = other.lengths_;
        field_count_ = other.field_count_;
        col_name_map_ = std::move(other.col_name_map_);

        other.result_ = nullptr;
        other.current_row_ = nullptr;
        other.lengths_ = nullptr;
        other.field_count_ = 0;
    }
    return *this;
}

// ==================== 遍历 ====================

bool MySQLResult::Next() {
    if (!result_) return false;

    current_row_ = mysql_fetch_row(result_);
    if (current_row_) {
        // 必须用长度构造 string，字段内容不保证以 '\0' 结尾
        lengths_ = mysql_fetch_lengths(result_);
        return true;
    }
    return false;
}

size_t MySQLResult::RowCount() const {
    return result_ ? static_cast<size_t>(mysql_num_rows(result_)) : 0;
}

// ==================== 取值 ====================

void MySQLResult::CheckColumn(size_t col) const {
    if (!current_row_) {
        throw MySQLResultException("No current row, call Next() first");
    }
    if (col >= field_count_) {
        throw MySQLResultException("Column index out of range: " + std::to_string(col));
    }
}

size_t MySQLResult::GetColumnIndex(const std::string& col_name) const {
    auto it = col_name_map_.find(col_name);
    if (it == col_name_map_.end()) {
        throw MySQLResultException("Unknown column: " + col_name);
    }
    return it->second;
}

std::optional<std::string> MySQLResult::GetString(size_t col) const {
    CheckColumn(col);
    if (current_row_[col] == nullptr) {
        return std::nullopt;
    }
    if (lengths_) {
        return std::string(current_row_[col], lengths_[col]);
    }
    return std::string(current_row_[col]);
}

std::optional<int64_t> MySQLResult::GetInt(size_t col) const {
    CheckColumn(col);
    if (current_row_[col] == nullptr) {
        return std::nullopt;
    }
    return std::strtoll(current_row_[col], nullptr, 10);
}

bool MySQLResult::IsNull(const std::string& col_name) const {
    size_t col = GetColumnIndex(col_name);
    CheckColumn(col);
    return current_row_[col] == nullptr;
}

std::optional<std::string> MySQLResult::GetString(const std::string& col_name) const {
    return GetString(GetColumnIndex(col_name));
}

std::optional<int64_t> MySQLResult::GetInt(const std::string& col_name) const {
    return GetInt(GetColumnIndex(col_name));
}

}  // namespace token_service
