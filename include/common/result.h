#pragma once

#include "error_codes.h"
#include <optional>

namespace token_service {

// 通用版本：有返回值
template<typename T>
struct Result {
    ErrorCode code;
    std::string message;
    std::optional<T> data;

    // ==================== 构造方法 ====================

    static Result Ok(const T& value) {
        return {ErrorCode::Ok, GetErrorMessage(ErrorCode::Ok), value};
    }

    static Result Ok(T&& value) {
        return {ErrorCode::Ok, GetErrorMessage(ErrorCode::Ok), std::move(value)};
    }

    static Result Fail(ErrorCode c, const std::string& msg = "") {
        return {c, msg.empty() ? GetErrorMessage(c) : msg, std::nullopt};
    }

    // 透传另一个失败结果的错误码和消息（跨类型向上传递）
    template<typename U>
    static Result FailFrom(const U& other) {
        return {other.code, other.message, std::nullopt};
    }

    // ==================== 状态检查 ====================

    bool IsOk() const { return code == ErrorCode::Ok; }
    bool IsErr() const { return !IsOk(); }

    explicit operator bool() const { return IsOk(); }

    // ==================== 数据访问 ====================

    const T& Value() const& { return *data; }
    T& Value() & { return *data; }
    T&& Value() && { return std::move(*data); }

    T ValueOr(const T& default_value) const {
        return data.value_or(default_value);
    }
};

// ==================== 特化版本：无返回值 ====================

template<>
struct Result<void> {
    ErrorCode code;
    std::string message;

    static Result Ok() {
        return {ErrorCode::Ok, GetErrorMessage(ErrorCode::Ok)};
    }

    static Result Fail(ErrorCode c, const std::string& msg = "") {
        return {c, msg.empty() ? GetErrorMessage(c) : msg};
    }

    template<typename U>
    static Result FailFrom(const U& other) {
        return {other.code, other.message};
    }

    bool IsOk() const { return code == ErrorCode::Ok; }
    bool IsErr() const { return !IsOk(); }

    explicit operator bool() const { return IsOk(); }
};

}  // namespace token_service
