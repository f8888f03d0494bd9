#pragma once

#include <string>
#include <regex>
#include "common/token_type.h"
#include "common/utils.h"

namespace token_service {

/**
 * @brief 校验邮箱格式
 */
inline bool IsValidEmail(const std::string& email, std::string& error) {
    static const std::regex pattern(R"([a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,})");
    if (email.empty() || email.length() > 254 || !std::regex_match(email, pattern)) {
        error = "邮箱格式错误";
        return false;
    }
    return true;
}

inline bool IsValidPassword(const std::string& password, std::string& error) {
    if (password.empty()) {
        error = "密码不能为空";
        return false;
    }
    if (password.length() > 128) {
        error = "密码长度不能超过128位";
        return false;
    }
    return true;
}

/**
 * @brief 校验 refresh token 格式：rt_ + 64 位小写十六进制
 */
inline bool IsValidRefreshToken(const std::string& token, std::string& error) {
    const std::string prefix(kRefreshTokenPrefix);
    if (token.size() != prefix.size() + 64 || !StartsWith(token, prefix) ||
        !IsLowerHex(std::string_view(token).substr(prefix.size()))) {
        error = "refresh_token 格式错误";
        return false;
    }
    return true;
}

/**
 * @brief 校验签名密钥 ID：key_ + 32 位小写十六进制
 */
inline bool IsValidKid(const std::string& kid, std::string& error) {
    const std::string prefix(kKeyIdPrefix);
    if (kid.size() != prefix.size() + 32 || !StartsWith(kid, prefix) ||
        !IsLowerHex(std::string_view(kid).substr(prefix.size()))) {
        error = "kid 格式错误";
        return false;
    }
    return true;
}

inline bool IsValidJti(const std::string& jti, std::string& error) {
    if (jti.empty()) {
        error = "jti 不能为空";
        return false;
    }
    if (jti.length() > 128) {
        error = "jti 过长";
        return false;
    }
    return true;
}

/**
 * @brief 校验用户ID（非空、无空白）
 */
inline bool IsValidUserId(const std::string& user_id, std::string& error) {
    if (user_id.empty()) {
        error = "用户ID不能为空";
        return false;
    }
    if (user_id.length() > 64) {
        error = "用户ID过长";
        return false;
    }
    for (char c : user_id) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            error = "用户ID格式错误";
            return false;
        }
    }
    return true;
}

}  // namespace token_service
