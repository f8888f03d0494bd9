#pragma once

#include <string>
#include "common/crypto_utils.h"

namespace token_service {

/**
 * @brief 口令哈希记录：$sha256$<salt>$<hex>
 *
 * hex = SHA256(salt + password)。只用于校验用户存储中已有的记录，
 * 新口令的写入由外部用户系统负责（Hash 供测试和内存存储造数据）。
 */
class PasswordHelper {
public:
    static constexpr const char* kScheme = "$sha256$";

    /// @throws std::runtime_error 随机数源不可用
    static std::string Hash(const std::string& password) {
        std::string salt = RandomHex(16);
        return HashWithSalt(password, salt);
    }

    static std::string HashWithSalt(const std::string& password, const std::string& salt) {
        return std::string(kScheme) + salt + "$" + Sha256Hex(salt + password);
    }

    /// @brief 格式不对一律视为不匹配
    static bool Verify(const std::string& password, const std::string& stored_hash) {
        const std::string scheme(kScheme);
        if (stored_hash.compare(0, scheme.size(), scheme) != 0) {
            return false;
        }

        size_t salt_end = stored_hash.find('$', scheme.size());
        if (salt_end == std::string::npos) {
            return false;
        }

        std::string salt = stored_hash.substr(scheme.size(), salt_end - scheme.size());
        std::string expected = stored_hash.substr(salt_end + 1);
        if (expected.empty()) {
            return false;
        }

        return ConstantTimeEquals(expected, Sha256Hex(salt + password));
    }
};

}  // namespace token_service
