#pragma once
#include <string>
#include <optional>
#include "common/time_utils.h"

namespace token_service{

inline constexpr const char* kSigningAlgorithm = "ES256";

// ==================== 签名密钥实体 ====================
// 退役（is_active=false）后仍保留公钥，用于验证退役前签发、尚未过期的 Token。
// 本服务从不物理删除密钥。
struct SigningKey {
    std::string kid;                    // key_<32 hex>
    std::string algorithm = kSigningAlgorithm;
    std::string public_key_pem;         // SPKI
    std::string private_key_pem;        // PKCS#8
    TimePoint created_at{};
    std::optional<TimePoint> retired_at;
    bool is_active = true;
};

// 管理视图：不含私钥
struct SigningKeyInfo {
    std::string kid;
    std::string algorithm;
    TimePoint created_at{};
    std::optional<TimePoint> retired_at;
    bool is_active = false;
};

inline SigningKeyInfo ToKeyInfo(const SigningKey& key) {
    return SigningKeyInfo{key.kid, key.algorithm, key.created_at, key.retired_at, key.is_active};
}

}
