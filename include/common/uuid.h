#pragma once

#include <uuid/uuid.h>
#include <string>

namespace token_service{

/**
 * UUID 工具类
 *
 * 使用场景：
 * - RefreshTokenRecord.id → RefreshRecordId()
 * - 用户 ID（测试 / 内存存储）→ UserId()
 *
 * kid / jti / refresh secret 需要可控长度的随机串，见 crypto_utils.h 的 RandomHex。
 */
class UUIDHelper {
public:
    /// 标准格式 UUID: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
    static std::string Generate() {
        uuid_t uuid;
        char str[37];
        uuid_generate_random(uuid);
        uuid_unparse_lower(uuid, str);
        return std::string(str);
    }

    /// Refresh Token 记录主键（非 secret，可安全写日志）
    static std::string RefreshRecordId() {
        return Generate();
    }

    /// 用户 ID，格式: usr_<uuid>
    static std::string UserId() {
        return "usr_" + Generate();
    }

    /// 校验是否为标准 UUID 格式
    static bool IsValid(const std::string& str) {
        if (str.size() != 36) return false;
        uuid_t uuid;
        return uuid_parse(str.c_str(), uuid) == 0;
    }
};

}  // namespace token_service
