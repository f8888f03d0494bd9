#pragma once
#include <string>
#include <cstdint>

namespace token_service{

inline constexpr const char* kDefaultRole = "user";

// 本服务只读取用户的以下字段；用户 CRUD 由外部系统负责
struct UserEntity {
    std::string id;
    std::string email;
    std::string role = kDefaultRole;
    int64_t token_version = 0;      // 单调递增，全局登出 / 改密时 +1
    std::string app_id;             // 所属应用 / 租户
    std::string password_hash;      // $sha256$<salt>$<hex>，仅 PasswordVerifier 使用
};

}
