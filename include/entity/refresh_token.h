#pragma once
#include <string>
#include <optional>
#include "common/time_utils.h"

namespace token_service{

// ==================== Refresh Token 记录 ====================
// 只保存 secret 的 SHA-256，原文只在 login / refresh 响应中出现一次。
// 轮换链：旧记录 revoked_at 置位，replaced_by_id 指向后继。
struct RefreshTokenRecord {
    std::string id;
    std::string user_id;
    std::string token_hash;
    std::string app_id;                     // 签发时的 audience
    TimePoint created_at{};
    TimePoint expires_at{};
    std::optional<TimePoint> revoked_at;
    std::optional<std::string> replaced_by_id;

    bool IsRevoked() const { return revoked_at.has_value(); }

    // 可用：未吊销且未过期
    bool IsUsableAt(TimePoint now) const {
        return !IsRevoked() && expires_at > now;
    }
};

}
