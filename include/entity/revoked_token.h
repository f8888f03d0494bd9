#pragma once
#include <string>
#include "common/time_utils.h"

namespace token_service{

inline constexpr const char* kDefaultRevocationReason = "manual_revocation";

// ==================== JTI 黑名单条目 ====================
// expires_at 复制自被吊销 Token 自身的 exp：过了这个时间 Token 本来就无法通过校验，
// 条目只剩存储开销，应被清理。
struct RevokedAccessTokenEntry {
    std::string jti;
    std::string user_id;
    std::string app_id;
    std::string reason = kDefaultRevocationReason;
    TimePoint expires_at{};
    TimePoint created_at{};

    bool IsLiveAt(TimePoint now) const { return expires_at > now; }
};

}
