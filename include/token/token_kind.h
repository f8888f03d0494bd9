#pragma once

#include <string>
#include <variant>
#include "common/token_type.h"

namespace token_service {

// ==================== Token 结构分类 ====================
// 只做结构判断，不验签、不查库：
//   rt_ 前缀               → RefreshTokenRef
//   三段非空、以 '.' 分隔   → AccessTokenRef
//   其余                   → UnknownToken

struct AccessTokenRef {
    std::string raw;
};

struct RefreshTokenRef {
    std::string raw;
};

struct UnknownToken {};

using TokenKind = std::variant<AccessTokenRef, RefreshTokenRef, UnknownToken>;

TokenKind ClassifyToken(const std::string& raw);

TokenKindTag TagOf(const TokenKind& kind);

}  // namespace token_service
