#include "token/token_kind.h"
#include "common/utils.h"

namespace token_service {

TokenKind ClassifyToken(const std::string& raw) {
    if (StartsWith(raw, kRefreshTokenPrefix)) {
        return RefreshTokenRef{raw};
    }

    auto parts = SplitView(raw, '.');
    if (parts.size() == 3 && !parts[0].empty() && !parts[1].empty() && !parts[2].empty()) {
        return AccessTokenRef{raw};
    }
    return UnknownToken{};
}

TokenKindTag TagOf(const TokenKind& kind) {
    if (std::holds_alternative<AccessTokenRef>(kind)) return TokenKindTag::Access;
    if (std::holds_alternative<RefreshTokenRef>(kind)) return TokenKindTag::Refresh;
    return TokenKindTag::Unknown;
}

}  // namespace token_service
