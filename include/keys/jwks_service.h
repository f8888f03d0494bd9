#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "common/clock.h"
#include "common/result.h"
#include "config/config.h"
#include "keys/key_manager.h"

namespace token_service {

// 单个 EC 公钥的 JWK 表示
struct JsonWebKey {
    std::string kty = "EC";
    std::string crv = "P-256";
    std::string x;      // base64url(32 字节 X 坐标)
    std::string y;      // base64url(32 字节 Y 坐标)
    std::string alg = "ES256";
    std::string use = "sig";
    std::string kid;
};

struct JwksDocument {
    std::vector<JsonWebKey> keys;
    std::string json;               // {"keys":[...]}
    std::string cache_control;      // public, max-age=N, stale-while-revalidate=M
};

/**
 * @brief 发布活跃公钥集合（JWKS）
 *
 * 渲染结果在进程内缓存 jwks_max_age_seconds 秒；
 * KeyManager::Generation() 变化（生成 / 轮换 / 退役）时立即失效。
 */
class JwksService {
public:
    JwksService(std::shared_ptr<KeyManager> key_manager,
                const SecurityConfig& config,
                std::shared_ptr<Clock> clock);

    Result<JwksDocument> GetKeySet();

    std::string CacheControl() const;

private:
    Result<JwksDocument> Render();

    std::shared_ptr<KeyManager> key_manager_;
    SecurityConfig config_;
    std::shared_ptr<Clock> clock_;

    std::mutex mutex_;
    std::shared_ptr<const JwksDocument> cached_;
    uint64_t cached_generation_ = 0;
    TimePoint cached_at_{};
};

}  // namespace token_service
