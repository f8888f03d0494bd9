#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/clock.h"
#include "common/crypto_utils.h"
#include "common/result.h"
#include "entity/signing_key.h"
#include "keys/key_store.h"

namespace token_service {

/**
 * @brief 签名密钥生命周期管理
 *
 * @details
 *   ┌────────────────────┬──────────────────────────────────────────────┐
 *   │ 操作               │ 语义                                         │
 *   ├────────────────────┼──────────────────────────────────────────────┤
 *   │ GetSigningKey      │ 当前签名密钥 = 最早的活跃密钥；无则引导生成 │
 *   │ FindPublicKey      │ 任意已存储密钥（含已退役），供验签          │
 *   │ Rotate(graceful)   │ 生成新密钥；非平滑模式同一事务退役全部旧密钥│
 *   │ Retire             │ 不允许退役最后一个活跃密钥（存储层原子判断）│
 *   └────────────────────┴──────────────────────────────────────────────┘
 *
 * 缓存：
 *   - current_      当前签名密钥，任何密钥变更时整体 reset，不原地修改；
 *                   超过 current_key_ttl_ 后重新读取存储，其他实例的轮换/退役在一个 TTL 内生效
 *   - key_cache_    kid → 已解析的 EcKey；密钥材料按 kid 不可变，无需失效
 *   - generation_   每次密钥变更 +1，JwksService 据此判断文档是否过期
 *
 * 引导、轮换、退役共用 bootstrap_mutex_ 串行；跨进程由 KeyStore 的
 * InsertIfNoActive / RetireIfOthersActive / InsertAndRetireActive 保证。
 */
class KeyManager {
public:
    KeyManager(std::shared_ptr<KeyStore> store, std::shared_ptr<Clock> clock,
               std::chrono::seconds current_key_ttl = std::chrono::seconds(60));

    // ==================== 生成 / 激活 ====================

    /// @brief 生成新的 P-256 密钥对与 kid，不落库
    Result<SigningKey> GenerateKeyPair();

    /// @brief 以活跃状态持久化，并使缓存失效
    Result<void> ActivateAndPersist(SigningKey key);

    // ==================== 查询 ====================

    Result<std::shared_ptr<const SigningKey>> GetSigningKey();

    /// @brief 全部活跃密钥（不含私钥），用于发布 JWKS
    Result<std::vector<SigningKey>> ListActivePublicKeys();

    /// @brief 按 kid 查找，已退役的也返回
    Result<SigningKey> FindPublicKey(const std::string& kid);

    /// @brief 全部密钥的管理视图（不含私钥）
    Result<std::vector<SigningKeyInfo>> ListKeys();

    // ==================== 签名 / 验签材料 ====================

    /// @brief 当前签名密钥 + 已解析的私钥
    Result<std::pair<std::shared_ptr<const SigningKey>, std::shared_ptr<const EcKey>>> GetSigner();

    /// @brief kid 对应的已解析公钥；kid 不存在时 KeyNotFound
    Result<std::shared_ptr<const EcKey>> GetVerifier(const std::string& kid);

    // ==================== 退役 / 轮换 ====================

    Result<void> Retire(const std::string& kid);

    Result<SigningKey> Rotate(bool graceful_keep_old);

    uint64_t Generation() const { return generation_.load(); }

private:
    void InvalidateCache();
    Result<std::shared_ptr<const EcKey>> LoadEcKey(const SigningKey& key);

    std::shared_ptr<KeyStore> store_;
    std::shared_ptr<Clock> clock_;
    std::chrono::seconds current_key_ttl_;

    std::mutex bootstrap_mutex_;

    mutable std::mutex current_mutex_;
    std::shared_ptr<const SigningKey> current_;
    TimePoint current_loaded_at_{};

    std::shared_mutex key_cache_mutex_;
    std::unordered_map<std::string, std::shared_ptr<const EcKey>> key_cache_;

    std::atomic<uint64_t> generation_{0};
};

}  // namespace token_service
