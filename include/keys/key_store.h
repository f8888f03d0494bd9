#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "common/result.h"
#include "entity/signing_key.h"

namespace token_service {

/**
 * @brief 签名密钥持久化接口
 *
 * ListActive 的顺序（created_at 升序，相同则 kid 升序）决定了"当前签名密钥"：
 * 最早创建的活跃密钥。所有实现必须保持这一顺序。
 */
class KeyStore {
public:
    virtual ~KeyStore() = default;

    virtual Result<void> Insert(const SigningKey& key) = 0;

    /// @return 不存在时 KeyNotFound
    virtual Result<SigningKey> FindByKid(const std::string& kid) = 0;

    virtual Result<std::vector<SigningKey>> ListActive() = 0;

    virtual Result<std::vector<SigningKey>> ListAll() = 0;

    /**
     * @brief 退役 kid（is_active=false, retired_at=at），但保证至少留下一个活跃密钥
     *
     * 计数与更新在同一临界区内完成，并发退役不同密钥时不会出现零活跃密钥。
     * 已退役的密钥保持原 retired_at，直接返回成功。
     *
     * @return 不存在时 KeyNotFound；kid 是唯一活跃密钥时 LastActiveKey
     */
    virtual Result<void> RetireIfOthersActive(const std::string& kid, TimePoint at) = 0;

    virtual Result<int64_t> CountActive() = 0;

    /**
     * @brief 启动引导原语：仅当没有任何活跃密钥时插入 candidate
     * @return 权威的当前签名密钥（刚插入的 candidate，或已存在的最早活跃密钥）
     *
     * 多进程共享同一存储时，由存储层保证串行（MySQL 实现使用行锁）。
     */
    virtual Result<SigningKey> InsertIfNoActive(const SigningKey& candidate) = 0;

    /**
     * @brief 非平滑轮换原语：插入 key，并在同一事务内退役其余全部活跃密钥
     * @return 被退役的密钥数量
     */
    virtual Result<int64_t> InsertAndRetireActive(const SigningKey& key, TimePoint at) = 0;
};

// ==================== 内存实现（单进程 / 测试） ====================
class InMemoryKeyStore : public KeyStore {
public:
    Result<void> Insert(const SigningKey& key) override;
    Result<SigningKey> FindByKid(const std::string& kid) override;
    Result<std::vector<SigningKey>> ListActive() override;
    Result<std::vector<SigningKey>> ListAll() override;
    Result<void> RetireIfOthersActive(const std::string& kid, TimePoint at) override;
    Result<int64_t> CountActive() override;
    Result<SigningKey> InsertIfNoActive(const SigningKey& candidate) override;
    Result<int64_t> InsertAndRetireActive(const SigningKey& key, TimePoint at) override;

    // 测试观测：累计插入次数
    size_t InsertCount() const;

private:
    std::vector<SigningKey> ActiveSortedLocked() const;

    mutable std::mutex mutex_;
    std::map<std::string, SigningKey> keys_;
    size_t insert_count_ = 0;
};

}  // namespace token_service
