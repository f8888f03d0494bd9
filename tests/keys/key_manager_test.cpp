// tests/keys/key_manager_test.cpp
#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <atomic>
#include <set>
#include <thread>
#include <vector>

#include "keys/key_manager.h"
#include "keys/key_store.h"
#include "common/validator.h"

namespace token_service {
namespace test {

using ::testing::_;
using ::testing::Return;

bool KidWellFormed(const std::string& kid) {
    std::string error;
    return IsValidKid(kid, error);
}

// 存储不可用时的行为
class MockKeyStore : public KeyStore {
public:
    MOCK_METHOD(Result<void>, Insert, (const SigningKey& key), (override));
    MOCK_METHOD(Result<SigningKey>, FindByKid, (const std::string& kid), (override));
    MOCK_METHOD(Result<std::vector<SigningKey>>, ListActive, (), (override));
    MOCK_METHOD(Result<std::vector<SigningKey>>, ListAll, (), (override));
    MOCK_METHOD(Result<void>, RetireIfOthersActive, (const std::string& kid, TimePoint at), (override));
    MOCK_METHOD(Result<int64_t>, CountActive, (), (override));
    MOCK_METHOD(Result<SigningKey>, InsertIfNoActive, (const SigningKey& candidate), (override));
    MOCK_METHOD(Result<int64_t>, InsertAndRetireActive, (const SigningKey& key, TimePoint at), (override));
};

class KeyManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>();
        store_ = std::make_shared<InMemoryKeyStore>();
        manager_ = std::make_shared<KeyManager>(store_, clock_);
    }

    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<InMemoryKeyStore> store_;
    std::shared_ptr<KeyManager> manager_;
};

// ============================================================================
// 引导
// ============================================================================

TEST_F(KeyManagerTest, BootstrapsOnFirstUse) {
    auto current = manager_->GetSigningKey();

    ASSERT_TRUE(current.IsOk()) << current.message;
    EXPECT_TRUE(KidWellFormed(current.Value()->kid));
    EXPECT_EQ(current.Value()->algorithm, "ES256");
    EXPECT_FALSE(current.Value()->private_key_pem.empty());
    EXPECT_EQ(store_->InsertCount(), 1u);
    EXPECT_EQ(store_->CountActive().Value(), 1);
}

TEST_F(KeyManagerTest, SigningKeyIsStableAcrossCalls) {
    auto first = manager_->GetSigningKey();
    auto second = manager_->GetSigningKey();

    ASSERT_TRUE(first.IsOk());
    ASSERT_TRUE(second.IsOk());
    EXPECT_EQ(first.Value()->kid, second.Value()->kid);
    EXPECT_EQ(store_->InsertCount(), 1u);
}

TEST_F(KeyManagerTest, ConcurrentBootstrapCreatesExactlyOneKey) {
    const int num_threads = 16;
    std::vector<std::thread> threads;
    std::vector<std::string> kids(num_threads);
    std::atomic<int> failures{0};

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&, i]() {
            auto current = manager_->GetSigningKey();
            if (current.IsErr()) {
                failures++;
                return;
            }
            kids[i] = current.Value()->kid;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(failures.load(), 0);
    std::set<std::string> distinct(kids.begin(), kids.end());
    EXPECT_EQ(distinct.size(), 1u);
    EXPECT_EQ(store_->InsertCount(), 1u);
}

// 两个进程共享存储：后到者采用已存在的密钥
TEST_F(KeyManagerTest, SecondManagerAdoptsExistingKey) {
    auto other = std::make_shared<KeyManager>(store_, clock_);

    auto a = manager_->GetSigningKey();
    auto b = other->GetSigningKey();

    ASSERT_TRUE(a.IsOk());
    ASSERT_TRUE(b.IsOk());
    EXPECT_EQ(a.Value()->kid, b.Value()->kid);
    EXPECT_EQ(store_->InsertCount(), 1u);
}

// 另一实例轮换后，本实例在缓存过期后切换到新密钥
TEST_F(KeyManagerTest, SecondManagerFollowsRotationAfterCacheTtl) {
    auto other = std::make_shared<KeyManager>(store_, clock_, std::chrono::seconds(60));
    auto before = other->GetSigningKey();
    ASSERT_TRUE(before.IsOk());

    clock_->Advance(std::chrono::seconds(10));
    auto rotated = manager_->Rotate(false);
    ASSERT_TRUE(rotated.IsOk());

    // TTL 内仍使用缓存
    auto cached = other->GetSigningKey();
    ASSERT_TRUE(cached.IsOk());
    EXPECT_EQ(cached.Value()->kid, before.Value()->kid);
    uint64_t generation = other->Generation();

    clock_->Advance(std::chrono::hours(24 * 30));
    auto after = other->GetSigningKey();
    ASSERT_TRUE(after.IsOk());
    EXPECT_EQ(after.Value()->kid, rotated.Value().kid);
    EXPECT_GT(other->Generation(), generation);

    auto signer = other->GetSigner();
    ASSERT_TRUE(signer.IsOk());
    EXPECT_EQ(signer.Value().first->kid, rotated.Value().kid);
}

TEST_F(KeyManagerTest, CacheRefreshKeepsGenerationWhenKeyUnchanged) {
    ASSERT_TRUE(manager_->GetSigningKey().IsOk());
    uint64_t generation = manager_->Generation();
    size_t inserts = store_->InsertCount();

    clock_->Advance(std::chrono::minutes(5));
    ASSERT_TRUE(manager_->GetSigningKey().IsOk());

    EXPECT_EQ(manager_->Generation(), generation);
    EXPECT_EQ(store_->InsertCount(), inserts);
}

TEST_F(KeyManagerTest, CacheRefreshPropagatesStoreFailure) {
    auto mock_store = std::make_shared<MockKeyStore>();
    SigningKey existing;
    {
        auto generated = manager_->GenerateKeyPair();
        ASSERT_TRUE(generated.IsOk());
        existing = generated.Value();
    }
    EXPECT_CALL(*mock_store, ListActive())
        .WillOnce(Return(Result<std::vector<SigningKey>>::Ok(std::vector<SigningKey>{existing})))
        .WillOnce(Return(Result<std::vector<SigningKey>>::Fail(ErrorCode::ServiceUnavailable)));

    KeyManager manager(mock_store, clock_, std::chrono::seconds(30));
    ASSERT_TRUE(manager.GetSigningKey().IsOk());

    clock_->Advance(std::chrono::seconds(30));
    EXPECT_EQ(manager.GetSigningKey().code, ErrorCode::ServiceUnavailable);
}

TEST_F(KeyManagerTest, StoreUnavailableFailsBootstrap) {
    auto mock_store = std::make_shared<MockKeyStore>();
    EXPECT_CALL(*mock_store, ListActive())
        .WillOnce(Return(Result<std::vector<SigningKey>>::Fail(ErrorCode::ServiceUnavailable)));

    KeyManager manager(mock_store, clock_);
    auto current = manager.GetSigningKey();

    EXPECT_TRUE(current.IsErr());
    EXPECT_EQ(current.code, ErrorCode::ServiceUnavailable);
}

TEST_F(KeyManagerTest, ConstructorRejectsNull) {
    EXPECT_THROW(KeyManager(nullptr, clock_), std::invalid_argument);
    EXPECT_THROW(KeyManager(store_, nullptr), std::invalid_argument);
    EXPECT_THROW(KeyManager(store_, clock_, std::chrono::seconds(0)), std::invalid_argument);
}

// ============================================================================
// 生成 / 激活
// ============================================================================

TEST_F(KeyManagerTest, GenerateKeyPairDoesNotPersist) {
    auto generated = manager_->GenerateKeyPair();

    ASSERT_TRUE(generated.IsOk());
    EXPECT_TRUE(KidWellFormed(generated.Value().kid));
    EXPECT_EQ(store_->InsertCount(), 0u);
    EXPECT_EQ(store_->FindByKid(generated.Value().kid).code, ErrorCode::KeyNotFound);
}

TEST_F(KeyManagerTest, GeneratedKidsAreUnique) {
    std::set<std::string> kids;
    for (int i = 0; i < 20; ++i) {
        auto generated = manager_->GenerateKeyPair();
        ASSERT_TRUE(generated.IsOk());
        kids.insert(generated.Value().kid);
    }
    EXPECT_EQ(kids.size(), 20u);
}

TEST_F(KeyManagerTest, ActivateAndPersistPublishesKey) {
    auto original = manager_->GetSigningKey();
    ASSERT_TRUE(original.IsOk());
    uint64_t generation = manager_->Generation();

    clock_->Advance(std::chrono::seconds(60));
    auto generated = manager_->GenerateKeyPair();
    ASSERT_TRUE(generated.IsOk());
    ASSERT_TRUE(manager_->ActivateAndPersist(generated.Value()).IsOk());

    EXPECT_GT(manager_->Generation(), generation);
    auto active = manager_->ListActivePublicKeys();
    ASSERT_TRUE(active.IsOk());
    ASSERT_EQ(active.Value().size(), 2u);
    for (const auto& key : active.Value()) {
        EXPECT_TRUE(key.private_key_pem.empty());
    }

    // 当前签名密钥仍为最早的活跃密钥
    auto current = manager_->GetSigningKey();
    ASSERT_TRUE(current.IsOk());
    EXPECT_EQ(current.Value()->kid, original.Value()->kid);
}

// ============================================================================
// 退役
// ============================================================================

TEST_F(KeyManagerTest, RetireUnknownKidFails) {
    ASSERT_TRUE(manager_->GetSigningKey().IsOk());

    auto result = manager_->Retire("key_00000000000000000000000000000000");
    EXPECT_EQ(result.code, ErrorCode::KeyNotFound);
}

TEST_F(KeyManagerTest, RetireLastActiveKeyRefused) {
    auto current = manager_->GetSigningKey();
    ASSERT_TRUE(current.IsOk());

    auto result = manager_->Retire(current.Value()->kid);
    EXPECT_EQ(result.code, ErrorCode::LastActiveKey);
    EXPECT_EQ(store_->CountActive().Value(), 1);
}

TEST_F(KeyManagerTest, RetireSwitchesSigningKeyAndKeepsPublicKey) {
    auto original = manager_->GetSigningKey();
    ASSERT_TRUE(original.IsOk());
    std::string old_kid = original.Value()->kid;

    clock_->Advance(std::chrono::seconds(60));
    auto rotated = manager_->Rotate(true);
    ASSERT_TRUE(rotated.IsOk());

    ASSERT_TRUE(manager_->Retire(old_kid).IsOk());

    auto current = manager_->GetSigningKey();
    ASSERT_TRUE(current.IsOk());
    EXPECT_EQ(current.Value()->kid, rotated.Value().kid);

    // 退役密钥仍可用于验签
    auto found = manager_->FindPublicKey(old_kid);
    ASSERT_TRUE(found.IsOk());
    EXPECT_FALSE(found.Value().is_active);
    ASSERT_TRUE(found.Value().retired_at.has_value());
    EXPECT_EQ(*found.Value().retired_at, clock_->Now());
    EXPECT_TRUE(manager_->GetVerifier(old_kid).IsOk());
}

TEST_F(KeyManagerTest, RetireAlreadyRetiredIsNoop) {
    auto original = manager_->GetSigningKey();
    ASSERT_TRUE(original.IsOk());
    std::string old_kid = original.Value()->kid;
    clock_->Advance(std::chrono::seconds(10));
    ASSERT_TRUE(manager_->Rotate(false).IsOk());
    TimePoint retired_at = *manager_->FindPublicKey(old_kid).Value().retired_at;

    clock_->Advance(std::chrono::seconds(10));
    EXPECT_TRUE(manager_->Retire(old_kid).IsOk());
    EXPECT_EQ(*manager_->FindPublicKey(old_kid).Value().retired_at, retired_at);
}

// 两个实例同时退役各自的旧密钥：只有一个成功，活跃密钥不会归零
TEST_F(KeyManagerTest, ConcurrentRetireKeepsOneActiveKey) {
    auto original = manager_->GetSigningKey();
    ASSERT_TRUE(original.IsOk());
    clock_->Advance(std::chrono::seconds(10));
    auto rotated = manager_->Rotate(true);
    ASSERT_TRUE(rotated.IsOk());

    auto other = std::make_shared<KeyManager>(store_, clock_);
    std::vector<Result<void>> results(2, Result<void>::Ok());
    std::thread a([&] { results[0] = manager_->Retire(original.Value()->kid); });
    std::thread b([&] { results[1] = other->Retire(rotated.Value().kid); });
    a.join();
    b.join();

    int succeeded = 0;
    for (const auto& result : results) {
        if (result.IsOk()) {
            ++succeeded;
        } else {
            EXPECT_EQ(result.code, ErrorCode::LastActiveKey);
        }
    }
    EXPECT_EQ(succeeded, 1);
    EXPECT_EQ(store_->CountActive().Value(), 1);
}

TEST_F(KeyManagerTest, RetireStoreFailurePropagates) {
    auto mock_store = std::make_shared<MockKeyStore>();
    EXPECT_CALL(*mock_store, RetireIfOthersActive("key_00000000000000000000000000000000", _))
        .WillOnce(Return(Result<void>::Fail(ErrorCode::ServiceUnavailable)));

    KeyManager manager(mock_store, clock_);
    EXPECT_EQ(manager.Retire("key_00000000000000000000000000000000").code, ErrorCode::ServiceUnavailable);
}

// ============================================================================
// 轮换
// ============================================================================

TEST_F(KeyManagerTest, HardRotationRetiresAllPrevious) {
    auto original = manager_->GetSigningKey();
    ASSERT_TRUE(original.IsOk());
    clock_->Advance(std::chrono::seconds(5));
    ASSERT_TRUE(manager_->Rotate(true).IsOk());

    clock_->Advance(std::chrono::seconds(60));
    auto rotated = manager_->Rotate(false);
    ASSERT_TRUE(rotated.IsOk());
    EXPECT_TRUE(rotated.Value().private_key_pem.empty());

    auto active = manager_->ListActivePublicKeys();
    ASSERT_TRUE(active.IsOk());
    ASSERT_EQ(active.Value().size(), 1u);
    EXPECT_EQ(active.Value()[0].kid, rotated.Value().kid);
    auto old = manager_->FindPublicKey(original.Value()->kid);
    ASSERT_TRUE(old.IsOk());
    ASSERT_TRUE(old.Value().retired_at.has_value());
    EXPECT_EQ(*old.Value().retired_at, clock_->Now());

    auto current = manager_->GetSigningKey();
    ASSERT_TRUE(current.IsOk());
    EXPECT_EQ(current.Value()->kid, rotated.Value().kid);
}

TEST_F(KeyManagerTest, GracefulRotationKeepsPrevious) {
    auto original = manager_->GetSigningKey();
    ASSERT_TRUE(original.IsOk());

    clock_->Advance(std::chrono::seconds(60));
    auto rotated = manager_->Rotate(true);
    ASSERT_TRUE(rotated.IsOk());

    auto active = manager_->ListActivePublicKeys();
    ASSERT_TRUE(active.IsOk());
    EXPECT_EQ(active.Value().size(), 2u);

    auto keys = manager_->ListKeys();
    ASSERT_TRUE(keys.IsOk());
    ASSERT_EQ(keys.Value().size(), 2u);
    EXPECT_EQ(keys.Value()[0].kid, original.Value()->kid);
    EXPECT_EQ(keys.Value()[1].kid, rotated.Value().kid);
}

TEST_F(KeyManagerTest, RotationBumpsGeneration) {
    ASSERT_TRUE(manager_->GetSigningKey().IsOk());
    uint64_t before = manager_->Generation();

    ASSERT_TRUE(manager_->Rotate(true).IsOk());
    EXPECT_GT(manager_->Generation(), before);
}

TEST_F(KeyManagerTest, RotationInsertFailurePropagates) {
    auto mock_store = std::make_shared<MockKeyStore>();
    EXPECT_CALL(*mock_store, InsertAndRetireActive(_, _))
        .WillOnce(Return(Result<int64_t>::Fail(ErrorCode::ServiceUnavailable)));
    EXPECT_CALL(*mock_store, Insert(_)).Times(0);

    KeyManager manager(mock_store, clock_);
    auto rotated = manager.Rotate(false);
    EXPECT_EQ(rotated.code, ErrorCode::ServiceUnavailable);
}

TEST_F(KeyManagerTest, GracefulRotationUsesPlainInsert) {
    auto mock_store = std::make_shared<MockKeyStore>();
    EXPECT_CALL(*mock_store, Insert(_)).WillOnce(Return(Result<void>::Ok()));
    EXPECT_CALL(*mock_store, InsertAndRetireActive(_, _)).Times(0);

    KeyManager manager(mock_store, clock_);
    EXPECT_TRUE(manager.Rotate(true).IsOk());
}

// ============================================================================
// 签名 / 验签材料
// ============================================================================

TEST_F(KeyManagerTest, SignerAndVerifierAgree) {
    auto signer = manager_->GetSigner();
    ASSERT_TRUE(signer.IsOk());
    EXPECT_TRUE(signer.Value().second->HasPrivate());

    auto signature = signer.Value().second->Sign("header.payload");
    ASSERT_TRUE(signature.IsOk());

    auto verifier = manager_->GetVerifier(signer.Value().first->kid);
    ASSERT_TRUE(verifier.IsOk());
    EXPECT_TRUE(verifier.Value()->Verify("header.payload", signature.Value()));
    EXPECT_FALSE(verifier.Value()->Verify("header.tampered", signature.Value()));
}

TEST_F(KeyManagerTest, VerifierForUnknownKidFails) {
    auto verifier = manager_->GetVerifier("key_ffffffffffffffffffffffffffffffff");
    EXPECT_EQ(verifier.code, ErrorCode::KeyNotFound);
}

// 另一个实例写入的密钥：本实例首次按 kid 加载
TEST_F(KeyManagerTest, VerifierLoadsKeyPersistedElsewhere) {
    auto other = std::make_shared<KeyManager>(store_, clock_);
    auto signer = other->GetSigner();
    ASSERT_TRUE(signer.IsOk());
    auto signature = signer.Value().second->Sign("data");
    ASSERT_TRUE(signature.IsOk());

    auto verifier = manager_->GetVerifier(signer.Value().first->kid);
    ASSERT_TRUE(verifier.IsOk());
    EXPECT_TRUE(verifier.Value()->Verify("data", signature.Value()));
}

}  // namespace test
}  // namespace token_service
