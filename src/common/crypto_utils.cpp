#include "common/crypto_utils.h"

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/buffer.h>
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <stdexcept>
#include <vector>

namespace token_service {

namespace {

constexpr size_t kCoordinateSize = 32;          // P-256 坐标 / r / s 长度
constexpr size_t kRawSignatureSize = 2 * kCoordinateSize;

// 取出并清空 OpenSSL 错误队列，用于日志 / 错误消息
std::string LastOpenSSLError() {
    unsigned long err = ERR_get_error();
    ERR_clear_error();
    if (err == 0) {
        return "unknown openssl error";
    }
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

struct BioDeleter {
    void operator()(BIO* b) const { BIO_free(b); }
};
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* c) const { EVP_MD_CTX_free(c); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

struct EcdsaSigDeleter {
    void operator()(ECDSA_SIG* s) const { ECDSA_SIG_free(s); }
};
using EcdsaSigPtr = std::unique_ptr<ECDSA_SIG, EcdsaSigDeleter>;

struct BnDeleter {
    void operator()(BIGNUM* b) const { BN_free(b); }
};
using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;

std::string BioToString(BIO* bio) {
    BUF_MEM* mem = nullptr;
    BIO_get_mem_ptr(bio, &mem);
    if (!mem || !mem->data) {
        return {};
    }
    return std::string(mem->data, mem->length);
}

}  // namespace

// ============================================================================
// Base64URL 编解码
// ============================================================================

std::string Base64UrlEncode(std::string_view input) {
    static const char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    std::string encoded;
    encoded.reserve(((input.size() + 2) / 3) * 4);

    unsigned int val = 0;
    int valb = -6;
    for (unsigned char c : input) {
        val = (val << 8) + c;
        valb += 8;
        while (valb >= 0) {
            encoded.push_back(table[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) {
        encoded.push_back(table[((val << 8) >> (valb + 8)) & 0x3F]);
    }
    return encoded;
}

std::optional<std::string> Base64UrlDecode(std::string_view input) {
    // 只有 4n+1 的长度不可能由合法编码产生
    if (input.size() % 4 == 1) {
        return std::nullopt;
    }

    std::string decoded;
    decoded.reserve(input.size() * 3 / 4);

    unsigned int val = 0;
    int valb = -8;
    for (unsigned char c : input) {
        int d;
        if (c >= 'A' && c <= 'Z')      d = c - 'A';
        else if (c >= 'a' && c <= 'z') d = c - 'a' + 26;
        else if (c >= '0' && c <= '9') d = c - '0' + 52;
        else if (c == '-')             d = 62;
        else if (c == '_')             d = 63;
        else return std::nullopt;

        val = (val << 6) + static_cast<unsigned int>(d);
        valb += 6;
        if (valb >= 0) {
            decoded.push_back(static_cast<char>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    return decoded;
}

// ============================================================================
// 哈希 / 随机数
// ============================================================================

std::string Sha256Hex(std::string_view input) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), hash);

    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(SHA256_DIGEST_LENGTH * 2);
    for (unsigned char b : hash) {
        out.push_back(hex[b >> 4]);
        out.push_back(hex[b & 0x0F]);
    }
    return out;
}

std::string RandomHex(size_t num_bytes) {
    std::vector<unsigned char> bytes(num_bytes);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed: " + LastOpenSSLError());
    }

    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(num_bytes * 2);
    for (unsigned char b : bytes) {
        out.push_back(hex[b >> 4]);
        out.push_back(hex[b & 0x0F]);
    }
    return out;
}

bool ConstantTimeEquals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

// ============================================================================
// EcKey：创建 / 加载
// ============================================================================

bool EcKey::IsP256(EVP_PKEY* pkey) {
    if (!pkey || !EVP_PKEY_is_a(pkey, "EC")) {
        return false;
    }
    char group[64] = {0};
    size_t len = 0;
    if (!EVP_PKEY_get_utf8_string_param(pkey, OSSL_PKEY_PARAM_GROUP_NAME,
                                        group, sizeof(group), &len)) {
        ERR_clear_error();
        return false;
    }
    std::string_view name(group, len);
    return name == "prime256v1" || name == "P-256";
}

Result<std::shared_ptr<EcKey>> EcKey::Generate() {
    EVP_PKEY* raw = EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", "P-256");
    if (!raw) {
        return Result<std::shared_ptr<EcKey>>::Fail(
            ErrorCode::KeyGenerationFailed, "EC keygen failed: " + LastOpenSSLError());
    }
    return Result<std::shared_ptr<EcKey>>::Ok(
        std::shared_ptr<EcKey>(new EcKey(PkeyPtr(raw), true)));
}

Result<std::shared_ptr<EcKey>> EcKey::FromPrivatePem(const std::string& pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return Result<std::shared_ptr<EcKey>>::Fail(ErrorCode::Internal, "BIO_new_mem_buf failed");
    }
    PkeyPtr pkey(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!pkey) {
        return Result<std::shared_ptr<EcKey>>::Fail(
            ErrorCode::Internal, "invalid private key pem: " + LastOpenSSLError());
    }
    if (!IsP256(pkey.get())) {
        return Result<std::shared_ptr<EcKey>>::Fail(ErrorCode::Internal, "private key is not P-256");
    }
    return Result<std::shared_ptr<EcKey>>::Ok(
        std::shared_ptr<EcKey>(new EcKey(std::move(pkey), true)));
}

Result<std::shared_ptr<EcKey>> EcKey::FromPublicPem(const std::string& pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return Result<std::shared_ptr<EcKey>>::Fail(ErrorCode::Internal, "BIO_new_mem_buf failed");
    }
    PkeyPtr pkey(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    if (!pkey) {
        return Result<std::shared_ptr<EcKey>>::Fail(
            ErrorCode::Internal, "invalid public key pem: " + LastOpenSSLError());
    }
    if (!IsP256(pkey.get())) {
        return Result<std::shared_ptr<EcKey>>::Fail(ErrorCode::Internal, "public key is not P-256");
    }
    return Result<std::shared_ptr<EcKey>>::Ok(
        std::shared_ptr<EcKey>(new EcKey(std::move(pkey), false)));
}

// ============================================================================
// EcKey：导出
// ============================================================================

Result<std::string> EcKey::PublicPem() const {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), pkey_.get()) != 1) {
        return Result<std::string>::Fail(ErrorCode::Internal,
                                         "export public key failed: " + LastOpenSSLError());
    }
    return Result<std::string>::Ok(BioToString(bio.get()));
}

Result<std::string> EcKey::PrivatePem() const {
    if (!has_private_) {
        return Result<std::string>::Fail(ErrorCode::Internal, "key has no private half");
    }
    BioPtr bio(BIO_new(BIO_s_mem()));
    // PEM_write_bio_PrivateKey 输出 PKCS#8（BEGIN PRIVATE KEY）
    if (!bio || PEM_write_bio_PrivateKey(bio.get(), pkey_.get(),
                                         nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        return Result<std::string>::Fail(ErrorCode::Internal,
                                         "export private key failed: " + LastOpenSSLError());
    }
    return Result<std::string>::Ok(BioToString(bio.get()));
}

Result<EcPublicCoordinates> EcKey::PublicCoordinates() const {
    BIGNUM* x_raw = nullptr;
    BIGNUM* y_raw = nullptr;
    if (!EVP_PKEY_get_bn_param(pkey_.get(), OSSL_PKEY_PARAM_EC_PUB_X, &x_raw)) {
        return Result<EcPublicCoordinates>::Fail(ErrorCode::Internal,
                                                 "read EC x failed: " + LastOpenSSLError());
    }
    BnPtr x(x_raw);
    if (!EVP_PKEY_get_bn_param(pkey_.get(), OSSL_PKEY_PARAM_EC_PUB_Y, &y_raw)) {
        return Result<EcPublicCoordinates>::Fail(ErrorCode::Internal,
                                                 "read EC y failed: " + LastOpenSSLError());
    }
    BnPtr y(y_raw);

    unsigned char xb[kCoordinateSize];
    unsigned char yb[kCoordinateSize];
    if (BN_bn2binpad(x.get(), xb, kCoordinateSize) < 0 ||
        BN_bn2binpad(y.get(), yb, kCoordinateSize) < 0) {
        return Result<EcPublicCoordinates>::Fail(ErrorCode::Internal, "EC coordinate too large");
    }

    EcPublicCoordinates coords;
    coords.x.assign(reinterpret_cast<const char*>(xb), kCoordinateSize);
    coords.y.assign(reinterpret_cast<const char*>(yb), kCoordinateSize);
    return Result<EcPublicCoordinates>::Ok(std::move(coords));
}

// ============================================================================
// EcKey：签名 / 验签
// ============================================================================

Result<std::string> EcKey::Sign(std::string_view data) const {
    if (!has_private_) {
        return Result<std::string>::Fail(ErrorCode::Internal, "key has no private half");
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey_.get()) != 1) {
        return Result<std::string>::Fail(ErrorCode::Internal, "sign init failed: " + LastOpenSSLError());
    }

    const auto* in = reinterpret_cast<const unsigned char*>(data.data());
    size_t der_len = 0;
    if (EVP_DigestSign(ctx.get(), nullptr, &der_len, in, data.size()) != 1) {
        return Result<std::string>::Fail(ErrorCode::Internal, "sign failed: " + LastOpenSSLError());
    }
    std::vector<unsigned char> der(der_len);
    if (EVP_DigestSign(ctx.get(), der.data(), &der_len, in, data.size()) != 1) {
        return Result<std::string>::Fail(ErrorCode::Internal, "sign failed: " + LastOpenSSLError());
    }

    // DER → r||s
    const unsigned char* p = der.data();
    EcdsaSigPtr sig(d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(der_len)));
    if (!sig) {
        return Result<std::string>::Fail(ErrorCode::Internal, "decode DER signature failed");
    }
    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);

    unsigned char raw[kRawSignatureSize];
    if (BN_bn2binpad(r, raw, kCoordinateSize) < 0 ||
        BN_bn2binpad(s, raw + kCoordinateSize, kCoordinateSize) < 0) {
        return Result<std::string>::Fail(ErrorCode::Internal, "signature component too large");
    }
    return Result<std::string>::Ok(std::string(reinterpret_cast<const char*>(raw), kRawSignatureSize));
}

bool EcKey::Verify(std::string_view data, std::string_view raw_signature) const {
    if (raw_signature.size() != kRawSignatureSize) {
        return false;
    }

    // r||s → DER
    const auto* raw = reinterpret_cast<const unsigned char*>(raw_signature.data());
    BnPtr r(BN_bin2bn(raw, kCoordinateSize, nullptr));
    BnPtr s(BN_bin2bn(raw + kCoordinateSize, kCoordinateSize, nullptr));
    EcdsaSigPtr sig(ECDSA_SIG_new());
    if (!r || !s || !sig) {
        ERR_clear_error();
        return false;
    }
    if (ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1) {
        ERR_clear_error();
        return false;
    }
    // 所有权已转移给 sig
    r.release();
    s.release();

    int der_len = i2d_ECDSA_SIG(sig.get(), nullptr);
    if (der_len <= 0) {
        ERR_clear_error();
        return false;
    }
    std::vector<unsigned char> der(static_cast<size_t>(der_len));
    unsigned char* p = der.data();
    i2d_ECDSA_SIG(sig.get(), &p);

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey_.get()) != 1) {
        ERR_clear_error();
        return false;
    }
    int rc = EVP_DigestVerify(ctx.get(), der.data(), der.size(),
                              reinterpret_cast<const unsigned char*>(data.data()), data.size());
    if (rc != 1) {
        ERR_clear_error();
        return false;
    }
    return true;
}

}  // namespace token_service
