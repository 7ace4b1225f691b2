#include "security/receipt_cipher.hpp"
#include "core/base64.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <format>
#include <vector>

namespace redactguard {

namespace {

// AES-256-GCM constants
constexpr int kIvLen = 12;
constexpr int kTagLen = 16;
constexpr size_t kKeyLen = 32;
constexpr std::string_view kPrefix = "ENC:v1:";

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

} // anonymous namespace

ReceiptCipher::ReceiptCipher(std::shared_ptr<IKeyManager> key_manager)
    : key_manager_(std::move(key_manager)) {}

bool ReceiptCipher::available() const {
    if (!key_manager_) return false;
    const auto key = key_manager_->get_active_key();
    return key && key->key_bytes.size() == kKeyLen;
}

Result<std::string> ReceiptCipher::encrypt(std::string_view plaintext) const {
    if (!key_manager_) {
        return Result<std::string>::error(ErrorCategory::ENCRYPTION_UNAVAILABLE,
            "No key manager configured");
    }
    const auto key_info = key_manager_->get_active_key();
    if (!key_info || key_info->key_bytes.size() != kKeyLen) {
        return Result<std::string>::error(ErrorCategory::ENCRYPTION_UNAVAILABLE,
            "No active 256-bit receipt key");
    }

    uint8_t iv[kIvLen];
    if (RAND_bytes(iv, kIvLen) != 1) {
        return Result<std::string>::error(ErrorCategory::ENCRYPTION_UNAVAILABLE,
            "RAND_bytes failed");
    }

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::string>::error(ErrorCategory::ENCRYPTION_UNAVAILABLE,
            "EVP_CIPHER_CTX_new failed");
    }

    std::vector<uint8_t> ciphertext(plaintext.size() + EVP_MAX_BLOCK_LENGTH);
    uint8_t tag[kTagLen];
    int len = 0;
    int ciphertext_len = 0;

    const auto fail = [] {
        return Result<std::string>::error(ErrorCategory::ENCRYPTION_UNAVAILABLE,
            "AES-256-GCM encryption failed");
    };

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kIvLen, nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_info->key_bytes.data(), iv) != 1) {
        return fail();
    }
    if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
            reinterpret_cast<const uint8_t*>(plaintext.data()),
            static_cast<int>(plaintext.size())) != 1) {
        return fail();
    }
    ciphertext_len = len;
    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + ciphertext_len, &len) != 1) {
        return fail();
    }
    ciphertext_len += len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, kTagLen, tag) != 1) {
        return fail();
    }

    // Pack: iv + ciphertext + tag
    std::vector<uint8_t> packed;
    packed.reserve(kIvLen + ciphertext_len + kTagLen);
    packed.insert(packed.end(), iv, iv + kIvLen);
    packed.insert(packed.end(), ciphertext.begin(), ciphertext.begin() + ciphertext_len);
    packed.insert(packed.end(), tag, tag + kTagLen);

    std::string result(kPrefix);
    result += key_info->key_id;
    result += ':';
    result += base64::encode(packed.data(), packed.size());
    return Result<std::string>::ok(std::move(result));
}

Result<std::string> ReceiptCipher::decrypt(std::string_view ciphertext) const {
    if (ciphertext.size() < kPrefix.size() || ciphertext.substr(0, kPrefix.size()) != kPrefix) {
        return Result<std::string>::error(ErrorCategory::VALIDATION_ERROR,
            "Value is not in ENC:v1 format");
    }

    const auto rest = ciphertext.substr(kPrefix.size());
    const size_t colon = rest.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return Result<std::string>::error(ErrorCategory::VALIDATION_ERROR,
            "Missing key id in ciphertext");
    }

    const std::string key_id(rest.substr(0, colon));
    if (!key_manager_) {
        return Result<std::string>::error(ErrorCategory::ENCRYPTION_UNAVAILABLE,
            "No key manager configured");
    }
    const auto key_info = key_manager_->get_key(key_id);
    if (!key_info || key_info->key_bytes.size() != kKeyLen) {
        return Result<std::string>::error(ErrorCategory::ENCRYPTION_UNAVAILABLE,
            std::format("Receipt key '{}' not available", key_id));
    }

    const auto packed = base64::decode(rest.substr(colon + 1));
    if (!packed || packed->size() < static_cast<size_t>(kIvLen + kTagLen)) {
        return Result<std::string>::error(ErrorCategory::VALIDATION_ERROR,
            "Malformed ciphertext payload");
    }

    const uint8_t* iv = packed->data();
    const size_t ct_len = packed->size() - kIvLen - kTagLen;
    const uint8_t* ct = packed->data() + kIvLen;
    uint8_t tag[kTagLen];
    std::copy(packed->data() + kIvLen + ct_len, packed->data() + packed->size(), tag);

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::string>::error(ErrorCategory::ENCRYPTION_UNAVAILABLE,
            "EVP_CIPHER_CTX_new failed");
    }

    std::vector<uint8_t> plaintext(ct_len + EVP_MAX_BLOCK_LENGTH);
    int len = 0;
    int plaintext_len = 0;

    const auto fail = [] {
        return Result<std::string>::error(ErrorCategory::VALIDATION_ERROR,
            "Ciphertext failed authentication");
    };

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kIvLen, nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_info->key_bytes.data(), iv) != 1) {
        return fail();
    }
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ct, static_cast<int>(ct_len)) != 1) {
        return fail();
    }
    plaintext_len = len;

    // Tag check happens in DecryptFinal
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, kTagLen, tag) != 1 ||
        EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + plaintext_len, &len) <= 0) {
        return fail();
    }
    plaintext_len += len;

    return Result<std::string>::ok(std::string(
        reinterpret_cast<const char*>(plaintext.data()), static_cast<size_t>(plaintext_len)));
}

} // namespace redactguard
