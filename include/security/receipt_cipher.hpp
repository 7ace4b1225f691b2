#pragma once

#include "core/error.hpp"
#include "security/ikey_manager.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace redactguard {

/**
 * @brief AES-256-GCM encryption of original values for receipts
 *
 * Ciphertext format: ENC:v1:<key_id>:<base64(iv[12] + ciphertext + tag[16])>
 *
 * Unlike a transparent column cipher, nothing here passes through: a
 * missing key is ENCRYPTION_UNAVAILABLE, and a value that fails to parse
 * or authenticate is an error. A receipt must never hold plaintext.
 *
 * Thread-safe: each call uses its own cipher context.
 */
class ReceiptCipher {
public:
    explicit ReceiptCipher(std::shared_ptr<IKeyManager> key_manager);

    [[nodiscard]] Result<std::string> encrypt(std::string_view plaintext) const;
    [[nodiscard]] Result<std::string> decrypt(std::string_view ciphertext) const;

    /// An active, full-length key is present
    [[nodiscard]] bool available() const;

private:
    std::shared_ptr<IKeyManager> key_manager_;
};

} // namespace redactguard
