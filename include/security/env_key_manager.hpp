#pragma once

#include "security/ikey_manager.hpp"
#include <string>

namespace redactguard {

/**
 * @brief Environment variable key manager
 *
 * Reads a single receipt key from an environment variable, hex-encoded
 * (64 hex chars = 32 bytes). A missing, malformed or short key leaves the
 * manager empty so that encryption reports ENCRYPTION_UNAVAILABLE.
 * No rotation: restart with a new variable and keep the old key in a
 * key file if older receipts must stay readable.
 */
class EnvKeyManager : public IKeyManager {
public:
    explicit EnvKeyManager(const std::string& env_var_name = "REDACTGUARD_RECEIPT_KEY");

    [[nodiscard]] std::optional<KeyInfo> get_active_key() const override;
    [[nodiscard]] std::optional<KeyInfo> get_key(const std::string& key_id) const override;
    bool rotate_key() override;
    [[nodiscard]] size_t key_count() const override;

private:
    KeyInfo key_;
    bool valid_ = false;
};

} // namespace redactguard
