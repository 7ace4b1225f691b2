#pragma once

#include "security/ikey_manager.hpp"

#include <shared_mutex>

namespace redactguard {

/**
 * @brief File-backed key ring
 *
 * Line format: key_id:hex_key:active ('#' starts a comment). Loading never
 * invents a key: an unreadable or empty file leaves the ring empty. Keys
 * are created only by generate_and_add_key() / rotate_key(), which persist
 * the ring back to the file with owner-only permissions.
 */
class LocalKeyManager : public IKeyManager {
public:
    explicit LocalKeyManager(std::string key_file = "");

    [[nodiscard]] std::optional<KeyInfo> get_active_key() const override;
    [[nodiscard]] std::optional<KeyInfo> get_key(const std::string& key_id) const override;
    bool rotate_key() override;
    [[nodiscard]] size_t key_count() const override;

    /// Generate a new 256-bit key (OpenSSL RAND_bytes) and make it active
    bool generate_and_add_key();

private:
    std::string key_file_;
    mutable std::shared_mutex mutex_;
    std::vector<KeyInfo> keys_;
    size_t active_index_ = 0;

    void load_keys();
    bool save_keys() const;
    bool add_generated_key_locked();
};

} // namespace redactguard
