#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace redactguard {

/**
 * @brief Source of the receipt encryption keys
 *
 * The active key encrypts new receipts; older keys stay available by id so
 * receipts written before a rotation remain decryptable.
 */
class IKeyManager {
public:
    virtual ~IKeyManager() = default;

    struct KeyInfo {
        std::string key_id;
        std::vector<uint8_t> key_bytes;     // 256-bit key
        std::chrono::system_clock::time_point created_at;
        bool active = true;

        KeyInfo() : created_at(std::chrono::system_clock::now()) {}
    };

    [[nodiscard]] virtual std::optional<KeyInfo> get_active_key() const = 0;
    [[nodiscard]] virtual std::optional<KeyInfo> get_key(const std::string& key_id) const = 0;
    virtual bool rotate_key() = 0;
    [[nodiscard]] virtual size_t key_count() const = 0;
};

} // namespace redactguard
