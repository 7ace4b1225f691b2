#include "security/env_key_manager.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>

namespace redactguard {

EnvKeyManager::EnvKeyManager(const std::string& env_var_name) {
    const char* hex_key = std::getenv(env_var_name.c_str());
    if (!hex_key || std::string_view(hex_key).empty()) {
        utils::log::warn(std::format("EnvKeyManager: environment variable '{}' not set", env_var_name));
        return;
    }

    auto bytes = utils::hex_to_bytes(hex_key);
    if (bytes.empty()) {
        utils::log::error(std::format("EnvKeyManager: '{}' is not valid hex", env_var_name));
        return;
    }
    if (bytes.size() != 32) {
        utils::log::error(std::format("EnvKeyManager: key is {} bytes (expected 32 for AES-256)",
            bytes.size()));
        return;
    }

    key_.key_id = "env-key-1";
    key_.key_bytes = std::move(bytes);
    key_.created_at = std::chrono::system_clock::now();
    key_.active = true;
    valid_ = true;

    utils::log::info(std::format("EnvKeyManager: loaded receipt key from '{}'", env_var_name));
}

std::optional<IKeyManager::KeyInfo> EnvKeyManager::get_active_key() const {
    if (!valid_) return std::nullopt;
    return key_;
}

std::optional<IKeyManager::KeyInfo> EnvKeyManager::get_key(const std::string& key_id) const {
    if (!valid_ || key_id != key_.key_id) return std::nullopt;
    return key_;
}

bool EnvKeyManager::rotate_key() {
    utils::log::warn("EnvKeyManager: key rotation not supported, restart with a new variable");
    return false;
}

size_t EnvKeyManager::key_count() const {
    return valid_ ? 1 : 0;
}

} // namespace redactguard
