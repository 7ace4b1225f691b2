#include "security/local_key_manager.hpp"
#include "core/utils.hpp"

#include <openssl/rand.h>

#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>

namespace redactguard {

LocalKeyManager::LocalKeyManager(std::string key_file)
    : key_file_(std::move(key_file)) {
    if (!key_file_.empty()) {
        load_keys();
    }
}

std::optional<IKeyManager::KeyInfo> LocalKeyManager::get_active_key() const {
    std::shared_lock lock(mutex_);
    if (keys_.empty() || active_index_ >= keys_.size()) return std::nullopt;
    if (!keys_[active_index_].active) return std::nullopt;
    return keys_[active_index_];
}

std::optional<IKeyManager::KeyInfo> LocalKeyManager::get_key(const std::string& key_id) const {
    std::shared_lock lock(mutex_);
    for (const auto& key : keys_) {
        if (key.key_id == key_id) {
            return key;
        }
    }
    return std::nullopt;
}

bool LocalKeyManager::rotate_key() {
    std::unique_lock lock(mutex_);
    return add_generated_key_locked();
}

size_t LocalKeyManager::key_count() const {
    std::shared_lock lock(mutex_);
    return keys_.size();
}

bool LocalKeyManager::generate_and_add_key() {
    std::unique_lock lock(mutex_);
    return add_generated_key_locked();
}

bool LocalKeyManager::add_generated_key_locked() {
    KeyInfo key;
    key.key_bytes.resize(32);
    if (RAND_bytes(key.key_bytes.data(), static_cast<int>(key.key_bytes.size())) != 1) {
        utils::log::error("LocalKeyManager: RAND_bytes failed, no key generated");
        return false;
    }

    uint8_t id_bytes[6];
    if (RAND_bytes(id_bytes, sizeof(id_bytes)) != 1) {
        utils::log::error("LocalKeyManager: RAND_bytes failed, no key generated");
        return false;
    }
    key.key_id = "key-" + utils::bytes_to_hex(id_bytes, sizeof(id_bytes));
    key.created_at = std::chrono::system_clock::now();
    key.active = true;

    // Previous active key stays available for decryption
    if (!keys_.empty() && active_index_ < keys_.size()) {
        keys_[active_index_].active = false;
    }

    keys_.push_back(std::move(key));
    active_index_ = keys_.size() - 1;

    if (!key_file_.empty() && !save_keys()) {
        return false;
    }
    utils::log::info(std::format("LocalKeyManager: active key is now {}", keys_.back().key_id));
    return true;
}

void LocalKeyManager::load_keys() {
    std::ifstream file(key_file_);
    if (!file.is_open()) {
        utils::log::warn(std::format("LocalKeyManager: cannot open key file '{}'", key_file_));
        return;
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        line = utils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        const size_t first_colon = line.find(':');
        const size_t second_colon = first_colon == std::string::npos
            ? std::string::npos : line.find(':', first_colon + 1);
        if (second_colon == std::string::npos) {
            utils::log::warn(std::format("LocalKeyManager: malformed line {} skipped", line_no));
            continue;
        }

        KeyInfo key;
        key.key_id = line.substr(0, first_colon);
        key.key_bytes = utils::hex_to_bytes(
            std::string_view(line).substr(first_colon + 1, second_colon - first_colon - 1));
        if (key.key_id.empty() || key.key_bytes.size() != 32) {
            utils::log::warn(std::format("LocalKeyManager: invalid key on line {} skipped", line_no));
            continue;
        }

        const std::string active_str = line.substr(second_colon + 1);
        key.active = (active_str == "1" || active_str == "true");
        key.created_at = std::chrono::system_clock::now();

        if (key.active) {
            active_index_ = keys_.size();
        }
        keys_.push_back(std::move(key));
    }

    utils::log::info(std::format("LocalKeyManager: loaded {} key(s) from '{}'", keys_.size(), key_file_));
}

bool LocalKeyManager::save_keys() const {
    const std::string tmp = key_file_ + ".tmp";
    {
        const auto parent = std::filesystem::path(key_file_).parent_path();
        if (!parent.empty()) {
            std::error_code dir_ec;
            std::filesystem::create_directories(parent, dir_ec);
            if (dir_ec) {
                utils::log::warn(std::format("LocalKeyManager: cannot create '{}': {}",
                    parent.string(), dir_ec.message()));
            }
        }

        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            utils::log::error(std::format("LocalKeyManager: cannot write '{}'", tmp));
            return false;
        }

        file << "# Key format: key_id:hex_key:active\n";
        for (const auto& key : keys_) {
            file << key.key_id << ':'
                 << utils::bytes_to_hex(key.key_bytes.data(), key.key_bytes.size())
                 << ':' << (key.active ? "1" : "0") << '\n';
        }
        if (!file.good()) {
            utils::log::error(std::format("LocalKeyManager: write to '{}' failed", tmp));
            return false;
        }
    }

    namespace fs = std::filesystem;
    std::error_code ec;
    fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    if (ec) {
        utils::log::warn(std::format("LocalKeyManager: cannot restrict permissions on '{}': {}",
            tmp, ec.message()));
        ec.clear();
    }
    fs::rename(tmp, key_file_, ec);
    if (ec) {
        utils::log::error(std::format("LocalKeyManager: cannot replace '{}': {}", key_file_, ec.message()));
        return false;
    }
    return true;
}

} // namespace redactguard
