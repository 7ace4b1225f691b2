#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>

namespace redactguard {

/**
 * @brief Process-scoped identifier salt
 *
 * Built once at startup from configuration and passed by reference to
 * whatever needs it. The salt is never logged or written out.
 */
class SecretConfig {
public:
    explicit SecretConfig(std::string salt) : salt_(std::move(salt)) {}

    SecretConfig(const SecretConfig&) = delete;
    SecretConfig& operator=(const SecretConfig&) = delete;

    [[nodiscard]] const std::string& salt() const { return salt_; }
    [[nodiscard]] bool empty() const { return salt_.empty(); }

private:
    const std::string salt_;
};

/**
 * @brief Deterministic placeholder tokens: "{tier}::{label}::{10 hex}"
 *
 * The hex part is the first 10 characters of SHA-256(salt ∥ raw value).
 * Same salt and value always give the same token; 40 bits is enough for
 * linkage but not for uniqueness at very large volumes.
 */
class IdentifierGenerator {
public:
    static constexpr size_t kDigestChars = 10;

    explicit IdentifierGenerator(const SecretConfig& secret) : secret_(secret) {}

    [[nodiscard]] std::string generate(Tier tier, const std::string& label,
                                       std::string_view raw_value) const;

    /// True if `token` has the identifier shape (used when parsing content)
    [[nodiscard]] static bool looks_like_identifier(std::string_view token);

private:
    const SecretConfig& secret_;
};

} // namespace redactguard
