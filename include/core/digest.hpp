#pragma once

#include <string>
#include <string_view>

namespace redactguard::digest {

/// Genesis predecessor for hash chains: 64 '0' characters.
inline const std::string kGenesisHash(64, '0');

/**
 * @brief SHA-256 of the input as 64 lowercase hex characters (OpenSSL EVP)
 * @throws std::runtime_error if the digest context cannot be created
 */
[[nodiscard]] std::string sha256_hex(std::string_view input);

/**
 * @brief SHA-256 over the concatenation a ∥ b without building the joined string
 */
[[nodiscard]] std::string sha256_hex(std::string_view a, std::string_view b);

} // namespace redactguard::digest
